#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "todome/syntax/Notation.hpp"

namespace todome {
namespace syntax {

// Splits a document into lines. A trailing newline does not open an extra
// line, "\r\n" endings are accepted and empty text has no lines at all.
QStringList splitLines(const QString &text);

// Classifies one line of text. Never fails: malformed attribute tokens are
// kept as body text.
ClassifiedLine classifyLine(const QString &text);
QVector<ClassifiedLine> classifyLines(const QStringList &lines);

// Tag names (without '@') in order of first appearance.
QStringList extractTags(const QString &body);

} // namespace syntax
} // namespace todome
