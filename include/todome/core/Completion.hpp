#pragma once

#include <QChar>
#include <QDate>
#include <QString>
#include <QVector>

#include "todome/core/Document.hpp"

namespace todome {
namespace core {

// Replaces [startColumn, endColumn) of line with label. Columns count UTF-16
// code units, the unit editors speak.
struct CompletionItem
{
    QString label;
    QString detail;
    int line = 0;
    int startColumn = 0;
    int endColumn = 0;
};

// trigger is the character the editor reported as having triggered the
// request, or a null QChar when completion was invoked manually.
QVector<CompletionItem> complete(const DocumentState &state,
                                 int line,
                                 int column,
                                 const QDate &today,
                                 QChar trigger = QChar());

} // namespace core
} // namespace todome
