#pragma once

#include <QString>
#include <QStringList>

#include "todome/core/AttributeResolver.hpp"
#include "todome/core/QueryIndex.hpp"
#include "todome/syntax/Forest.hpp"

namespace todome {
namespace core {

// Everything known about one version of a document. Instances are treated
// as immutable once published by a DocumentSession.
struct DocumentState
{
    int version = 0;
    QStringList lines;
    syntax::Forest forest;
    Resolution resolution;
    QueryIndex index;

    QString text() const;
};

DocumentState parseDocument(const QString &text, int version = 0);

} // namespace core
} // namespace todome
