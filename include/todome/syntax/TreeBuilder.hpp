#pragma once

#include <QString>
#include <QVector>

#include "todome/syntax/Forest.hpp"
#include "todome/syntax/Notation.hpp"

namespace todome {
namespace syntax {

// Builds the nodes for lines [firstLine, endLine), numbering them from
// firstNode. Over-indented lines attach one level below their nearest open
// ancestor; a body-less line with children becomes a header.
NodeBlock buildNodes(const QVector<ClassifiedLine> &lines, int firstLine, int endLine, NodeId firstNode);

Forest buildForest(QVector<ClassifiedLine> lines);
Forest parseForest(const QString &text);

} // namespace syntax
} // namespace todome
