#pragma once

#include <QVector>

#include "todome/syntax/Notation.hpp"

namespace todome {
namespace syntax {

using NodeId = int;
constexpr NodeId InvalidNode = -1;

enum class NodeKind
{
    Task,
    Header,
};

// Nodes live in the forest arena in document order, so the descendants of a
// node are exactly the ids in [id + 1, subtreeEnd).
struct Node
{
    int line = 0;
    int depth = 0;
    NodeId parent = InvalidNode;
    QVector<NodeId> children;
    NodeId subtreeEnd = 0;
    NodeKind kind = NodeKind::Task;
};

struct NodeBlock
{
    QVector<Node> nodes;
    QVector<NodeId> roots;
};

// Describes the top-level block that replaceLines() rebuilt. Line and node
// ranges are half open; "old" ends refer to the forest before the edit.
struct BlockSplice
{
    int firstLine = 0;
    int oldEndLine = 0;
    int newEndLine = 0;
    NodeId firstNode = 0;
    NodeId oldEndNode = 0;
    NodeId newEndNode = 0;
};

class Forest
{
public:
    Forest() = default;
    Forest(QVector<ClassifiedLine> lines, NodeBlock block);

    const QVector<ClassifiedLine> &lines() const;
    int lineCount() const;
    LineKind lineKind(int line) const;

    const QVector<Node> &nodes() const;
    const QVector<NodeId> &roots() const;
    int nodeCount() const;
    bool isEmpty() const;

    const Node &node(NodeId id) const;
    const ItemLine &item(NodeId id) const;
    NodeId nodeAtLine(int line) const;

    // Replaces removedCount lines starting at firstLine and rebuilds only the
    // top-level block around them. Arguments are expected to be in range.
    BlockSplice replaceLines(int firstLine, int removedCount, QVector<ClassifiedLine> inserted);

private:
    void indexLines();

    QVector<ClassifiedLine> m_lines;
    QVector<NodeId> m_lineToNode;
    QVector<Node> m_nodes;
    QVector<NodeId> m_roots;
};

} // namespace syntax
} // namespace todome
