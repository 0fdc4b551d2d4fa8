#include "todome/syntax/Forest.hpp"

#include <algorithm>

#include "todome/syntax/TreeBuilder.hpp"

namespace todome {
namespace syntax {

Forest::Forest(QVector<ClassifiedLine> lines, NodeBlock block)
    : m_lines(std::move(lines))
    , m_nodes(std::move(block.nodes))
    , m_roots(std::move(block.roots))
{
    indexLines();
}

const QVector<ClassifiedLine> &Forest::lines() const
{
    return m_lines;
}

int Forest::lineCount() const
{
    return m_lines.size();
}

LineKind Forest::lineKind(int line) const
{
    return std::visit(Overloaded{
                          [&](const ItemLine &) {
                              return m_nodes.at(m_lineToNode.at(line)).kind == NodeKind::Header ? LineKind::Header
                                                                                                 : LineKind::Task;
                          },
                          [](const CommentLine &) { return LineKind::CommentOnly; },
                          [](const BlankLine &) { return LineKind::Blank; },
                      },
                      m_lines.at(line));
}

const QVector<Node> &Forest::nodes() const
{
    return m_nodes;
}

const QVector<NodeId> &Forest::roots() const
{
    return m_roots;
}

int Forest::nodeCount() const
{
    return m_nodes.size();
}

bool Forest::isEmpty() const
{
    return m_nodes.isEmpty();
}

const Node &Forest::node(NodeId id) const
{
    return m_nodes.at(id);
}

const ItemLine &Forest::item(NodeId id) const
{
    return std::get<ItemLine>(m_lines.at(m_nodes.at(id).line));
}

NodeId Forest::nodeAtLine(int line) const
{
    if (line < 0 || line >= m_lineToNode.size()) {
        return InvalidNode;
    }
    return m_lineToNode.at(line);
}

BlockSplice Forest::replaceLines(int firstLine, int removedCount, QVector<ClassifiedLine> inserted)
{
    const int editEnd = firstLine + removedCount;
    const auto startsBefore = [this](NodeId root, int line) {
        return m_nodes.at(root).line < line;
    };

    // A depth-0 line always opens a fresh root, so the block runs from the
    // last root before the edit up to the first root that survives it.
    BlockSplice splice;
    const auto firstAffected = std::lower_bound(m_roots.cbegin(), m_roots.cend(), firstLine, startsBefore);
    if (firstAffected != m_roots.cbegin()) {
        splice.firstNode = *(firstAffected - 1);
        splice.firstLine = m_nodes.at(splice.firstNode).line;
    }
    auto firstKept = std::lower_bound(firstAffected, m_roots.cend(), editEnd, startsBefore);
    // Only the first item of a document can be a root while indented; once
    // lines precede it, it may become a child, so it cannot end the block.
    while (firstKept != m_roots.cend() && item(*firstKept).depth > 0) {
        ++firstKept;
    }
    if (firstKept != m_roots.cend()) {
        splice.oldEndNode = *firstKept;
        splice.oldEndLine = m_nodes.at(splice.oldEndNode).line;
    } else {
        splice.oldEndNode = m_nodes.size();
        splice.oldEndLine = m_lines.size();
    }
    const int lineDelta = inserted.size() - removedCount;
    splice.newEndLine = splice.oldEndLine + lineDelta;

    QVector<ClassifiedLine> lines;
    lines.reserve(m_lines.size() + lineDelta);
    for (int i = 0; i < firstLine; ++i) {
        lines.append(m_lines.at(i));
    }
    lines.append(inserted);
    for (int i = editEnd; i < m_lines.size(); ++i) {
        lines.append(m_lines.at(i));
    }
    m_lines = std::move(lines);

    NodeBlock block = buildNodes(m_lines, splice.firstLine, splice.newEndLine, splice.firstNode);
    splice.newEndNode = splice.firstNode + block.nodes.size();
    const int nodeDelta = splice.newEndNode - splice.oldEndNode;

    QVector<Node> nodes;
    nodes.reserve(m_nodes.size() + nodeDelta);
    for (NodeId id = 0; id < splice.firstNode; ++id) {
        nodes.append(m_nodes.at(id));
    }
    nodes.append(block.nodes);
    for (NodeId id = splice.oldEndNode; id < m_nodes.size(); ++id) {
        Node node = m_nodes.at(id);
        node.line += lineDelta;
        if (node.parent != InvalidNode) {
            node.parent += nodeDelta;
        }
        for (NodeId &child : node.children) {
            child += nodeDelta;
        }
        node.subtreeEnd += nodeDelta;
        nodes.append(node);
    }

    QVector<NodeId> roots;
    roots.reserve(m_roots.size() + block.roots.size());
    for (auto it = m_roots.cbegin(); it != firstAffected && *it < splice.firstNode; ++it) {
        roots.append(*it);
    }
    roots.append(block.roots);
    for (auto it = firstKept; it != m_roots.cend(); ++it) {
        roots.append(*it + nodeDelta);
    }

    m_nodes = std::move(nodes);
    m_roots = std::move(roots);
    indexLines();
    return splice;
}

void Forest::indexLines()
{
    m_lineToNode.fill(InvalidNode, m_lines.size());
    for (NodeId id = 0; id < m_nodes.size(); ++id) {
        m_lineToNode[m_nodes.at(id).line] = id;
    }
}

} // namespace syntax
} // namespace todome
