#include "todome/syntax/TreeBuilder.hpp"

#include <algorithm>

#include "todome/syntax/LineClassifier.hpp"

namespace todome {
namespace syntax {

namespace {
struct OpenAncestor
{
    NodeId id = InvalidNode;
    int depth = 0;
};
} // namespace

NodeBlock buildNodes(const QVector<ClassifiedLine> &lines, int firstLine, int endLine, NodeId firstNode)
{
    NodeBlock block;
    QVector<OpenAncestor> stack;

    for (int line = firstLine; line < endLine; ++line) {
        const auto *item = std::get_if<ItemLine>(&lines.at(line));
        if (!item) {
            continue;
        }
        while (!stack.isEmpty() && stack.last().depth >= item->depth) {
            stack.removeLast();
        }

        const NodeId id = firstNode + block.nodes.size();
        Node node;
        node.line = line;
        if (stack.isEmpty()) {
            node.depth = 0;
            block.roots.append(id);
        } else {
            const OpenAncestor &top = stack.last();
            node.depth = std::min(item->depth, top.depth + 1);
            node.parent = top.id;
            block.nodes[top.id - firstNode].children.append(id);
        }
        block.nodes.append(node);
        stack.append({ id, node.depth });
    }

    // Children always follow their parent, so a reverse sweep sees every
    // subtree completed before its root.
    for (int i = block.nodes.size() - 1; i >= 0; --i) {
        Node &node = block.nodes[i];
        const NodeId id = firstNode + i;
        node.subtreeEnd = node.children.isEmpty() ? id + 1 : block.nodes.at(node.children.last() - firstNode).subtreeEnd;
        const auto &item = std::get<ItemLine>(lines.at(node.line));
        node.kind = (item.body.isEmpty() && !node.children.isEmpty()) ? NodeKind::Header : NodeKind::Task;
    }
    return block;
}

Forest buildForest(QVector<ClassifiedLine> lines)
{
    NodeBlock block = buildNodes(lines, 0, lines.size(), 0);
    return Forest(std::move(lines), std::move(block));
}

Forest parseForest(const QString &text)
{
    return buildForest(classifyLines(splitLines(text)));
}

} // namespace syntax
} // namespace todome
