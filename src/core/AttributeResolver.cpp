#include "todome/core/AttributeResolver.hpp"

namespace todome {
namespace core {

using syntax::Forest;
using syntax::NodeId;

bool operator==(const ResolvedAttributes &lhs, const ResolvedAttributes &rhs)
{
    return lhs.status == rhs.status && lhs.priority == rhs.priority && lhs.dueDate == rhs.dueDate
        && lhs.categories == rhs.categories && lhs.tags == rhs.tags;
}

bool operator!=(const ResolvedAttributes &lhs, const ResolvedAttributes &rhs)
{
    return !(lhs == rhs);
}

AttributeOverrides overridesOf(const syntax::ItemLine &item)
{
    AttributeOverrides overrides;
    overrides.status = item.status;
    for (const auto &attribute : item.attributes) {
        std::visit(syntax::Overloaded{
                       [&](const syntax::Priority &priority) { overrides.priority = priority.letter; },
                       [&](const syntax::DueDate &due) { overrides.dueDate = due.date; },
                       [&](const syntax::Category &category) {
                           if (!overrides.categories.contains(category.name)) {
                               overrides.categories << category.name;
                           }
                       },
                   },
                   attribute);
    }
    return overrides;
}

ResolvedAttributes merge(const ResolvedAttributes &inherited, const AttributeOverrides &overrides)
{
    ResolvedAttributes resolved;
    resolved.status = overrides.status.value_or(inherited.status);
    resolved.priority = overrides.priority ? overrides.priority : inherited.priority;
    resolved.dueDate = overrides.dueDate ? overrides.dueDate : inherited.dueDate;
    resolved.categories = inherited.categories;
    for (const QString &category : overrides.categories) {
        if (!resolved.categories.contains(category)) {
            resolved.categories << category;
        }
    }
    return resolved;
}

int Resolution::size() const
{
    return m_scopes.size();
}

const ResolvedAttributes *Resolution::attributesOf(NodeId id) const
{
    if (id < 0 || id >= m_scopes.size() || !m_isTask.at(id)) {
        return nullptr;
    }
    return &m_scopes.at(id);
}

const ResolvedAttributes &Resolution::scopeOf(NodeId id) const
{
    return m_scopes.at(id);
}

void Resolution::applySplice(const Forest &forest, const syntax::BlockSplice &splice)
{
    QVector<ResolvedAttributes> scopes;
    QVector<bool> isTask;
    scopes.reserve(forest.nodeCount());
    isTask.reserve(forest.nodeCount());
    for (NodeId id = 0; id < splice.firstNode; ++id) {
        scopes.append(m_scopes.at(id));
        isTask.append(m_isTask.at(id));
    }
    for (NodeId id = splice.firstNode; id < splice.newEndNode; ++id) {
        scopes.append(ResolvedAttributes{});
        isTask.append(false);
    }
    for (NodeId id = splice.oldEndNode; id < m_scopes.size(); ++id) {
        scopes.append(m_scopes.at(id));
        isTask.append(m_isTask.at(id));
    }
    m_scopes = std::move(scopes);
    m_isTask = std::move(isTask);
    resolveNodes(forest, splice.firstNode, splice.newEndNode);
}

void Resolution::resolveNodes(const Forest &forest, NodeId first, NodeId end)
{
    static const ResolvedAttributes rootScope;
    // Parents precede children in the arena, so one forward pass is a
    // pre-order walk and every parent scope is final when read.
    for (NodeId id = first; id < end; ++id) {
        const syntax::Node &node = forest.node(id);
        const ResolvedAttributes &inherited = node.parent == syntax::InvalidNode ? rootScope : m_scopes.at(node.parent);
        const syntax::ItemLine &item = forest.item(id);
        ResolvedAttributes scope = merge(inherited, overridesOf(item));
        scope.tags = item.tags;
        m_scopes[id] = std::move(scope);
        m_isTask[id] = node.kind == syntax::NodeKind::Task;
    }
}

Resolution resolve(const Forest &forest)
{
    Resolution resolution;
    resolution.m_scopes.resize(forest.nodeCount());
    resolution.m_isTask.fill(false, forest.nodeCount());
    resolution.resolveNodes(forest, 0, forest.nodeCount());
    return resolution;
}

QVector<ResolvedTask> resolvedTasks(const Forest &forest, const Resolution &resolution)
{
    QVector<ResolvedTask> tasks;
    for (NodeId id = 0; id < forest.nodeCount(); ++id) {
        const ResolvedAttributes *attributes = resolution.attributesOf(id);
        if (!attributes) {
            continue;
        }
        tasks.append({ id, forest.node(id).line, forest.item(id).body, *attributes });
    }
    return tasks;
}

} // namespace core
} // namespace todome
