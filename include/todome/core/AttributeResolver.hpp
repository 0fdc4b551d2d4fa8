#pragma once

#include <QChar>
#include <QDate>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

#include "todome/syntax/Forest.hpp"
#include "todome/syntax/Notation.hpp"

namespace todome {
namespace core {

struct ResolvedAttributes
{
    syntax::TaskStatus status = syntax::TaskStatus::ToDo;
    std::optional<QChar> priority;
    std::optional<QDate> dueDate;
    QStringList categories;
    QStringList tags;
};

bool operator==(const ResolvedAttributes &lhs, const ResolvedAttributes &rhs);
bool operator!=(const ResolvedAttributes &lhs, const ResolvedAttributes &rhs);

// What a single line says about itself. Unset slots inherit.
struct AttributeOverrides
{
    std::optional<syntax::TaskStatus> status;
    std::optional<QChar> priority;
    std::optional<QDate> dueDate;
    QStringList categories;
};

AttributeOverrides overridesOf(const syntax::ItemLine &item);

// Status, priority and due date are replaced when overridden, categories
// accumulate. Tags are never inherited.
ResolvedAttributes merge(const ResolvedAttributes &inherited, const AttributeOverrides &overrides);

struct ResolvedTask
{
    syntax::NodeId node = syntax::InvalidNode;
    int line = 0;
    QString body;
    ResolvedAttributes attributes;
};

class Resolution
{
public:
    Resolution() = default;

    int size() const;

    // Effective attributes of a task node; nullptr for headers.
    const ResolvedAttributes *attributesOf(syntax::NodeId id) const;

    // Context a node hands down to its children. Defined for headers too.
    const ResolvedAttributes &scopeOf(syntax::NodeId id) const;

    // Re-resolves the rebuilt block after Forest::replaceLines() and reuses
    // every entry outside it.
    void applySplice(const syntax::Forest &forest, const syntax::BlockSplice &splice);

private:
    friend Resolution resolve(const syntax::Forest &forest);

    void resolveNodes(const syntax::Forest &forest, syntax::NodeId first, syntax::NodeId end);

    QVector<ResolvedAttributes> m_scopes;
    QVector<bool> m_isTask;
};

Resolution resolve(const syntax::Forest &forest);

// Tasks in document order, headers left out.
QVector<ResolvedTask> resolvedTasks(const syntax::Forest &forest, const Resolution &resolution);

} // namespace core
} // namespace todome
