#include "todome/core/QueryIndex.hpp"

#include <algorithm>

namespace todome {
namespace core {

namespace {
void adjust(QHash<QString, int> &counts, const QString &name, int delta)
{
    auto it = counts.find(name);
    if (it == counts.end()) {
        if (delta > 0) {
            counts.insert(name, delta);
        }
        return;
    }
    it.value() += delta;
    if (it.value() <= 0) {
        counts.erase(it);
    }
}
} // namespace

QueryIndex QueryIndex::fromForest(const syntax::Forest &forest)
{
    QueryIndex index;
    for (const auto &line : forest.lines()) {
        index.addLine(line);
    }
    return index;
}

void QueryIndex::addLine(const syntax::ClassifiedLine &line)
{
    update(line, 1);
}

void QueryIndex::removeLine(const syntax::ClassifiedLine &line)
{
    update(line, -1);
}

QStringList QueryIndex::candidates(CandidateKind kind, const QString &prefix) const
{
    QStringList result;
    const auto &counts = names(kind);
    for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
        if (it.key().startsWith(prefix)) {
            result << it.key();
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool QueryIndex::contains(CandidateKind kind, const QString &name) const
{
    return names(kind).contains(name);
}

int QueryIndex::occurrences(CandidateKind kind, const QString &name) const
{
    return names(kind).value(name, 0);
}

bool QueryIndex::operator==(const QueryIndex &other) const
{
    return m_categories == other.m_categories && m_tags == other.m_tags;
}

bool QueryIndex::operator!=(const QueryIndex &other) const
{
    return !(*this == other);
}

void QueryIndex::update(const syntax::ClassifiedLine &line, int delta)
{
    const auto *item = std::get_if<syntax::ItemLine>(&line);
    if (!item) {
        return;
    }
    for (const auto &attribute : item->attributes) {
        if (const auto *category = std::get_if<syntax::Category>(&attribute)) {
            adjust(m_categories, category->name, delta);
        }
    }
    for (const QString &tag : item->tags) {
        adjust(m_tags, tag, delta);
    }
}

QHash<QString, int> &QueryIndex::names(CandidateKind kind)
{
    return kind == CandidateKind::Category ? m_categories : m_tags;
}

const QHash<QString, int> &QueryIndex::names(CandidateKind kind) const
{
    return kind == CandidateKind::Category ? m_categories : m_tags;
}

} // namespace core
} // namespace todome
