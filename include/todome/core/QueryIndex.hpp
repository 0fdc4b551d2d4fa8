#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include "todome/syntax/Forest.hpp"
#include "todome/syntax/Notation.hpp"

namespace todome {
namespace core {

enum class CandidateKind
{
    Category,
    Tag,
};

// Category and tag names seen in one document, counted per occurrence so
// that lines can be added and removed one at a time.
class QueryIndex
{
public:
    QueryIndex() = default;

    static QueryIndex fromForest(const syntax::Forest &forest);

    void addLine(const syntax::ClassifiedLine &line);
    void removeLine(const syntax::ClassifiedLine &line);

    // Names starting with prefix (case sensitive), sorted.
    QStringList candidates(CandidateKind kind, const QString &prefix = QString()) const;
    bool contains(CandidateKind kind, const QString &name) const;
    int occurrences(CandidateKind kind, const QString &name) const;

    bool operator==(const QueryIndex &other) const;
    bool operator!=(const QueryIndex &other) const;

private:
    void update(const syntax::ClassifiedLine &line, int delta);
    QHash<QString, int> &names(CandidateKind kind);
    const QHash<QString, int> &names(CandidateKind kind) const;

    QHash<QString, int> m_categories;
    QHash<QString, int> m_tags;
};

} // namespace core
} // namespace todome
