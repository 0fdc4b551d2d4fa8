#include "todome/core/Formatter.hpp"

#include <QStringList>
#include <algorithm>

#include "todome/core/AttributeResolver.hpp"
#include "todome/syntax/TreeBuilder.hpp"

namespace todome {
namespace core {

using namespace syntax;

namespace {
constexpr QChar TAB = QLatin1Char('\t');

QString composeLine(int depth,
                    std::optional<TaskStatus> status,
                    QVector<Attribute> attributes,
                    const QString &body,
                    const std::optional<QString> &comment)
{
    // Variant order is the canonical token order.
    std::stable_sort(attributes.begin(), attributes.end(), [](const Attribute &lhs, const Attribute &rhs) {
        return lhs.index() < rhs.index();
    });

    QStringList parts;
    if (status) {
        parts << QString(symbolForStatus(*status));
    }
    for (const Attribute &attribute : attributes) {
        parts << attributeToken(attribute);
    }
    if (!body.isEmpty()) {
        parts << body;
    }

    QString line(depth, TAB);
    line += parts.join(QLatin1Char(' '));
    if (comment) {
        if (!parts.isEmpty()) {
            line += QLatin1Char(' ');
        }
        line += QLatin1Char('#');
        line += *comment;
    }
    return line;
}

QVector<Attribute> toAttributes(const std::optional<QChar> &priority,
                                const std::optional<QDate> &dueDate,
                                const QStringList &categories)
{
    QVector<Attribute> attributes;
    if (priority) {
        attributes.append(Priority{ *priority });
    }
    if (dueDate) {
        attributes.append(DueDate{ *dueDate });
    }
    for (const QString &category : categories) {
        attributes.append(Category{ category });
    }
    return attributes;
}

// Repeated tokens collapse to the value that wins for the line itself.
// Values the line also inherits stay, so editing a parent never silently
// changes what a child says.
QString normalizedLine(const ItemLine &item, int depth)
{
    const AttributeOverrides own = overridesOf(item);
    return composeLine(depth, own.status, toAttributes(own.priority, own.dueDate, own.categories), item.body,
                       item.comment);
}
} // namespace

QString formatItemLine(const ItemLine &item, int depth)
{
    return composeLine(depth, item.status, item.attributes, item.body, item.comment);
}

QString format(const Forest &forest, FormatMode mode)
{
    QString text;
    for (int line = 0; line < forest.lineCount(); ++line) {
        std::visit(Overloaded{
                       [&](const ItemLine &item) {
                           const int depth = forest.node(forest.nodeAtLine(line)).depth;
                           if (mode == FormatMode::Normalized) {
                               text += normalizedLine(item, depth);
                           } else {
                               text += formatItemLine(item, depth);
                           }
                       },
                       [&](const CommentLine &comment) {
                           text += QString(comment.depth, TAB);
                           text += QLatin1Char('#');
                           text += comment.comment;
                       },
                       [](const BlankLine &) {},
                   },
                   forest.lines().at(line));
        text += QLatin1Char('\n');
    }
    return text;
}

QString formatText(const QString &text, FormatMode mode)
{
    return format(parseForest(text), mode);
}

} // namespace core
} // namespace todome
