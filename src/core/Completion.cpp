#include "todome/core/Completion.hpp"

#include <QPair>
#include <QtGlobal>

namespace todome {
namespace core {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

enum class CompletionContext
{
    None,
    Category,
    DueDate,
    Tag,
};

struct Anchor
{
    CompletionContext context = CompletionContext::None;
    int column = -1;
};

bool isTagChar(QChar c)
{
    const ushort u = c.unicode();
    return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || (u >= '0' && u <= '9') || u == '_' || u == '-';
}

bool insideComment(const QString &before)
{
    for (int i = 0; i < before.size(); ++i) {
        if (before.at(i) == QLatin1Char('#') && (i == 0 || before.at(i - 1) != QLatin1Char('\\'))) {
            return true;
        }
    }
    return false;
}

int unclosedOpener(const QString &before, QChar open, QChar close)
{
    const int pos = before.lastIndexOf(open);
    if (pos < 0 || before.indexOf(close, pos) >= 0) {
        return -1;
    }
    return pos;
}

int tagStart(const QString &before)
{
    const int pos = before.lastIndexOf(QLatin1Char('@'));
    if (pos < 0 || (pos > 0 && !before.at(pos - 1).isSpace())) {
        return -1;
    }
    for (int i = pos + 1; i < before.size(); ++i) {
        if (!isTagChar(before.at(i))) {
            return -1;
        }
    }
    return pos;
}

Anchor findAnchor(const QString &before, QChar trigger)
{
    switch (trigger.unicode()) {
    case '[':
        return { CompletionContext::Category, before.lastIndexOf(QLatin1Char('[')) };
    case '(':
        return { CompletionContext::DueDate, before.lastIndexOf(QLatin1Char('(')) };
    case '@':
        return { CompletionContext::Tag, before.lastIndexOf(QLatin1Char('@')) };
    default:
        break;
    }

    // Without a trigger the innermost construct left of the cursor wins.
    Anchor anchor;
    const int category = unclosedOpener(before, QLatin1Char('['), QLatin1Char(']'));
    if (category > anchor.column) {
        anchor = { CompletionContext::Category, category };
    }
    const int due = unclosedOpener(before, QLatin1Char('('), QLatin1Char(')'));
    if (due > anchor.column) {
        anchor = { CompletionContext::DueDate, due };
    }
    const int tag = tagStart(before);
    if (tag > anchor.column) {
        anchor = { CompletionContext::Tag, tag };
    }
    return anchor;
}

int swallowCloser(const QString &lineText, int column, QChar close)
{
    return (column < lineText.size() && lineText.at(column) == close) ? column + 1 : column;
}
} // namespace

QVector<CompletionItem> complete(const DocumentState &state, int line, int column, const QDate &today, QChar trigger)
{
    QVector<CompletionItem> items;
    if (line < 0 || line >= state.lines.size()) {
        return items;
    }
    const QString &lineText = state.lines.at(line);
    column = qBound(0, column, lineText.size());
    const QString before = lineText.left(column);
    if (insideComment(before)) {
        return items;
    }

    const Anchor anchor = findAnchor(before, trigger);
    if (anchor.column < 0) {
        return items;
    }
    const QString prefix = before.mid(anchor.column + 1);

    switch (anchor.context) {
    case CompletionContext::Category: {
        const int end = swallowCloser(lineText, column, QLatin1Char(']'));
        for (const QString &name : state.index.candidates(CandidateKind::Category, prefix)) {
            items.append({ QStringLiteral("[%1]").arg(name), QString(), line, anchor.column, end });
        }
        break;
    }
    case CompletionContext::Tag:
        for (const QString &name : state.index.candidates(CandidateKind::Tag, prefix)) {
            items.append({ QStringLiteral("@%1").arg(name), QString(), line, anchor.column, column });
        }
        break;
    case CompletionContext::DueDate: {
        if (!today.isValid()) {
            break;
        }
        const int end = swallowCloser(lineText, column, QLatin1Char(')'));
        const QVector<QPair<QDate, QString>> shortcuts = {
            { today, QStringLiteral("today") },
            { today.addDays(1), QStringLiteral("tomorrow") },
            { today.addDays(2), QStringLiteral("2 days later") },
            { today.addDays(7), QStringLiteral("1 week later") },
        };
        for (const auto &shortcut : shortcuts) {
            const QString date = shortcut.first.toString(QLatin1String(DATE_FORMAT));
            if (date.startsWith(prefix)) {
                items.append({ QStringLiteral("(%1)").arg(date), shortcut.second, line, anchor.column, end });
            }
        }
        break;
    }
    case CompletionContext::None:
        break;
    }
    return items;
}

} // namespace core
} // namespace todome
