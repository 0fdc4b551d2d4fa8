#include "todome/syntax/LineClassifier.hpp"

#include <QRegularExpression>

namespace todome {
namespace syntax {

namespace {
constexpr QChar TAB = QLatin1Char('\t');
constexpr QChar SPACE = QLatin1Char(' ');
constexpr QChar COMMENT_MARKER = QLatin1Char('#');
constexpr QChar ESCAPE = QLatin1Char('\\');

bool isDigitAt(const QString &text, int pos)
{
    const ushort c = text.at(pos).unicode();
    return c >= '0' && c <= '9';
}

int findCommentMarker(const QString &text, int from)
{
    for (int i = from; i < text.size(); ++i) {
        if (text.at(i) == COMMENT_MARKER && (i == 0 || text.at(i - 1) != ESCAPE)) {
            return i;
        }
    }
    return -1;
}

int skipWhitespace(const QString &text, int pos, int end)
{
    while (pos < end && text.at(pos).isSpace()) {
        ++pos;
    }
    return pos;
}

QString chopTrailingWhitespace(QString text)
{
    int end = text.size();
    while (end > 0 && text.at(end - 1).isSpace()) {
        --end;
    }
    text.truncate(end);
    return text;
}

std::optional<QDate> parseIsoDate(const QString &text, int pos)
{
    // YYYY-MM-DD, digits only, must name a real calendar day.
    for (int i = 0; i < 10; ++i) {
        if (i == 4 || i == 7) {
            if (text.at(pos + i) != QLatin1Char('-')) {
                return std::nullopt;
            }
        } else if (!isDigitAt(text, pos + i)) {
            return std::nullopt;
        }
    }
    const QDate date(text.mid(pos, 4).toInt(), text.mid(pos + 5, 2).toInt(), text.mid(pos + 8, 2).toInt());
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

// Matches one attribute token at pos; on success *tokenEnd is one past the
// closing bracket.
std::optional<Attribute> matchAttribute(const QString &text, int pos, int end, int *tokenEnd)
{
    const QChar open = text.at(pos);
    if (open == QLatin1Char('(')) {
        if (pos + 2 < end && text.at(pos + 2) == QLatin1Char(')')) {
            const ushort letter = text.at(pos + 1).unicode();
            if (letter >= 'A' && letter <= 'Z') {
                *tokenEnd = pos + 3;
                return Attribute{ Priority{ text.at(pos + 1) } };
            }
            return std::nullopt;
        }
        if (pos + 11 < end && text.at(pos + 11) == QLatin1Char(')')) {
            if (const auto date = parseIsoDate(text, pos + 1)) {
                *tokenEnd = pos + 12;
                return Attribute{ DueDate{ *date } };
            }
        }
        return std::nullopt;
    }
    if (open == QLatin1Char('[')) {
        for (int i = pos + 1; i < end; ++i) {
            const QChar c = text.at(i);
            if (c == QLatin1Char('[') || c == COMMENT_MARKER) {
                return std::nullopt;
            }
            if (c == QLatin1Char(']')) {
                if (i == pos + 1) {
                    return std::nullopt;
                }
                *tokenEnd = i + 1;
                return Attribute{ Category{ text.mid(pos + 1, i - pos - 1) } };
            }
        }
    }
    return std::nullopt;
}

bool endsToken(const QString &text, int pos, int end)
{
    if (pos >= end) {
        return true;
    }
    const QChar c = text.at(pos);
    return c.isSpace() || c == QLatin1Char('(') || c == QLatin1Char('[');
}
} // namespace

QStringList splitLines(const QString &text)
{
    if (text.isEmpty()) {
        return {};
    }
    QStringList lines = text.split(QLatin1Char('\n'));
    if (text.endsWith(QLatin1Char('\n'))) {
        lines.removeLast();
    }
    for (QString &line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
    }
    return lines;
}

ClassifiedLine classifyLine(const QString &text)
{
    int pos = 0;
    int depth = 0;
    while (pos < text.size() && (text.at(pos) == TAB || text.at(pos) == SPACE)) {
        if (text.at(pos) == TAB) {
            ++depth;
        }
        ++pos;
    }

    std::optional<QString> comment;
    int end = text.size();
    const int marker = findCommentMarker(text, pos);
    if (marker >= 0) {
        comment = chopTrailingWhitespace(text.mid(marker + 1));
        end = marker;
    }
    while (end > pos && text.at(end - 1).isSpace()) {
        --end;
    }

    if (pos == end) {
        if (comment) {
            return CommentLine{ depth, *comment };
        }
        return BlankLine{};
    }

    ItemLine item;
    item.depth = depth;
    item.comment = comment;

    const auto status = statusForSymbol(text.at(pos));
    if (status && (pos + 1 >= end || text.at(pos + 1).isSpace())) {
        item.status = status;
        pos = skipWhitespace(text, pos + 1, end);
    }

    while (pos < end) {
        int tokenEnd = pos;
        const auto attribute = matchAttribute(text, pos, end, &tokenEnd);
        if (!attribute || !endsToken(text, tokenEnd, end)) {
            break;
        }
        item.attributes.append(*attribute);
        pos = skipWhitespace(text, tokenEnd, end);
    }

    item.body = text.mid(pos, end - pos);
    item.tags = extractTags(item.body);
    return item;
}

QVector<ClassifiedLine> classifyLines(const QStringList &lines)
{
    QVector<ClassifiedLine> classified;
    classified.reserve(lines.size());
    for (const QString &line : lines) {
        classified.append(classifyLine(line));
    }
    return classified;
}

QStringList extractTags(const QString &body)
{
    static const QRegularExpression tagRegex(QStringLiteral("(?:^|(?<=\\s))@([A-Za-z0-9][A-Za-z0-9_-]*)"));
    QStringList tags;
    auto it = tagRegex.globalMatch(body);
    while (it.hasNext()) {
        const QString tag = it.next().captured(1);
        if (!tags.contains(tag)) {
            tags << tag;
        }
    }
    return tags;
}

} // namespace syntax
} // namespace todome
