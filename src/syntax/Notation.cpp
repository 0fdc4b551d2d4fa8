#include "todome/syntax/Notation.hpp"

namespace todome {
namespace syntax {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
} // namespace

QChar symbolForStatus(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Doing:
        return QLatin1Char('*');
    case TaskStatus::Done:
        return QLatin1Char('-');
    case TaskStatus::Cancelled:
        return QLatin1Char('=');
    case TaskStatus::ToDo:
    default:
        return QLatin1Char('+');
    }
}

std::optional<TaskStatus> statusForSymbol(QChar symbol)
{
    switch (symbol.unicode()) {
    case '+':
        return TaskStatus::ToDo;
    case '*':
        return TaskStatus::Doing;
    case '-':
        return TaskStatus::Done;
    case '=':
        return TaskStatus::Cancelled;
    default:
        return std::nullopt;
    }
}

QString statusName(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Doing:
        return QStringLiteral("Doing");
    case TaskStatus::Done:
        return QStringLiteral("Done");
    case TaskStatus::Cancelled:
        return QStringLiteral("Cancelled");
    case TaskStatus::ToDo:
    default:
        return QStringLiteral("ToDo");
    }
}

QString attributeToken(const Attribute &attribute)
{
    return std::visit(Overloaded{
                          [](const Priority &priority) {
                              return QStringLiteral("(%1)").arg(priority.letter);
                          },
                          [](const DueDate &due) {
                              return QStringLiteral("(%1)").arg(due.date.toString(QLatin1String(DATE_FORMAT)));
                          },
                          [](const Category &category) {
                              return QStringLiteral("[%1]").arg(category.name);
                          },
                      },
                      attribute);
}

bool operator==(const Priority &lhs, const Priority &rhs)
{
    return lhs.letter == rhs.letter;
}

bool operator==(const DueDate &lhs, const DueDate &rhs)
{
    return lhs.date == rhs.date;
}

bool operator==(const Category &lhs, const Category &rhs)
{
    return lhs.name == rhs.name;
}

} // namespace syntax
} // namespace todome
