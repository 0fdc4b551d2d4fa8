#pragma once

#include <QChar>
#include <QDate>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>
#include <variant>

namespace todome {
namespace syntax {

enum class TaskStatus
{
    ToDo,
    Doing,
    Done,
    Cancelled,
};

struct Priority
{
    QChar letter;
};

struct DueDate
{
    QDate date;
};

struct Category
{
    QString name;
};

using Attribute = std::variant<Priority, DueDate, Category>;

// A line that takes part in the hierarchy: header or task, decided once the
// forest knows whether the line has children.
struct ItemLine
{
    int depth = 0;
    std::optional<TaskStatus> status;
    QVector<Attribute> attributes;
    QString body;
    QStringList tags;
    std::optional<QString> comment;
};

struct CommentLine
{
    int depth = 0;
    QString comment;
};

struct BlankLine
{
};

using ClassifiedLine = std::variant<ItemLine, CommentLine, BlankLine>;

enum class LineKind
{
    Header,
    Task,
    CommentOnly,
    Blank,
};

// Visitor built from lambdas, for exhaustive std::visit over the variants above.
template<class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

QChar symbolForStatus(TaskStatus status);
std::optional<TaskStatus> statusForSymbol(QChar symbol);
QString statusName(TaskStatus status);

QString attributeToken(const Attribute &attribute);

bool operator==(const Priority &lhs, const Priority &rhs);
bool operator==(const DueDate &lhs, const DueDate &rhs);
bool operator==(const Category &lhs, const Category &rhs);

} // namespace syntax
} // namespace todome
