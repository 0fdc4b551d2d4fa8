#pragma once

#include <QDate>
#include <QString>
#include <QVector>

#include "todome/core/AttributeResolver.hpp"
#include "todome/core/Settings.hpp"
#include "todome/syntax/Forest.hpp"

namespace todome {
namespace core {

struct OverdueDiagnostic
{
    syntax::NodeId node = syntax::InvalidNode;
    int line = 0;
    QDate dueDate;
    qint64 daysOverdue = 0;
};

enum class Severity
{
    Error,
    Warning,
    Information,
};

struct Diagnostic
{
    int line = 0;
    Severity severity = Severity::Information;
    QString message;
    QString source;
};

// Open tasks (neither Done nor Cancelled) whose resolved due date lies
// strictly before reference. Headers never appear.
QVector<OverdueDiagnostic> overdue(const syntax::Forest &forest, const Resolution &resolution, const QDate &reference);

// Overdue tasks as errors, tasks due on the reference date as warnings and
// tasks due within options.dueSoonDays as information, in document order.
QVector<Diagnostic> dateDiagnostics(const syntax::Forest &forest,
                                    const Resolution &resolution,
                                    const QDate &reference,
                                    const DiagnosticOptions &options = {});

QString severityName(Severity severity);

} // namespace core
} // namespace todome
