#include "todome/core/OverdueDetector.hpp"

namespace todome {
namespace core {

namespace {
const QString DiagnosticSource = QStringLiteral("todome");

bool isOpen(const ResolvedAttributes &attributes)
{
    return attributes.status != syntax::TaskStatus::Done && attributes.status != syntax::TaskStatus::Cancelled;
}

Diagnostic makeDiagnostic(int line, Severity severity, QString message)
{
    return { line, severity, std::move(message), DiagnosticSource };
}
} // namespace

QVector<OverdueDiagnostic> overdue(const syntax::Forest &forest, const Resolution &resolution, const QDate &reference)
{
    QVector<OverdueDiagnostic> diagnostics;
    if (!reference.isValid()) {
        return diagnostics;
    }
    for (syntax::NodeId id = 0; id < forest.nodeCount(); ++id) {
        const ResolvedAttributes *attributes = resolution.attributesOf(id);
        if (!attributes || !attributes->dueDate || !isOpen(*attributes)) {
            continue;
        }
        const QDate &due = *attributes->dueDate;
        if (due < reference) {
            diagnostics.append({ id, forest.node(id).line, due, due.daysTo(reference) });
        }
    }
    return diagnostics;
}

QVector<Diagnostic> dateDiagnostics(const syntax::Forest &forest,
                                    const Resolution &resolution,
                                    const QDate &reference,
                                    const DiagnosticOptions &options)
{
    QVector<Diagnostic> diagnostics;
    if (!reference.isValid()) {
        return diagnostics;
    }
    for (syntax::NodeId id = 0; id < forest.nodeCount(); ++id) {
        const ResolvedAttributes *attributes = resolution.attributesOf(id);
        if (!attributes || !attributes->dueDate || !isOpen(*attributes)) {
            continue;
        }
        const int line = forest.node(id).line;
        const qint64 daysLeft = reference.daysTo(*attributes->dueDate);
        if (daysLeft < 0) {
            diagnostics.append(makeDiagnostic(line, Severity::Error, QStringLiteral("this task is OVERDUE!")));
        } else if (daysLeft == 0) {
            if (options.reportDueToday) {
                diagnostics.append(makeDiagnostic(line, Severity::Warning, QStringLiteral("this task is due today.")));
            }
        } else if (options.reportDueSoon && daysLeft <= options.dueSoonDays) {
            const QString message = daysLeft == 1 ? QStringLiteral("this task is due tomorrow.")
                                                  : QStringLiteral("this task is due in %1 days.").arg(daysLeft);
            diagnostics.append(makeDiagnostic(line, Severity::Information, message));
        }
    }
    return diagnostics;
}

QString severityName(Severity severity)
{
    switch (severity) {
    case Severity::Error:
        return QStringLiteral("error");
    case Severity::Warning:
        return QStringLiteral("warning");
    case Severity::Information:
    default:
        return QStringLiteral("information");
    }
}

} // namespace core
} // namespace todome
