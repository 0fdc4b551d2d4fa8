#include "todome/core/DocumentSession.hpp"

#include <QMutexLocker>

#include "todome/core/Logging.hpp"

namespace todome {
namespace core {

DocumentSession::DocumentSession(QString uri, const QString &text)
    : m_uri(std::move(uri))
    , m_snapshot(std::make_shared<DocumentState>(parseDocument(text)))
{
    qCDebug(lcTodomeDocument) << "opened" << m_uri << "with" << m_snapshot->lines.size() << "lines";
}

DocumentSession::~DocumentSession() = default;

QString DocumentSession::uri() const
{
    return m_uri;
}

std::shared_ptr<const DocumentState> DocumentSession::snapshot() const
{
    QMutexLocker locker(&m_snapshotMutex);
    return m_snapshot;
}

std::shared_ptr<const DocumentState> DocumentSession::applyEdit(const LineEdit &edit)
{
    QMutexLocker locker(&m_editMutex);
    const auto current = snapshot();
    auto next = std::make_shared<DocumentState>(core::applyEdit(*current, edit));
    publish(next);
    return next;
}

std::shared_ptr<const DocumentState> DocumentSession::replaceText(const QString &text)
{
    QMutexLocker locker(&m_editMutex);
    const auto current = snapshot();
    auto next = std::make_shared<DocumentState>(parseDocument(text, current->version + 1));
    publish(next);
    return next;
}

QVector<Diagnostic> DocumentSession::diagnostics(const QDate &reference, const DiagnosticOptions &options) const
{
    const auto state = snapshot();
    return dateDiagnostics(state->forest, state->resolution, reference, options);
}

QVector<OverdueDiagnostic> DocumentSession::overdueTasks(const QDate &reference) const
{
    const auto state = snapshot();
    return overdue(state->forest, state->resolution, reference);
}

QVector<CompletionItem> DocumentSession::completions(int line, int column, const QDate &today, QChar trigger) const
{
    const auto state = snapshot();
    return complete(*state, line, column, today, trigger);
}

void DocumentSession::publish(std::shared_ptr<const DocumentState> state)
{
    QMutexLocker locker(&m_snapshotMutex);
    m_snapshot = std::move(state);
}

} // namespace core
} // namespace todome
