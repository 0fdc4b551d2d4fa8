#pragma once

#include <QDate>
#include <QMutex>
#include <QString>
#include <QVector>
#include <memory>

#include "todome/core/Completion.hpp"
#include "todome/core/Document.hpp"
#include "todome/core/IncrementalUpdater.hpp"
#include "todome/core/OverdueDetector.hpp"

namespace todome {
namespace core {

// Owns the state of one open document. Edits are applied one at a time in
// the order they arrive; readers work on the snapshot that was current when
// they asked and never see a half-updated state.
class DocumentSession
{
public:
    DocumentSession(QString uri, const QString &text);
    ~DocumentSession();

    DocumentSession(const DocumentSession &) = delete;
    DocumentSession &operator=(const DocumentSession &) = delete;

    QString uri() const;
    std::shared_ptr<const DocumentState> snapshot() const;

    std::shared_ptr<const DocumentState> applyEdit(const LineEdit &edit);
    std::shared_ptr<const DocumentState> replaceText(const QString &text);

    QVector<Diagnostic> diagnostics(const QDate &reference, const DiagnosticOptions &options = {}) const;
    QVector<OverdueDiagnostic> overdueTasks(const QDate &reference) const;
    QVector<CompletionItem> completions(int line, int column, const QDate &today, QChar trigger = QChar()) const;

private:
    void publish(std::shared_ptr<const DocumentState> state);

    const QString m_uri;
    QMutex m_editMutex;
    mutable QMutex m_snapshotMutex;
    std::shared_ptr<const DocumentState> m_snapshot;
};

} // namespace core
} // namespace todome
