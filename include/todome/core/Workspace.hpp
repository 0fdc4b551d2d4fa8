#pragma once

#include <QHash>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>

#include "todome/core/IncrementalUpdater.hpp"
#include "todome/core/QueryIndex.hpp"

namespace todome {
namespace core {

class DocumentSession;

// The set of documents an editor has open, keyed by URI. Distinct documents
// may be edited from different threads; edits to one document are
// serialized by its session.
class Workspace
{
public:
    Workspace();
    ~Workspace();

    std::shared_ptr<DocumentSession> open(const QString &uri, const QString &text);
    bool applyEdit(const QString &uri, const LineEdit &edit);
    bool replaceText(const QString &uri, const QString &text);
    bool close(const QString &uri);

    std::shared_ptr<DocumentSession> session(const QString &uri) const;
    QStringList uris() const;
    int count() const;

    // Union of the candidates of every open document.
    QStringList candidates(CandidateKind kind, const QString &prefix = QString()) const;

private:
    mutable QMutex m_mutex;
    QHash<QString, std::shared_ptr<DocumentSession>> m_sessions;
};

} // namespace core
} // namespace todome
