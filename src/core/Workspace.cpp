#include "todome/core/Workspace.hpp"

#include <QMutexLocker>
#include <algorithm>

#include "todome/core/DocumentSession.hpp"
#include "todome/core/Logging.hpp"

namespace todome {
namespace core {

Workspace::Workspace() = default;
Workspace::~Workspace() = default;

std::shared_ptr<DocumentSession> Workspace::open(const QString &uri, const QString &text)
{
    auto session = std::make_shared<DocumentSession>(uri, text);
    QMutexLocker locker(&m_mutex);
    if (m_sessions.contains(uri)) {
        qCInfo(lcTodomeWorkspace) << "reopening" << uri;
    }
    m_sessions.insert(uri, session);
    return session;
}

bool Workspace::applyEdit(const QString &uri, const LineEdit &edit)
{
    const auto target = session(uri);
    if (!target) {
        qCWarning(lcTodomeWorkspace) << "edit for unknown document" << uri;
        return false;
    }
    target->applyEdit(edit);
    return true;
}

bool Workspace::replaceText(const QString &uri, const QString &text)
{
    const auto target = session(uri);
    if (!target) {
        qCWarning(lcTodomeWorkspace) << "change for unknown document" << uri;
        return false;
    }
    target->replaceText(text);
    return true;
}

bool Workspace::close(const QString &uri)
{
    QMutexLocker locker(&m_mutex);
    return m_sessions.remove(uri) > 0;
}

std::shared_ptr<DocumentSession> Workspace::session(const QString &uri) const
{
    QMutexLocker locker(&m_mutex);
    return m_sessions.value(uri);
}

QStringList Workspace::uris() const
{
    QMutexLocker locker(&m_mutex);
    QStringList keys = m_sessions.keys();
    std::sort(keys.begin(), keys.end());
    return keys;
}

int Workspace::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_sessions.size();
}

QStringList Workspace::candidates(CandidateKind kind, const QString &prefix) const
{
    QVector<std::shared_ptr<DocumentSession>> sessions;
    {
        QMutexLocker locker(&m_mutex);
        sessions.reserve(m_sessions.size());
        for (const auto &session : m_sessions) {
            sessions.append(session);
        }
    }

    QStringList merged;
    for (const auto &session : sessions) {
        merged << session->snapshot()->index.candidates(kind, prefix);
    }
    std::sort(merged.begin(), merged.end());
    merged.erase(std::unique(merged.begin(), merged.end()), merged.end());
    return merged;
}

} // namespace core
} // namespace todome
