#include "session_registry.h"
#include "core/log_manager.h"
#include <QUuid>

const QString SessionRegistry::kStatelessPrefix = QStringLiteral("inv-");

SessionRegistry::SessionRegistry(ITraceStore* traceStore, GuardrailsEngine* guardrails,
                                 QObject* parent)
    : QObject(parent)
    , m_traceStore(traceStore)
    , m_guardrails(guardrails)
{
}

SessionRegistry::~SessionRegistry()
{
    closeAll();
}

QString SessionRegistry::generateStatelessId()
{
    return kStatelessPrefix + QUuid::createUuid().toString(QUuid::Id128);
}

McpSession* SessionRegistry::create(const McpSessionOptions& options)
{
    if (McpSession* existing = m_sessions.value(options.sessionId))
        return existing;

    auto* session = new McpSession(options, m_traceStore, m_guardrails, this);
    m_sessions.insert(options.sessionId, session);
    LOG_INFO(QStringLiteral("SessionRegistry: new MCP session %1 for %2 (%3 live)")
                 .arg(options.sessionId, options.serverBaseUrl)
                 .arg(m_sessions.size()));
    return session;
}

McpSession* SessionRegistry::find(const QString& sessionId) const
{
    return m_sessions.value(sessionId, nullptr);
}

bool SessionRegistry::rekey(const QString& oldId, const QString& newId)
{
    if (oldId == newId)
        return m_sessions.contains(oldId);
    if (m_sessions.contains(newId) || !m_sessions.contains(oldId))
        return false;
    McpSession* session = m_sessions.take(oldId);
    session->setId(newId);
    m_sessions.insert(newId, session);
    return true;
}

void SessionRegistry::remove(const QString& sessionId)
{
    McpSession* session = m_sessions.take(sessionId);
    if (!session)
        return;
    session->close();
    session->deleteLater();
    LOG_DEBUG(QStringLiteral("SessionRegistry: removed %1 (%2 live)")
                  .arg(sessionId).arg(m_sessions.size()));
}

void SessionRegistry::closeAll()
{
    const QStringList ids = m_sessions.keys();
    for (const QString& id : ids)
        remove(id);
}
