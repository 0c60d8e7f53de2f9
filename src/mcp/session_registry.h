#pragma once
#include "mcp_session.h"
#include <QHash>
#include <QObject>
#include <QSet>

// Owns every live MCP session, keyed by session id. Also remembers which
// upstream servers handed out a session id, since those require one on
// every later call.
class SessionRegistry : public QObject {
    Q_OBJECT
public:
    static const QString kStatelessPrefix;

    SessionRegistry(ITraceStore* traceStore, GuardrailsEngine* guardrails,
                    QObject* parent = nullptr);
    ~SessionRegistry() override;

    McpSession* create(const McpSessionOptions& options);
    McpSession* find(const QString& sessionId) const;
    bool contains(const QString& sessionId) const { return m_sessions.contains(sessionId); }
    // Re-registers a session under the id the server assigned
    bool rekey(const QString& oldId, const QString& newId);
    void remove(const QString& sessionId);
    void closeAll();
    int count() const { return m_sessions.size(); }

    void markStateful(const QString& serverBaseUrl) { m_statefulServers.insert(serverBaseUrl); }
    bool isStatefulServer(const QString& serverBaseUrl) const {
        return m_statefulServers.contains(serverBaseUrl);
    }

    static QString generateStatelessId();

private:
    ITraceStore* m_traceStore;
    GuardrailsEngine* m_guardrails;
    QHash<QString, McpSession*> m_sessions;
    QSet<QString> m_statefulServers;
};
