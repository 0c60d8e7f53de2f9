#pragma once
#include "jsonrpc.h"
#include "guardrails/policy.h"
#include "semantic/message.h"
#include "semantic/types.h"
#include <QHash>
#include <QObject>
#include <QPointer>
#include <optional>

class GuardrailsEngine;
class ITraceStore;
class TraceAssembler;

struct McpSessionOptions {
    QString sessionId;
    TransportKind transport = TransportKind::McpSse;
    QString serverBaseUrl;
    QString project;
    bool pushExplorer = false;
    QString token;
    QList<PolicySource> policySources;
};

// One logical MCP session: negotiating -> open -> closing -> closed. Tool
// calls and their results are normalized into the session trace; tools/call
// requests are pre-checked, tool results post-checked.
class McpSession : public QObject {
    Q_OBJECT
public:
    // Value: a JSON-RPC reply to send back instead of forwarding.
    // nullopt: forward the message. Error: the check itself failed.
    using Verdict = Result<std::optional<QJsonObject>>;
    using VerdictCallback = std::function<void(Verdict)>;

    McpSession(const McpSessionOptions& options, ITraceStore* traceStore,
               GuardrailsEngine* guardrails, QObject* parent = nullptr);
    ~McpSession() override;

    QString id() const { return m_options.sessionId; }
    void setId(const QString& id);
    TransportKind transport() const { return m_options.transport; }
    void setTransport(TransportKind transport) { m_options.transport = transport; }
    QString serverBaseUrl() const { return m_options.serverBaseUrl; }
    SessionState state() const { return m_state; }
    bool isStateless() const { return m_options.transport == TransportKind::McpStreamableStateless; }

    void open();
    void close();

    void handleClientMessage(const JsonRpcMessage& message, VerdictCallback done);

    // Runs handleClientMessage over a batch in order. Messages that may go
    // upstream land in forward, gateway answers in replies.
    struct Screened {
        QList<QJsonObject> forward;
        QList<QJsonObject> replies;
    };
    using ScreenCallback = std::function<void(Result<Screened>)>;
    void screenClientMessages(const QList<JsonRpcMessage>& messages, ScreenCallback done);
    void handleServerMessage(const JsonRpcMessage& message);

    bool isBlocked() const { return !m_blockDetails.isEmpty(); }
    QString pendingMethod(const QJsonValue& id) const { return m_methods.value(JsonRpc::idKey(id)); }
    QJsonObject metadata() const { return m_metadata; }
    TraceAssembler* trace() const { return m_trace; }

signals:
    void stateChanged(SessionState state);
    // A message for the client that did not come from the server
    void notifyClient(const QJsonObject& message);
    void closed();

private:
    McpSessionOptions m_options;
    GuardrailsEngine* m_guardrails;
    QPointer<TraceAssembler> m_trace;
    SessionState m_state = SessionState::Negotiating;
    QHash<QString, QString> m_methods;
    QJsonObject m_metadata;
    QString m_blockDetails;

    void setState(SessionState state);
    void updateMetadata(const QString& key, const QJsonValue& value);
    bool hasGuardrails() const;
    void checkToolCall(const JsonRpcMessage& message, const CanonicalMessage& call,
                       VerdictCallback done);
    void checkToolResult();

    static CanonicalMessage toolCallMessage(const JsonRpcMessage& message);
    static CanonicalMessage toolResultMessage(const JsonRpcMessage& message);
    static QString systemUser();
};
