#include "mcp_session.h"
#include "core/log_manager.h"
#include "guardrails/guardrails_engine.h"
#include "semantic/message_codec.h"
#include "trace/trace_assembler.h"
#include <QJsonDocument>
#include <QProcessEnvironment>
#include <QSysInfo>

McpSession::McpSession(const McpSessionOptions& options, ITraceStore* traceStore,
                       GuardrailsEngine* guardrails, QObject* parent)
    : QObject(parent)
    , m_options(options)
    , m_guardrails(guardrails)
{
    m_trace = new TraceAssembler(traceStore,
                                 m_options.pushExplorer ? m_options.project : QString(),
                                 m_options.token);
    m_metadata[QStringLiteral("source")] = QStringLiteral("mcp");
    m_metadata[QStringLiteral("system_user")] = systemUser();
    updateMetadata(QStringLiteral("session_id"), m_options.sessionId);
    updateMetadata(QStringLiteral("is_stateless_http_server"), isStateless());
}

McpSession::~McpSession()
{
    close();
}

QString McpSession::systemUser()
{
    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    QString user = env.value(QStringLiteral("USER"), env.value(QStringLiteral("USERNAME")));
    return QStringLiteral("%1@%2").arg(user, QSysInfo::machineHostName());
}

void McpSession::setId(const QString& id)
{
    m_options.sessionId = id;
    updateMetadata(QStringLiteral("session_id"), id);
    updateMetadata(QStringLiteral("is_stateless_http_server"), isStateless());
}

void McpSession::updateMetadata(const QString& key, const QJsonValue& value)
{
    m_metadata[key] = value;
    if (m_trace)
        m_trace->setMetadata(m_metadata);
}

void McpSession::setState(SessionState state)
{
    if (m_state == state)
        return;
    m_state = state;
    emit stateChanged(state);
}

void McpSession::open()
{
    if (m_state != SessionState::Negotiating)
        return;
    setState(SessionState::Open);
    LOG_DEBUG(QStringLiteral("McpSession %1 open").arg(id()));
}

void McpSession::close()
{
    if (m_state == SessionState::Closing || m_state == SessionState::Closed)
        return;
    setState(SessionState::Closing);
    if (m_trace)
        m_trace->closeAndRelease();
    setState(SessionState::Closed);
    LOG_DEBUG(QStringLiteral("McpSession %1 closed").arg(id()));
    emit closed();
}

bool McpSession::hasGuardrails() const
{
    return m_guardrails && !m_options.policySources.isEmpty();
}

// ------------------------------------------------------------------
// Normalization
// ------------------------------------------------------------------

CanonicalMessage McpSession::toolCallMessage(const JsonRpcMessage& message)
{
    const QJsonObject params = message.params();
    ToolCall call;
    call.id = JsonRpc::toolCallId(message.id());
    call.name = params.value(QStringLiteral("name")).toString();

    const QJsonValue args = params.value(QStringLiteral("arguments"));
    if (args.isObject())
        call.arguments = QJsonDocument(args.toObject()).toJson(QJsonDocument::Compact);
    else if (args.isString() && !args.toString().isEmpty())
        call.arguments = args.toString().toUtf8();
    else
        call.arguments = "{}";

    CanonicalMessage msg;
    msg.role = Role::Assistant;
    msg.content.append(ContentPart::fromToolCall(call));
    return msg;
}

CanonicalMessage McpSession::toolResultMessage(const JsonRpcMessage& message)
{
    QJsonValue payload;
    if (message.object.contains(QStringLiteral("error")))
        payload = message.object.value(QStringLiteral("error"));
    else
        payload = message.result().value(QStringLiteral("content"));

    CanonicalMessage msg;
    msg.role = Role::Tool;
    msg.content.append(ContentPart::fromToolResult(JsonRpc::toolCallId(message.id()), payload));
    return msg;
}

// ------------------------------------------------------------------
// Client -> server
// ------------------------------------------------------------------

void McpSession::handleClientMessage(const JsonRpcMessage& message, VerdictCallback done)
{
    if (m_state == SessionState::Closed || m_state == SessionState::Closing) {
        done(std::unexpected(DomainFailure::sessionNotFound(
            QStringLiteral("MCP session %1 is closed").arg(id()))));
        return;
    }

    const QString method = message.method();
    if (message.isRequest())
        m_methods.insert(JsonRpc::idKey(message.id()), method);

    if (method == JsonRpc::kInitialize) {
        const QJsonObject clientInfo = message.params().value(QStringLiteral("clientInfo")).toObject();
        if (!clientInfo.isEmpty()) {
            updateMetadata(QStringLiteral("mcp_client"), clientInfo.value(QStringLiteral("name")));
            updateMetadata(QStringLiteral("client_info"), clientInfo);
        }
    }

    if (method != JsonRpc::kToolCall) {
        done(std::optional<QJsonObject>{});
        return;
    }

    const CanonicalMessage call = toolCallMessage(message);

    if (isBlocked()) {
        LOG_INFO(QStringLiteral("McpSession %1: refusing tools/call after blocked result").arg(id()));
        m_trace->append(call);
        done(JsonRpc::blockedToolCallError(message.id(), m_blockDetails));
        return;
    }

    if (!hasGuardrails()) {
        m_trace->append(call);
        done(std::optional<QJsonObject>{});
        return;
    }

    checkToolCall(message, call, std::move(done));
}

void McpSession::screenClientMessages(const QList<JsonRpcMessage>& messages, ScreenCallback done)
{
    struct State {
        QList<JsonRpcMessage> messages;
        Screened screened;
        int next = 0;
        ScreenCallback done;
        std::function<void()> step;
    };
    auto state = std::make_shared<State>();
    state->messages = messages;
    state->done = std::move(done);

    QPointer<McpSession> guard(this);
    std::weak_ptr<State> weak = state;
    state->step = [guard, weak]() {
        auto st = weak.lock();
        if (!st)
            return;
        if (st->next >= st->messages.size() || !guard) {
            auto finished = std::move(st->done);
            const Screened screened = st->screened;
            st->step = nullptr;
            finished(screened);
            return;
        }
        const JsonRpcMessage message = st->messages.at(st->next++);
        guard->handleClientMessage(message, [st, message](Verdict verdict) {
            if (!verdict) {
                auto finished = std::move(st->done);
                st->step = nullptr;
                finished(std::unexpected(verdict.error()));
                return;
            }
            if (verdict->has_value())
                st->screened.replies.append(**verdict);
            else
                st->screened.forward.append(message.object);
            if (st->step)
                st->step();
        });
    };
    state->step();
}

void McpSession::checkToolCall(const JsonRpcMessage& message, const CanonicalMessage& call,
                               VerdictCallback done)
{
    QJsonArray prefix = m_trace->messagesJson();
    prefix.append(MessageCodec::toJson(call));

    QPointer<McpSession> guard(this);
    const QJsonValue rpcId = message.id();
    m_guardrails->evaluate(m_options.policySources, prefix, m_options.token,
                           [guard, call, rpcId, done](Result<PolicyResult> result) {
        if (!guard) {
            done(std::unexpected(DomainFailure::sessionNotFound(
                QStringLiteral("MCP session went away during the guardrail check"))));
            return;
        }
        McpSession* self = guard.data();
        if (!result) {
            LOG_ERROR(QStringLiteral("McpSession %1: pre-check unavailable: %2")
                          .arg(self->id(), result.error().message));
            done(std::unexpected(result.error()));
            return;
        }

        if (self->m_trace && !self->m_trace->isClosed())
            self->m_trace->append(call, result->annotations);

        if (result->isBlocked()) {
            LOG_INFO(QStringLiteral("McpSession %1: blocked tools/call: %2")
                         .arg(self->id(), result->summary()));
            done(JsonRpc::blockedToolCallError(
                rpcId, QString::fromUtf8(QJsonDocument(result->violationsJson())
                                             .toJson(QJsonDocument::Compact))));
            return;
        }
        done(std::optional<QJsonObject>{});
    });
}

// ------------------------------------------------------------------
// Server -> client
// ------------------------------------------------------------------

void McpSession::handleServerMessage(const JsonRpcMessage& message)
{
    if (m_state == SessionState::Closed)
        return;
    if (!message.isResponse())
        return;

    const QString method = m_methods.take(JsonRpc::idKey(message.id()));
    const QJsonObject result = message.result();

    const QJsonObject serverInfo = result.value(QStringLiteral("serverInfo")).toObject();
    if (!serverInfo.isEmpty()) {
        updateMetadata(QStringLiteral("mcp_server"), serverInfo.value(QStringLiteral("name")));
        updateMetadata(QStringLiteral("server_info"), serverInfo);
    }

    if (method == JsonRpc::kListTools) {
        updateMetadata(QStringLiteral("tools"), result.value(QStringLiteral("tools")));
    } else if (method == JsonRpc::kToolCall) {
        m_trace->append(toolResultMessage(message));
        checkToolResult();
    }
}

void McpSession::checkToolResult()
{
    if (!hasGuardrails())
        return;

    QPointer<McpSession> guard(this);
    m_guardrails->evaluate(m_options.policySources, m_trace->messagesJson(), m_options.token,
                           [guard](Result<PolicyResult> result) {
        if (!guard)
            return;
        McpSession* self = guard.data();
        if (!result) {
            // The next tools/call pre-check reports the outage to the client
            LOG_ERROR(QStringLiteral("McpSession %1: post-check unavailable: %2")
                          .arg(self->id(), result.error().message));
            return;
        }
        if (self->m_trace && !self->m_trace->isClosed())
            self->m_trace->addAnnotations(result->annotations);
        if (result->isBlocked()) {
            LOG_INFO(QStringLiteral("McpSession %1: tool result blocked: %2")
                         .arg(self->id(), result->summary()));
            self->m_blockDetails = QString::fromUtf8(
                QJsonDocument(result->violationsJson()).toJson(QJsonDocument::Compact));
        }
    });
}
