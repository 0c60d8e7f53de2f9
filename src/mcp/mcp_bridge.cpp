#include "mcp_bridge.h"
#include "mcp_exchange.h"
#include "core/log_manager.h"
#include "proxy/downstream_channel.h"
#include "proxy/http_writer.h"
#include <QRegularExpression>

const QString McpBridge::kServerBaseUrlHeader = QStringLiteral("mcp-server-base-url");
const QString McpBridge::kSessionIdHeader = QStringLiteral("mcp-session-id");

namespace {

const QStringList kForwardedHeaders = {
    QStringLiteral("accept"),
    QStringLiteral("content-type"),
    QStringLiteral("cache-control"),
    QStringLiteral("last-event-id"),
    QStringLiteral("mcp-session-id"),
    QStringLiteral("mcp-protocol-version")
};

QByteArray messageEvent(const QJsonObject& message)
{
    return HttpWriter::sseEvent(QJsonDocument(message).toJson(QJsonDocument::Compact),
                                QStringLiteral("message"));
}

}

McpBridge::McpBridge(const McpBridgeDeps& deps, QObject* parent)
    : QObject(parent)
    , m_deps(deps)
{
}

// ========================================================================
// helpers
// ========================================================================

void McpBridge::respondError(DownstreamChannel* channel, const DomainFailure& failure)
{
    if (!channel)
        return;
    LOG_WARNING(QStringLiteral("McpBridge: %1 (%2)").arg(failure.message, failure.code));
    channel->writeBody(failure.httpStatus(), failure.toBody());
}

QString McpBridge::serverBaseUrl(const HttpRequest& request)
{
    QString base = request.header(kServerBaseUrlHeader).trimmed();
    while (base.endsWith(QLatin1Char('/')))
        base.chop(1);
    return base;
}

QMap<QString, QString> McpBridge::upstreamHeaders(const HttpRequest& request)
{
    QMap<QString, QString> out;
    for (const QString& name : kForwardedHeaders) {
        if (request.headers.contains(name))
            out.insert(name, request.headers.value(name));
    }
    return out;
}

McpSessionOptions McpBridge::sessionOptions(const HttpRequest& request, const QString& sessionId,
                                            TransportKind transport) const
{
    McpSessionOptions options;
    options.sessionId = sessionId;
    options.transport = transport;
    options.serverBaseUrl = serverBaseUrl(request);
    options.project = request.header(QStringLiteral("project-name")).trimmed();
    options.pushExplorer = request.header(QStringLiteral("push-explorer")).trimmed()
                               .compare(QStringLiteral("true"), Qt::CaseInsensitive) == 0;

    const QString auth = request.header(QStringLiteral("invariant-authorization")).trimmed();
    if (auth.startsWith(QStringLiteral("Bearer "), Qt::CaseInsensitive))
        options.token = auth.mid(7).trimmed();
    else
        options.token = m_deps.defaultToken;

    options.policySources = m_deps.baseSources;
    if (!options.project.isEmpty() && !options.token.isEmpty())
        options.policySources.append({PolicySource::Kind::Project, options.project});
    return options;
}

QString McpBridge::extractSessionId(const QString& endpointData)
{
    static const QRegularExpression re(QStringLiteral("session_id=([^&\\s]+)"));
    const QRegularExpressionMatch m = re.match(endpointData);
    return m.hasMatch() ? m.captured(1) : QString();
}

QString McpBridge::rewriteEndpoint(const QString& endpointData)
{
    QString out = endpointData;
    out.replace(QStringLiteral("/messages/?session_id="),
                QStringLiteral("/api/v1/gateway/mcp/sse/messages/?session_id="));
    return out;
}

void McpBridge::observeServerData(McpSession* session, const QByteArray& data)
{
    if (!session || data.trimmed().isEmpty())
        return;
    auto messages = JsonRpc::parse(data);
    if (!messages) {
        LOG_WARNING(QStringLiteral("McpBridge: unreadable server message: %1")
                        .arg(messages.error().message));
        return;
    }
    for (const JsonRpcMessage& message : *messages)
        session->handleServerMessage(message);
}

void McpBridge::release(McpSession* session)
{
    if (session)
        m_deps.registry->remove(session->id());
}

McpExchange* McpBridge::startExchange(const ProviderRequest& upstream, DownstreamChannel* channel,
                                      int readTimeoutMs)
{
    LOG_DEBUG(QStringLiteral("McpBridge: %1 %2").arg(upstream.method, upstream.url));
    UpstreamStream* stream = m_deps.executor->open(upstream, nullptr);
    auto* exchange = new McpExchange(stream, channel, m_deps.runtime, channel);
    exchange->setReadTimeout(readTimeoutMs);
    connect(exchange, &McpExchange::finished, exchange, &QObject::deleteLater);
    connect(exchange, &McpExchange::finished, channel, &QObject::deleteLater);
    return exchange;
}

// ========================================================================
// SSE transport
// ========================================================================

void McpBridge::openSse(const HttpRequest& request, DownstreamChannel* channel)
{
    const QString base = serverBaseUrl(request);
    if (base.isEmpty()) {
        respondError(channel, DomainFailure::transport(
            QStringLiteral("missing_server_url"),
            QStringLiteral("Missing 'mcp-server-base-url' header")));
        return;
    }

    ProviderRequest upstream;
    upstream.method = QStringLiteral("GET");
    upstream.url = base + QStringLiteral("/sse")
                   + (request.query.isEmpty() ? QString() : QLatin1Char('?') + request.query);
    upstream.headers = upstreamHeaders(request);
    upstream.headers.insert(QStringLiteral("accept"), QStringLiteral("text/event-stream"));
    upstream.stream = true;

    // The event stream is long-lived: no read timeout
    McpExchange* exchange = startExchange(upstream, channel, 0);
    QPointer<McpExchange> exchangeGuard(exchange);
    auto session = std::make_shared<QPointer<McpSession>>();

    exchange->setUnitHook([this, request, session, exchangeGuard](const WireUnit& unit) -> QByteArray {
        if (unit.event == QStringLiteral("endpoint")) {
            const QString data = QString::fromUtf8(unit.data);
            const QString sid = extractSessionId(data);
            if (!sid.isEmpty() && !m_deps.registry->contains(sid)) {
                McpSession* created = m_deps.registry->create(
                    sessionOptions(request, sid, TransportKind::McpSse));
                created->open();
                *session = created;
                connect(created, &McpSession::notifyClient, exchangeGuard.data(),
                        [exchangeGuard](const QJsonObject& message) {
                    if (exchangeGuard)
                        exchangeGuard->inject(messageEvent(message));
                });
            }
            return HttpWriter::sseEvent(rewriteEndpoint(data).toUtf8(), unit.event);
        }

        if (unit.event.isEmpty() || unit.event == QStringLiteral("message"))
            observeServerData(session->data(), unit.data);
        return unit.raw;
    });

    connect(exchange, &McpExchange::finished, this, [this, session]() {
        release(session->data());
    });
    exchange->start();
}

void McpBridge::postSseMessage(const HttpRequest& request, DownstreamChannel* channel)
{
    const QString sid = request.queryItem(QStringLiteral("session_id"));
    if (sid.isEmpty()) {
        respondError(channel, DomainFailure::transport(
            QStringLiteral("missing_session_id"), QStringLiteral("Missing 'session_id' query parameter")));
        return;
    }

    McpSession* session = m_deps.registry->find(sid);
    if (!session) {
        respondError(channel, DomainFailure::sessionNotFound(
            QStringLiteral("MCP session %1 does not exist").arg(sid)));
        return;
    }

    QString base = serverBaseUrl(request);
    if (base.isEmpty())
        base = session->serverBaseUrl();

    bool isBatch = false;
    auto messages = JsonRpc::parse(request.body, &isBatch);
    if (!messages) {
        respondError(channel, messages.error());
        return;
    }

    QPointer<DownstreamChannel> channelGuard(channel);
    QPointer<McpSession> sessionGuard(session);
    const QMap<QString, QString> headers = upstreamHeaders(request);
    const QString query = request.query;

    session->screenClientMessages(*messages,
        [this, channelGuard, sessionGuard, base, headers, query, isBatch]
        (Result<McpSession::Screened> screened) {
        if (!channelGuard)
            return;
        if (!screened) {
            respondError(channelGuard, screened.error());
            return;
        }

        // Gateway answers travel on the session's event stream
        if (sessionGuard) {
            for (const QJsonObject& reply : screened->replies)
                emit sessionGuard->notifyClient(reply);
        }

        if (screened->forward.isEmpty()) {
            channelGuard->writeBody(202, QByteArrayLiteral("Accepted"), QStringLiteral("text/plain"));
            return;
        }

        ProviderRequest upstream;
        upstream.method = QStringLiteral("POST");
        upstream.url = base + QStringLiteral("/messages/?") + query;
        upstream.headers = headers;
        upstream.headers.insert(QStringLiteral("content-type"), QStringLiteral("application/json"));
        upstream.body = JsonRpc::serialize(screened->forward, isBatch);

        startExchange(upstream, channelGuard, m_deps.runtime.readTimeout)->start();
    });
}

// ========================================================================
// Streamable HTTP
// ========================================================================

void McpBridge::handleStreamable(const HttpRequest& request, DownstreamChannel* channel)
{
    if (serverBaseUrl(request).isEmpty()) {
        respondError(channel, DomainFailure::transport(
            QStringLiteral("missing_server_url"),
            QStringLiteral("Missing 'mcp-server-base-url' header")));
        return;
    }

    if (request.method == QStringLiteral("POST"))
        streamablePost(request, channel);
    else if (request.method == QStringLiteral("GET"))
        streamableGet(request, channel);
    else if (request.method == QStringLiteral("DELETE"))
        streamableDelete(request, channel);
    else
        respondError(channel, DomainFailure::invalidInput(
            QStringLiteral("method_not_allowed"),
            QStringLiteral("%1 is not supported on the streamable endpoint").arg(request.method)));
}

void McpBridge::streamablePost(const HttpRequest& request, DownstreamChannel* channel)
{
    const QString base = serverBaseUrl(request);

    bool isBatch = false;
    auto messages = JsonRpc::parse(request.body, &isBatch);
    if (!messages) {
        respondError(channel, messages.error());
        return;
    }

    bool isInitialize = false;
    for (const JsonRpcMessage& m : *messages)
        isInitialize = isInitialize || m.method() == JsonRpc::kInitialize;

    const QString sid = request.header(kSessionIdHeader).trimmed();
    McpSession* session = nullptr;
    if (!sid.isEmpty()) {
        session = m_deps.registry->find(sid);
        if (!session) {
            respondError(channel, DomainFailure::sessionNotFound(
                QStringLiteral("MCP session %1 does not exist").arg(sid)));
            return;
        }
    } else {
        if (!isInitialize && m_deps.registry->isStatefulServer(base)) {
            respondError(channel, DomainFailure::transport(
                QStringLiteral("missing_session_id"),
                QStringLiteral("Missing 'mcp-session-id' header for a stateful MCP server")));
            return;
        }
        // Ephemeral until the server hands out a session id, if it ever does
        session = m_deps.registry->create(sessionOptions(
            request, SessionRegistry::generateStatelessId(),
            TransportKind::McpStreamableStateless));
        if (!isInitialize)
            session->open();
    }

    QPointer<DownstreamChannel> channelGuard(channel);
    QPointer<McpSession> sessionGuard(session);
    QMap<QString, QString> headers = upstreamHeaders(request);
    headers.insert(QStringLiteral("content-type"), QStringLiteral("application/json"));
    if (!headers.contains(QStringLiteral("accept")))
        headers.insert(QStringLiteral("accept"), QStringLiteral("application/json, text/event-stream"));

    session->screenClientMessages(*messages,
        [this, channelGuard, sessionGuard, base, headers, isBatch, isInitialize]
        (Result<McpSession::Screened> screened) {
        if (!channelGuard || !sessionGuard) {
            // A stateful session outlives the client that dropped this call
            if (sessionGuard && sessionGuard->isStateless())
                release(sessionGuard);
            return;
        }
        McpSession* session = sessionGuard.data();

        if (!screened) {
            respondError(channelGuard, screened.error());
            if (session->isStateless())
                release(session);
            return;
        }

        const QList<QJsonObject> replies = screened->replies;
        if (screened->forward.isEmpty()) {
            channelGuard->writeBody(200, JsonRpc::serialize(replies, isBatch));
            if (session->isStateless())
                release(session);
            return;
        }

        ProviderRequest upstream;
        upstream.method = QStringLiteral("POST");
        upstream.url = base + QStringLiteral("/mcp");
        upstream.headers = headers;
        upstream.body = JsonRpc::serialize(screened->forward, isBatch);

        McpExchange* exchange = startExchange(upstream, channelGuard, m_deps.runtime.readTimeout);

        QList<QByteArray> leading;
        for (const QJsonObject& reply : replies)
            leading.append(messageEvent(reply));
        exchange->setLeadingEvents(leading);

        exchange->setHeadHook([this, sessionGuard, base, isInitialize](int status,
                                                                       QMap<QString, QString>& h) {
            if (!sessionGuard || status < 200 || status >= 300)
                return;
            McpSession* s = sessionGuard.data();
            const QString assigned = h.value(kSessionIdHeader);
            if (isInitialize && !assigned.isEmpty() && s->isStateless()) {
                if (m_deps.registry->rekey(s->id(), assigned)) {
                    s->setTransport(TransportKind::McpStreamableStateful);
                    m_deps.registry->markStateful(base);
                    LOG_INFO(QStringLiteral("McpBridge: %1 is stateful, session %2")
                                 .arg(base, assigned));
                }
            }
            s->open();
        });

        exchange->setUnitHook([sessionGuard](const WireUnit& unit) -> QByteArray {
            if (unit.event.isEmpty() || unit.event == QStringLiteral("message"))
                observeServerData(sessionGuard.data(), unit.data);
            return unit.raw;
        });

        exchange->setBodyHook([sessionGuard, replies, isBatch](int& status,
                                                              const QByteArray& body) -> QByteArray {
            if (status < 200 || status >= 300)
                return body;
            observeServerData(sessionGuard.data(), body);
            if (replies.isEmpty())
                return body;
            // 202 for forwarded notifications, but now there is something to say
            status = 200;

            // Merge gateway answers into the server's reply
            QList<QJsonObject> merged;
            auto parsed = JsonRpc::parse(body);
            if (parsed) {
                for (const JsonRpcMessage& m : *parsed)
                    merged.append(m.object);
            }
            merged += replies;
            return JsonRpc::serialize(merged, isBatch || merged.size() > 1);
        });

        connect(exchange, &McpExchange::finished, this, [this, sessionGuard]() {
            if (sessionGuard && sessionGuard->isStateless())
                release(sessionGuard);
        });
        exchange->start();
    });
}

void McpBridge::streamableGet(const HttpRequest& request, DownstreamChannel* channel)
{
    const QString base = serverBaseUrl(request);
    const QString sid = request.header(kSessionIdHeader).trimmed();

    McpSession* session = nullptr;
    if (!sid.isEmpty()) {
        session = m_deps.registry->find(sid);
        if (!session) {
            respondError(channel, DomainFailure::sessionNotFound(
                QStringLiteral("MCP session %1 does not exist").arg(sid)));
            return;
        }
    } else if (m_deps.registry->isStatefulServer(base)) {
        respondError(channel, DomainFailure::transport(
            QStringLiteral("missing_session_id"),
            QStringLiteral("Missing 'mcp-session-id' header for a stateful MCP server")));
        return;
    } else {
        session = m_deps.registry->create(sessionOptions(
            request, SessionRegistry::generateStatelessId(),
            TransportKind::McpStreamableStateless));
        session->open();
    }

    ProviderRequest upstream;
    upstream.method = QStringLiteral("GET");
    upstream.url = base + QStringLiteral("/mcp");
    upstream.headers = upstreamHeaders(request);
    upstream.headers.insert(QStringLiteral("accept"), QStringLiteral("text/event-stream"));
    upstream.stream = true;

    McpExchange* exchange = startExchange(upstream, channel, 0);
    QPointer<McpSession> sessionGuard(session);
    exchange->setUnitHook([sessionGuard](const WireUnit& unit) -> QByteArray {
        if (unit.event.isEmpty() || unit.event == QStringLiteral("message"))
            observeServerData(sessionGuard.data(), unit.data);
        return unit.raw;
    });
    connect(exchange, &McpExchange::finished, this, [this, sessionGuard]() {
        if (sessionGuard && sessionGuard->isStateless())
            release(sessionGuard);
    });
    exchange->start();
}

void McpBridge::streamableDelete(const HttpRequest& request, DownstreamChannel* channel)
{
    const QString sid = request.header(kSessionIdHeader).trimmed();
    if (sid.isEmpty()) {
        respondError(channel, DomainFailure::transport(
            QStringLiteral("missing_session_id"),
            QStringLiteral("DELETE needs an 'mcp-session-id' header")));
        return;
    }
    McpSession* session = m_deps.registry->find(sid);
    if (!session) {
        respondError(channel, DomainFailure::sessionNotFound(
            QStringLiteral("MCP session %1 does not exist").arg(sid)));
        return;
    }

    ProviderRequest upstream;
    upstream.method = QStringLiteral("DELETE");
    upstream.url = serverBaseUrl(request) + QStringLiteral("/mcp");
    upstream.headers = upstreamHeaders(request);

    McpExchange* exchange = startExchange(upstream, channel, m_deps.runtime.readTimeout);
    connect(exchange, &McpExchange::finished, this, [this, sid]() {
        m_deps.registry->remove(sid);
    });
    exchange->start();
}
