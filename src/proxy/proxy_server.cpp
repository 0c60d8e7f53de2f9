#include "proxy_server.h"
#include "socket_channel.h"
#include "adapters/provider/provider_registry.h"
#include "core/log_manager.h"
#include "credential/credential_extractor.h"
#include "mcp/mcp_bridge.h"
#include "pipeline/llm_session.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimer>

// ========================================================================
// Construction / destruction
// ========================================================================

ProxyServer::ProxyServer(const ProxyServerDeps& deps, QObject* parent)
    : QObject(parent)
    , m_deps(deps)
{
    m_router.registerDefaults(m_deps.providers ? m_deps.providers->providers() : QStringList());
}

ProxyServer::~ProxyServer()
{
    stop();
}

bool ProxyServer::isPortInUse(int port)
{
    QTcpServer test;
    bool available = test.listen(QHostAddress::Any, static_cast<quint16>(port));
    if (available) test.close();
    return !available;
}

// ========================================================================
// start / stop
// ========================================================================

bool ProxyServer::start(const RuntimeOptions& runtime)
{
    if (m_server) {
        stop();
    }
    m_runtime = runtime;

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection, this, &ProxyServer::onNewConnection);

    if (!m_server->listen(QHostAddress::Any, static_cast<quint16>(runtime.listenPort))) {
        LOG_ERROR(QStringLiteral("ProxyServer: failed to listen on port %1: %2")
                      .arg(runtime.listenPort)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("ProxyServer: listening on port %1").arg(m_server->serverPort()));
    emit statusChanged(true);
    return true;
}

void ProxyServer::stop()
{
    if (!m_server) {
        return;
    }

    for (auto it = m_pendingData.begin(); it != m_pendingData.end(); ++it) {
        it.key()->disconnectFromHost();
    }
    m_pendingData.clear();
    m_activeChannels.clear();

    m_server->close();
    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("ProxyServer: stopped"));
    emit statusChanged(false);
}

bool ProxyServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 ProxyServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// Connections
// ========================================================================

void ProxyServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        connect(socket, &QTcpSocket::readyRead, this, &ProxyServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected, this, &ProxyServer::onSocketDisconnected);
        m_pendingData.insert(socket, QByteArray());

        LOG_DEBUG(QStringLiteral("ProxyServer: new connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void ProxyServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData[socket] += socket->readAll();
    processBuffered(socket);
}

void ProxyServer::processBuffered(QTcpSocket* socket)
{
    if (!m_pendingData.contains(socket)) {
        return;
    }

    while (socket->state() == QAbstractSocket::ConnectedState) {
        // One response at a time per connection
        if (m_activeChannels.value(socket)) {
            return;
        }

        QByteArray& buffer = m_pendingData[socket];
        const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            if (buffer.size() > kMaxRequestBytes) {
                SocketChannel channel(socket);
                sendError(&channel, DomainFailure::invalidInput(
                    QStringLiteral("header_too_large"), QStringLiteral("request header too large")));
                socket->disconnectFromHost();
            }
            return;
        }

        qint64 contentLength = 0;
        bool hasChunkedTransfer = false;
        const QString headerBlock = QString::fromUtf8(buffer.left(headerEnd));
        const QStringList headerLines = headerBlock.split(QStringLiteral("\r\n"));
        for (const QString& line : headerLines) {
            if (line.startsWith(QStringLiteral("Content-Length:"), Qt::CaseInsensitive)) {
                contentLength = line.mid(15).trimmed().toLongLong();
            }
            if (line.startsWith(QStringLiteral("Transfer-Encoding:"), Qt::CaseInsensitive)
                && line.contains(QStringLiteral("chunked"), Qt::CaseInsensitive)) {
                hasChunkedTransfer = true;
            }
        }

        const bool tooLarge = contentLength < 0 || contentLength > kMaxRequestBytes;
        const qint64 totalRequired = headerEnd + 4 + contentLength;
        if (!hasChunkedTransfer && !tooLarge && buffer.size() < totalRequired) {
            return;
        }

        auto* channel = new SocketChannel(socket, 64 * 1024, socket);
        connect(channel, &DownstreamChannel::completed, this, [this, socket, channel]() {
            m_activeChannels.remove(socket);
            // Nothing left that writes to it
            if (channel->children().isEmpty())
                channel->deleteLater();
            QTimer::singleShot(0, this, [this, socket]() { processBuffered(socket); });
        });

        if (hasChunkedTransfer || tooLarge) {
            buffer.clear();
            sendError(channel, DomainFailure::invalidInput(
                hasChunkedTransfer ? QStringLiteral("chunked_body") : QStringLiteral("body_too_large"),
                hasChunkedTransfer ? QStringLiteral("chunked request bodies are not supported")
                                   : QStringLiteral("request body too large")));
            // The rest of the body is still on the wire and must not parse as a request
            socket->disconnectFromHost();
            return;
        }

        const QByteArray requestData = buffer.left(totalRequired);
        buffer.remove(0, totalRequired);

        m_activeChannels.insert(socket, channel);
        handleRequest(parseHttpRequest(requestData), channel);
    }
}

void ProxyServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData.remove(socket);
    m_activeChannels.remove(socket);
    // Channels and whatever hangs off them go with the socket
    socket->deleteLater();

    LOG_DEBUG(QStringLiteral("ProxyServer: client disconnected"));
}

// ========================================================================
// parseHttpRequest
// ========================================================================

HttpRequest ProxyServer::parseHttpRequest(const QByteArray& data)
{
    HttpRequest req;

    const qsizetype headerEnd = data.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return req;
    }

    QString headerBlock = QString::fromUtf8(data.left(headerEnd));
    QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Request line: "METHOD PATH HTTP/1.1"
    if (!lines.isEmpty()) {
        QStringList parts = lines[0].split(QLatin1Char(' '));
        if (parts.size() >= 3) {
            req.method      = parts[0].trimmed().toUpper();
            req.httpVersion = parts[2];
            const QString target = parts[1];
            const qsizetype q = target.indexOf(QLatin1Char('?'));
            req.path  = q < 0 ? target : target.left(q);
            req.query = q < 0 ? QString() : target.mid(q + 1);
        }
    }

    for (int i = 1; i < lines.size(); ++i) {
        int colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            QString key   = lines[i].left(colon).trimmed().toLower();
            QString value = lines[i].mid(colon + 1).trimmed();
            req.headers[key] = value;
        }
    }

    req.body = data.mid(headerEnd + 4);
    return req;
}

// ========================================================================
// handleRequest
// ========================================================================

void ProxyServer::sendError(DownstreamChannel* channel, const DomainFailure& failure)
{
    channel->writeBody(failure.httpStatus(), failure.toBody());
}

void ProxyServer::handleRequest(const HttpRequest& request, DownstreamChannel* channel)
{
    LOG_INFO(QStringLiteral("ProxyServer: %1 %2").arg(request.method, request.path));

    auto routeOpt = m_router.match(request.method, request.path);
    if (!routeOpt) {
        QJsonObject errObj;
        errObj[QStringLiteral("error")] = QStringLiteral("route not found");
        errObj[QStringLiteral("path")]  = request.path;
        channel->writeBody(404, QJsonDocument(errObj).toJson(QJsonDocument::Compact));
        return;
    }

    const Route& route = *routeOpt;
    switch (route.kind) {
    case RouteKind::Health:
        channel->writeBody(200, QByteArrayLiteral("{\"status\":\"ok\"}"));
        return;
    case RouteKind::McpSseOpen:
        m_deps.mcp->openSse(request, channel);
        return;
    case RouteKind::McpSseMessage:
        m_deps.mcp->postSseMessage(request, channel);
        return;
    case RouteKind::McpStreamable:
        m_deps.mcp->handleStreamable(request, channel);
        return;
    case RouteKind::LlmProxy:
        handleLlmRequest(request, route, channel);
        return;
    }
}

void ProxyServer::handleLlmRequest(const HttpRequest& request, const Route& route,
                                   DownstreamChannel* channel)
{
    auto adapter = m_deps.providers->create(route.provider);
    if (!adapter) {
        sendError(channel, adapter.error());
        return;
    }

    LlmCallContext context;
    context.request.method = request.method;
    context.request.path = route.upstreamPath;
    context.request.query = request.query;
    context.request.headers = request.headers;
    context.request.body = request.body;
    context.project = route.project;

    auto credential = CredentialExtractor::extract((*adapter)->family(), request.headers,
                                                   request.query);
    if (!credential) {
        sendError(channel, credential.error());
        return;
    }
    context.credential = *credential;

    if (credential->hasGatewayToken()) {
        context.policySources = m_deps.baseSources;
        if (!route.project.isEmpty())
            context.policySources.append({PolicySource::Kind::Project, route.project});
    }

    LlmSessionDeps deps;
    deps.executor = m_deps.executor;
    deps.traceStore = m_deps.traceStore;
    deps.guardrails = m_deps.guardrails;
    deps.runtime = m_runtime;

    auto* session = new LlmSession(std::move(*adapter), channel, deps, channel);
    connect(session, &LlmSession::finished, session, &QObject::deleteLater);
    connect(session, &LlmSession::finished, channel, &QObject::deleteLater);
    session->start(context);
}
