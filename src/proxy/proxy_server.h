#pragma once
#include "http_request.h"
#include "request_router.h"
#include "config/config_types.h"
#include "guardrails/policy.h"
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QMap>
#include <QPointer>

class DownstreamChannel;
class GuardrailsEngine;
class IExecutor;
class ITraceStore;
class McpBridge;
class ProviderRegistry;

struct ProxyServerDeps {
    ProviderRegistry* providers = nullptr;
    IExecutor* executor = nullptr;
    ITraceStore* traceStore = nullptr;
    GuardrailsEngine* guardrails = nullptr;
    McpBridge* mcp = nullptr;
    QList<PolicySource> baseSources;
};

class ProxyServer : public QObject {
    Q_OBJECT
public:
    static constexpr qint64 kMaxRequestBytes = 32 * 1024 * 1024;

    explicit ProxyServer(const ProxyServerDeps& deps, QObject* parent = nullptr);
    ~ProxyServer() override;

    bool start(const RuntimeOptions& runtime);
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    static bool isPortInUse(int port);

    // Dispatches one parsed request onto a response channel
    void handleRequest(const HttpRequest& request, DownstreamChannel* channel);
    static HttpRequest parseHttpRequest(const QByteArray& data);

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    void processBuffered(QTcpSocket* socket);
    void handleLlmRequest(const HttpRequest& request, const Route& route,
                          DownstreamChannel* channel);
    static void sendError(DownstreamChannel* channel, const DomainFailure& failure);

    QTcpServer* m_server = nullptr;
    ProxyServerDeps m_deps;
    RequestRouter m_router;
    RuntimeOptions m_runtime;
    QMap<QTcpSocket*, QByteArray> m_pendingData;
    // Socket -> channel of the response still being written
    QMap<QTcpSocket*, QPointer<DownstreamChannel>> m_activeChannels;
};
