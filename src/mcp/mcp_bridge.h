#pragma once
#include "session_registry.h"
#include "config/config_types.h"
#include "proxy/http_request.h"
#include "semantic/upstream_stream.h"
#include <QObject>
#include <QPointer>

class DownstreamChannel;
class McpExchange;

struct McpBridgeDeps {
    IExecutor* executor = nullptr;
    SessionRegistry* registry = nullptr;
    RuntimeOptions runtime;
    QString defaultToken;                 // INVARIANT_API_KEY
    QList<PolicySource> baseSources;      // guardrails file, if any
};

// HTTP side of the MCP gateway: the SSE transport (event stream plus
// message POSTs) and the Streamable-HTTP endpoint.
class McpBridge : public QObject {
    Q_OBJECT
public:
    static const QString kServerBaseUrlHeader;
    static const QString kSessionIdHeader;

    explicit McpBridge(const McpBridgeDeps& deps, QObject* parent = nullptr);

    void openSse(const HttpRequest& request, DownstreamChannel* channel);
    void postSseMessage(const HttpRequest& request, DownstreamChannel* channel);
    void handleStreamable(const HttpRequest& request, DownstreamChannel* channel);

    static QString extractSessionId(const QString& endpointData);
    static QString rewriteEndpoint(const QString& endpointData);

    McpSessionOptions sessionOptions(const HttpRequest& request, const QString& sessionId,
                                     TransportKind transport) const;

private:
    McpBridgeDeps m_deps;

    void streamablePost(const HttpRequest& request, DownstreamChannel* channel);
    void streamableGet(const HttpRequest& request, DownstreamChannel* channel);
    void streamableDelete(const HttpRequest& request, DownstreamChannel* channel);

    McpExchange* startExchange(const ProviderRequest& upstream, DownstreamChannel* channel,
                               int readTimeoutMs);
    static void observeServerData(McpSession* session, const QByteArray& data);
    void release(McpSession* session);

    static void respondError(DownstreamChannel* channel, const DomainFailure& failure);
    static QMap<QString, QString> upstreamHeaders(const HttpRequest& request);
    static QString serverBaseUrl(const HttpRequest& request);
};
