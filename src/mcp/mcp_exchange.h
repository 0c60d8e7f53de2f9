#pragma once
#include "config/config_types.h"
#include "semantic/upstream_stream.h"
#include <QObject>
#include <functional>

class DownstreamChannel;
class StreamSession;

// Relays one upstream MCP HTTP exchange to the client. An event-stream
// response is relayed event by event; anything else goes back as one body.
// Hooks let the bridge look at (and rewrite) what passes through.
class McpExchange : public QObject {
    Q_OBJECT
public:
    using HeadHook = std::function<void(int status, QMap<QString, QString>& headers)>;
    using UnitHook = std::function<QByteArray(const WireUnit& unit)>;
    using BodyHook = std::function<QByteArray(int& status, const QByteArray& body)>;

    McpExchange(UpstreamStream* upstream, DownstreamChannel* channel,
                const RuntimeOptions& runtime, QObject* parent = nullptr);
    ~McpExchange() override;

    void setHeadHook(HeadHook hook) { m_headHook = std::move(hook); }
    void setUnitHook(UnitHook hook) { m_unitHook = std::move(hook); }
    void setBodyHook(BodyHook hook) { m_bodyHook = std::move(hook); }
    // Events written right after the response head of an event stream
    void setLeadingEvents(const QList<QByteArray>& events) { m_leadingEvents = events; }
    // Long-lived event streams have no read timeout
    void setReadTimeout(int ms) { m_readTimeoutMs = ms; }

    void start();
    void abort();
    // Writes an extra SSE event into a running event stream
    bool inject(const QByteArray& event);

    bool isEventStream() const { return m_eventStream; }
    bool isDone() const { return m_done; }

signals:
    void headersReady(int status, const QMap<QString, QString>& headers);
    void finished();

private slots:
    void onHeadersReady(int status, const QMap<QString, QString>& headers);
    void onUnit(const WireUnit& unit);
    void onUpstreamFinished();
    void onUpstreamError(const DomainFailure& failure);
    void onDrained();

private:
    StreamSession* m_stream;
    DownstreamChannel* m_channel;
    RuntimeOptions m_runtime;
    int m_readTimeoutMs;
    HeadHook m_headHook;
    UnitHook m_unitHook;
    BodyHook m_bodyHook;
    QList<QByteArray> m_leadingEvents;
    int m_status = 0;
    QMap<QString, QString> m_headers;
    bool m_eventStream = false;
    bool m_done = false;

    void writeWhole(const QByteArray& raw);
    void finish();
};
