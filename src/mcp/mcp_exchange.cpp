#include "mcp_exchange.h"
#include "core/log_manager.h"
#include "proxy/downstream_channel.h"
#include "semantic/stream_session.h"

namespace {

QMap<QString, QString> relayHeaders(const QMap<QString, QString>& upstream)
{
    static const QStringList dropped = {
        QStringLiteral("content-length"), QStringLiteral("transfer-encoding"),
        QStringLiteral("connection"), QStringLiteral("keep-alive"),
        QStringLiteral("content-encoding"), QStringLiteral("date"), QStringLiteral("server")
    };
    QMap<QString, QString> out;
    for (auto it = upstream.constBegin(); it != upstream.constEnd(); ++it) {
        if (!dropped.contains(it.key()))
            out.insert(it.key(), it.value());
    }
    out.insert(QStringLiteral("x-proxied-by"), QStringLiteral("mcp-gateway"));
    return out;
}

}

McpExchange::McpExchange(UpstreamStream* upstream, DownstreamChannel* channel,
                         const RuntimeOptions& runtime, QObject* parent)
    : QObject(parent)
    , m_stream(new StreamSession(upstream, WireFormat::Whole, this))
    , m_channel(channel)
    , m_runtime(runtime)
    , m_readTimeoutMs(runtime.readTimeout)
{
    connect(m_stream, &StreamSession::headersReady, this, &McpExchange::onHeadersReady);
    connect(m_stream, &StreamSession::unitReady, this, &McpExchange::onUnit);
    connect(m_stream, &StreamSession::finished, this, &McpExchange::onUpstreamFinished);
    connect(m_stream, &StreamSession::error, this, &McpExchange::onUpstreamError);
    connect(m_channel, &DownstreamChannel::drained, this, &McpExchange::onDrained);
    connect(m_channel, &DownstreamChannel::disconnected, this, &McpExchange::abort);
}

McpExchange::~McpExchange()
{
    if (!m_done)
        m_stream->abort();
}

void McpExchange::start()
{
    m_stream->setTimeouts(m_runtime.connectTimeout, m_readTimeoutMs);
    m_stream->start();
}

void McpExchange::onHeadersReady(int status, const QMap<QString, QString>& headers)
{
    m_status = status;
    m_headers = relayHeaders(headers);
    if (m_headHook)
        m_headHook(status, m_headers);
    emit headersReady(status, m_headers);

    const QString contentType = headers.value(QStringLiteral("content-type"));
    m_eventStream = status >= 200 && status < 300
                    && contentType.startsWith(QStringLiteral("text/event-stream"));
    if (!m_eventStream)
        return;

    m_stream->setFormat(WireFormat::Sse);
    m_channel->writeHead(status, m_headers, true);
    for (const QByteArray& event : m_leadingEvents)
        m_channel->writeChunk(event);
    m_leadingEvents.clear();
}

void McpExchange::onUnit(const WireUnit& unit)
{
    if (m_done)
        return;

    if (m_eventStream) {
        m_channel->writeChunk(m_unitHook ? m_unitHook(unit) : unit.raw);
        if (!m_done && !m_stream->isDone()
            && m_channel->pendingBytes() > m_runtime.downstreamHighWater)
            m_stream->pause();
        return;
    }

    writeWhole(unit.raw);
}

void McpExchange::writeWhole(const QByteArray& raw)
{
    int status = m_status;
    const QByteArray body = m_bodyHook ? m_bodyHook(status, raw) : raw;
    QMap<QString, QString> headers = m_headers;
    QString contentType = headers.take(QStringLiteral("content-type"));
    if (contentType.isEmpty() && !body.isEmpty())
        contentType = QStringLiteral("application/json");
    m_channel->writeBody(status, body, contentType, headers);
}

bool McpExchange::inject(const QByteArray& event)
{
    if (m_done || !m_eventStream || !m_channel->isOpen())
        return false;
    m_channel->writeChunk(event);
    return true;
}

void McpExchange::onDrained()
{
    if (m_stream->isPaused() && m_channel->pendingBytes() <= m_runtime.downstreamHighWater)
        m_stream->resume();
}

void McpExchange::onUpstreamFinished()
{
    if (m_done)
        return;
    if (m_eventStream) {
        m_channel->endChunks();
    } else if (!m_channel->headersSent()) {
        // Empty body, e.g. 202 Accepted for notifications
        writeWhole(QByteArray());
    }
    finish();
}

void McpExchange::onUpstreamError(const DomainFailure& failure)
{
    if (m_done)
        return;
    LOG_WARNING(QStringLiteral("McpExchange: upstream failed: %1").arg(failure.message));
    if (!m_channel->headersSent())
        m_channel->writeBody(failure.httpStatus(), failure.toBody());
    else
        m_channel->endChunks();
    finish();
}

void McpExchange::abort()
{
    if (m_done)
        return;
    m_stream->abort();
    finish();
}

void McpExchange::finish()
{
    if (m_done)
        return;
    m_done = true;
    emit finished();
}
