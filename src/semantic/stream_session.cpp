#include "stream_session.h"
#include "core/log_manager.h"
#include <QPointer>

StreamSession::StreamSession(UpstreamStream* upstream, WireFormat format, QObject* parent)
    : QObject(parent)
    , m_upstream(upstream)
    , m_framer(format)
{
    Q_ASSERT(m_upstream);

    // Take ownership of the upstream so it is cleaned up with this session
    m_upstream->setParent(this);

    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &StreamSession::onTimeout);

    connect(m_upstream, &UpstreamStream::metaDataReady,
            this, &StreamSession::onMetaDataReady);
    connect(m_upstream, &UpstreamStream::readyRead,
            this, &StreamSession::onUpstreamReadyRead);
    connect(m_upstream, &UpstreamStream::finished,
            this, &StreamSession::onUpstreamFinished);
    connect(m_upstream, &UpstreamStream::failed,
            this, &StreamSession::onUpstreamFailed);
}

StreamSession::~StreamSession()
{
    if (!m_done)
        m_upstream->abort();
}

void StreamSession::setTimeouts(int connectMs, int readMs)
{
    m_connectTimeoutMs = connectMs;
    m_readTimeoutMs = readMs;
}

void StreamSession::start()
{
    armTimer();
}

void StreamSession::pause()
{
    if (m_paused || m_done)
        return;
    m_paused = true;
    m_timer.stop();
}

void StreamSession::resume()
{
    if (!m_paused || m_done)
        return;
    m_paused = false;
    armTimer();
    // Queued so a resume from inside a unitReady handler does not recurse
    QMetaObject::invokeMethod(this, &StreamSession::drain, Qt::QueuedConnection);
}

void StreamSession::abort()
{
    if (m_done)
        return;
    m_done = true;
    m_timer.stop();
    m_queue.clear();
    m_upstream->abort();
}

void StreamSession::armTimer()
{
    if (m_done || m_paused)
        return;
    const int ms = m_headersSeen ? m_readTimeoutMs : m_connectTimeoutMs;
    if (ms > 0)
        m_timer.start(ms);
}

void StreamSession::onMetaDataReady()
{
    if (m_done || m_headersSeen)
        return;
    m_headersSeen = true;
    armTimer();

    QPointer<StreamSession> guard(this);
    emit headersReady(m_upstream->statusCode(), m_upstream->headers());
    if (!guard)
        return;
    drain();
}

void StreamSession::onUpstreamReadyRead()
{
    if (m_done)
        return;
    armTimer();
    drain();
}

void StreamSession::onUpstreamFinished()
{
    if (m_done)
        return;
    m_upstreamFinished = true;
    drain();
}

void StreamSession::onUpstreamFailed(const DomainFailure& failure)
{
    fail(failure);
}

void StreamSession::onTimeout()
{
    if (m_done)
        return;
    const DomainFailure failure = DomainFailure::timeout(
        m_headersSeen
            ? QStringLiteral("No upstream data for %1 ms").arg(m_readTimeoutMs)
            : QStringLiteral("Upstream did not respond within %1 ms").arg(m_connectTimeoutMs));
    m_upstream->abort();
    fail(failure);
}

void StreamSession::fail(const DomainFailure& failure)
{
    if (m_done)
        return;
    LOG_ERROR(QStringLiteral("StreamSession error [%1]: %2").arg(failure.code, failure.message));
    m_done = true;
    m_timer.stop();
    m_queue.clear();
    emit error(failure);
}

void StreamSession::drain()
{
    if (m_draining || !m_headersSeen)
        return;
    m_draining = true;
    QPointer<StreamSession> guard(this);

    while (!m_paused && !m_done) {
        if (!m_queue.isEmpty()) {
            const WireUnit unit = m_queue.takeFirst();
            emit unitReady(unit);
            if (!guard)
                return;
            continue;
        }

        if (m_upstream->bytesAvailable() > 0) {
            m_queue += m_framer.feed(m_upstream->read(kReadChunk));
            continue;
        }

        if (m_upstreamFinished && !m_framerFlushed) {
            m_framerFlushed = true;
            m_queue += m_framer.finish();
            continue;
        }

        if (m_upstreamFinished) {
            m_done = true;
            m_timer.stop();
            emit finished();
            if (!guard)
                return;
        }
        break;
    }

    m_draining = false;
}
