#pragma once
#include "upstream_stream.h"
#include "wire_framer.h"
#include <QObject>
#include <QTimer>

// Pulls bytes off an UpstreamStream, frames them into wire units and hands
// them out one by one. While paused nothing is read, so the transport's
// bounded read buffer pushes back on the upstream server.
class StreamSession : public QObject {
    Q_OBJECT
public:
    static constexpr qint64 kReadChunk = 16 * 1024;

    explicit StreamSession(UpstreamStream* upstream,
                           WireFormat format = WireFormat::Sse,
                           QObject* parent = nullptr);
    ~StreamSession() override;

    void setTimeouts(int connectMs, int readMs);
    void setFormat(WireFormat format) { m_framer.setFormat(format); }
    WireFormat format() const { return m_framer.format(); }

    void start();
    void pause();
    void resume();
    void abort();

    bool isPaused() const { return m_paused; }
    bool isDone() const { return m_done; }
    int statusCode() const { return m_upstream->statusCode(); }

signals:
    void headersReady(int status, const QMap<QString, QString>& headers);
    void unitReady(const WireUnit& unit);
    void finished();
    void error(const DomainFailure& failure);

private slots:
    void onMetaDataReady();
    void onUpstreamReadyRead();
    void onUpstreamFinished();
    void onUpstreamFailed(const DomainFailure& failure);
    void onTimeout();

private:
    UpstreamStream* m_upstream;
    WireFramer m_framer;
    QList<WireUnit> m_queue;
    QTimer m_timer;
    int m_connectTimeoutMs = 30000;
    int m_readTimeoutMs = 60000;
    bool m_headersSeen = false;
    bool m_upstreamFinished = false;
    bool m_framerFlushed = false;
    bool m_paused = false;
    bool m_done = false;
    bool m_draining = false;

    void drain();
    void armTimer();
    void fail(const DomainFailure& failure);
};
