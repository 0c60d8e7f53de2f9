#pragma once
#include <QObject>
#include <QMap>

// The client side of one exchange. Implementations report how much written
// data is still queued so the relay can stop reading upstream.
class DownstreamChannel : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~DownstreamChannel() override = default;

    virtual bool isOpen() const = 0;
    virtual qint64 pendingBytes() const = 0;
    virtual bool headersSent() const = 0;

    virtual void writeHead(int status, const QMap<QString, QString>& headers, bool chunked) = 0;
    virtual void writeChunk(const QByteArray& data) = 0;
    virtual void endChunks() = 0;
    virtual void writeBody(int status, const QByteArray& body,
                           const QString& contentType = QStringLiteral("application/json"),
                           const QMap<QString, QString>& headers = {}) = 0;

signals:
    void drained();
    void disconnected();
    // The response is fully written (body sent or chunked terminator queued)
    void completed();
};
