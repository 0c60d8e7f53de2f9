#pragma once
#include "downstream_channel.h"
#include <QPointer>
#include <QTcpSocket>

class SocketChannel : public DownstreamChannel {
    Q_OBJECT
public:
    explicit SocketChannel(QTcpSocket* socket, qint64 lowWater = 64 * 1024,
                           QObject* parent = nullptr);

    bool isOpen() const override;
    qint64 pendingBytes() const override;
    bool headersSent() const override { return m_headersSent; }

    void writeHead(int status, const QMap<QString, QString>& headers, bool chunked) override;
    void writeChunk(const QByteArray& data) override;
    void endChunks() override;
    void writeBody(int status, const QByteArray& body, const QString& contentType,
                   const QMap<QString, QString>& headers) override;

    QTcpSocket* socket() const { return m_socket; }

private slots:
    void onBytesWritten();

private:
    QPointer<QTcpSocket> m_socket;
    qint64 m_lowWater;
    bool m_headersSent = false;
    bool m_chunked = false;
    bool m_ended = false;

    void write(const QByteArray& data);
};
