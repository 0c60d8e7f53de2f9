#include "socket_channel.h"
#include "http_writer.h"
#include "core/log_manager.h"

SocketChannel::SocketChannel(QTcpSocket* socket, qint64 lowWater, QObject* parent)
    : DownstreamChannel(parent)
    , m_socket(socket)
    , m_lowWater(lowWater)
{
    connect(socket, &QTcpSocket::bytesWritten, this, &SocketChannel::onBytesWritten);
    connect(socket, &QTcpSocket::disconnected, this, &DownstreamChannel::disconnected);
}

bool SocketChannel::isOpen() const
{
    return m_socket && m_socket->state() == QAbstractSocket::ConnectedState;
}

qint64 SocketChannel::pendingBytes() const
{
    return m_socket ? m_socket->bytesToWrite() : 0;
}

void SocketChannel::onBytesWritten()
{
    if (pendingBytes() <= m_lowWater)
        emit drained();
}

void SocketChannel::write(const QByteArray& data)
{
    if (!isOpen()) {
        LOG_DEBUG(QStringLiteral("SocketChannel: dropping %1 bytes, socket not connected")
                      .arg(data.size()));
        return;
    }
    m_socket->write(data);
}

void SocketChannel::writeHead(int status, const QMap<QString, QString>& headers, bool chunked)
{
    if (m_headersSent)
        return;
    m_headersSent = true;
    m_chunked = chunked;
    write(HttpWriter::head(status, headers, chunked));
}

void SocketChannel::writeChunk(const QByteArray& data)
{
    if (!m_chunked || m_ended || data.isEmpty())
        return;
    write(HttpWriter::wrapChunked(data));
}

void SocketChannel::endChunks()
{
    if (!m_chunked || m_ended)
        return;
    m_ended = true;
    write(HttpWriter::terminator());
    if (m_socket)
        m_socket->flush();
    emit completed();
}

void SocketChannel::writeBody(int status, const QByteArray& body, const QString& contentType,
                              const QMap<QString, QString>& headers)
{
    if (m_headersSent)
        return;
    m_headersSent = true;
    m_ended = true;
    write(HttpWriter::response(status, body, contentType, headers));
    if (m_socket)
        m_socket->flush();
    emit completed();
}
