#pragma once
#include <QByteArray>
#include <QMap>
#include <QString>

// HTTP/1.1 response framing for the downstream socket
class HttpWriter {
public:
    static QString statusText(int status);

    static QByteArray head(int status, const QMap<QString, QString>& headers, bool chunked);
    static QByteArray response(int status, const QByteArray& body,
                               const QString& contentType = QStringLiteral("application/json"),
                               const QMap<QString, QString>& headers = {});

    static QByteArray wrapChunked(const QByteArray& data);
    static QByteArray terminator() { return QByteArrayLiteral("0\r\n\r\n"); }

    // One SSE event block, "event:" line only when event is set
    static QByteArray sseEvent(const QByteArray& data, const QString& event = QString());
};
