#include "http_writer.h"

QString HttpWriter::statusText(int status)
{
    static const QMap<int, QString> statusTexts = {
        {200, QStringLiteral("OK")},
        {201, QStringLiteral("Created")},
        {202, QStringLiteral("Accepted")},
        {204, QStringLiteral("No Content")},
        {400, QStringLiteral("Bad Request")},
        {401, QStringLiteral("Unauthorized")},
        {403, QStringLiteral("Forbidden")},
        {404, QStringLiteral("Not Found")},
        {405, QStringLiteral("Method Not Allowed")},
        {413, QStringLiteral("Payload Too Large")},
        {429, QStringLiteral("Too Many Requests")},
        {500, QStringLiteral("Internal Server Error")},
        {501, QStringLiteral("Not Implemented")},
        {502, QStringLiteral("Bad Gateway")},
        {503, QStringLiteral("Service Unavailable")},
        {504, QStringLiteral("Gateway Timeout")}
    };
    return statusTexts.value(status, QStringLiteral("Unknown"));
}

QByteArray HttpWriter::head(int status, const QMap<QString, QString>& headers, bool chunked)
{
    QByteArray out;
    out.append(QStringLiteral("HTTP/1.1 %1 %2\r\n").arg(status).arg(statusText(status)).toUtf8());
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        const QString name = it.key().toLower();
        if (name == QStringLiteral("content-length")
            || name == QStringLiteral("transfer-encoding")
            || name == QStringLiteral("connection"))
            continue;
        out.append(it.key().toUtf8() + ": " + it.value().toUtf8() + "\r\n");
    }
    if (chunked) {
        out.append("Cache-Control: no-cache\r\n");
        out.append("Transfer-Encoding: chunked\r\n");
    }
    out.append("Connection: keep-alive\r\n");
    out.append("\r\n");
    return out;
}

QByteArray HttpWriter::response(int status, const QByteArray& body, const QString& contentType,
                                const QMap<QString, QString>& headers)
{
    QMap<QString, QString> all = headers;
    if (!contentType.isEmpty()) {
        for (const QString& key : headers.keys()) {
            if (key.compare(QStringLiteral("content-type"), Qt::CaseInsensitive) == 0)
                all.remove(key);
        }
        all[QStringLiteral("Content-Type")] = contentType;
    }

    QByteArray out = head(status, all, false);
    // head() ends with the blank line, Content-Length goes before it
    out.chop(2);
    out.append(QStringLiteral("Content-Length: %1\r\n\r\n").arg(body.size()).toUtf8());
    out.append(body);
    return out;
}

QByteArray HttpWriter::wrapChunked(const QByteArray& data)
{
    // <hex-length>\r\n<data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

QByteArray HttpWriter::sseEvent(const QByteArray& data, const QString& event)
{
    QByteArray frame;
    if (!event.isEmpty())
        frame.append("event: " + event.toUtf8() + "\n");
    for (const QByteArray& line : data.split('\n'))
        frame.append("data: " + line + "\n");
    frame.append("\n");
    return frame;
}
