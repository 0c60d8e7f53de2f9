#include "provider_common.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QStringList>

namespace provider_common {

bool isIgnoredHeader(const QString& name)
{
    static const QStringList ignored = {
        QStringLiteral("accept-encoding"),
        QStringLiteral("host"),
        QStringLiteral("invariant-authorization"),
        QStringLiteral("x-forwarded-for"),
        QStringLiteral("x-forwarded-host"),
        QStringLiteral("x-forwarded-port"),
        QStringLiteral("x-forwarded-proto"),
        QStringLiteral("x-forwarded-server"),
        QStringLiteral("x-real-ip"),
        QStringLiteral("content-length"),
        QStringLiteral("connection"),
        QStringLiteral("transfer-encoding"),
        QStringLiteral("keep-alive"),
    };
    return ignored.contains(name.toLower());
}

QMap<QString, QString> forwardHeaders(const QMap<QString, QString>& inbound,
                                      const QString& authHeader,
                                      const QString& authValue)
{
    QMap<QString, QString> out;
    for (auto it = inbound.cbegin(); it != inbound.cend(); ++it) {
        const QString name = it.key().toLower();
        if (isIgnoredHeader(name) || name == authHeader)
            continue;
        out[name] = it.value();
    }
    out[authHeader] = authValue;
    // Compressed bodies cannot be split into units
    out[QStringLiteral("accept-encoding")] = QStringLiteral("identity");
    return out;
}

QString joinUrl(const QString& baseUrl, const QString& path, const QString& query)
{
    QString url = baseUrl;
    while (url.endsWith(QLatin1Char('/')))
        url.chop(1);
    if (!path.startsWith(QLatin1Char('/')))
        url += QLatin1Char('/');
    url += path;
    if (!query.isEmpty())
        url += QLatin1Char('?') + query;
    return url;
}

Result<QJsonObject> parseJsonObject(const QByteArray& body, const QString& what)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_json"),
            QStringLiteral("%1 is not a JSON object: %2").arg(what, err.errorString())));
    }
    return doc.object();
}

DomainFailure malformedUpstream(const QString& provider, const QString& detail,
                                const QByteArray& body)
{
    return DomainFailure::upstream(
        502, body, QStringLiteral("%1 returned a malformed body: %2").arg(provider, detail));
}

QByteArray compactJson(const QJsonValue& value)
{
    if (value.isObject())
        return QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact);
    if (value.isArray())
        return QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact);
    if (value.isString())
        return value.toString().toUtf8();
    return QByteArray();
}

BinaryRef binaryFromUrl(const QString& url)
{
    BinaryRef ref;
    // data:<mime>;base64,<payload>
    if (url.startsWith(QStringLiteral("data:"))) {
        const int comma = url.indexOf(QLatin1Char(','));
        const QString header = url.mid(5, comma - 5);
        ref.mimeType = header.section(QLatin1Char(';'), 0, 0);
        if (header.contains(QStringLiteral(";base64")))
            ref.data = QByteArray::fromBase64(url.mid(comma + 1).toLatin1());
        else
            ref.data = url.mid(comma + 1).toUtf8();
        return ref;
    }
    ref.uri = url;
    return ref;
}

}
