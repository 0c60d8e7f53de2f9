#include "jsonrpc.h"
#include <QJsonDocument>

const QString JsonRpc::kToolCall = QStringLiteral("tools/call");
const QString JsonRpc::kListTools = QStringLiteral("tools/list");
const QString JsonRpc::kInitialize = QStringLiteral("initialize");

Result<QList<JsonRpcMessage>> JsonRpc::parse(const QByteArray& body, bool* isBatch)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError) {
        return std::unexpected(DomainFailure::transport(
            QStringLiteral("invalid_jsonrpc"),
            QStringLiteral("MCP message is not valid JSON: %1").arg(err.errorString())));
    }

    QList<JsonRpcMessage> messages;
    if (doc.isObject()) {
        messages.append(JsonRpcMessage{doc.object()});
        if (isBatch)
            *isBatch = false;
        return messages;
    }

    if (doc.isArray()) {
        for (const QJsonValue& v : doc.array()) {
            if (!v.isObject()) {
                return std::unexpected(DomainFailure::transport(
                    QStringLiteral("invalid_jsonrpc"),
                    QStringLiteral("MCP batch holds a non-object entry")));
            }
            messages.append(JsonRpcMessage{v.toObject()});
        }
        if (isBatch)
            *isBatch = true;
        return messages;
    }

    return std::unexpected(DomainFailure::transport(
        QStringLiteral("invalid_jsonrpc"), QStringLiteral("MCP message must be an object or array")));
}

QByteArray JsonRpc::serialize(const QList<QJsonObject>& messages, bool asBatch)
{
    if (!asBatch && messages.size() == 1)
        return QJsonDocument(messages.first()).toJson(QJsonDocument::Compact);
    QJsonArray array;
    for (const QJsonObject& m : messages)
        array.append(m);
    return QJsonDocument(array).toJson(QJsonDocument::Compact);
}

QString JsonRpc::idKey(const QJsonValue& id)
{
    if (id.isString())
        return QStringLiteral("s:") + id.toString();
    if (id.isDouble())
        return QStringLiteral("n:") + QString::number(id.toDouble(), 'g', 17);
    return QString();
}

QString JsonRpc::toolCallId(const QJsonValue& id)
{
    if (id.isDouble())
        return QStringLiteral("call_%1").arg(QString::number(id.toDouble(), 'g', 17));
    return QStringLiteral("call_%1").arg(id.toVariant().toString());
}

QJsonObject JsonRpc::blockedToolCallError(const QJsonValue& id, const QString& details)
{
    QJsonObject error;
    error[QStringLiteral("code")] = kBlockedErrorCode;
    error[QStringLiteral("message")] = QStringLiteral(
        "[Invariant Guardrails] The MCP tool call was blocked for security reasons. "
        "Do not attempt to circumvent this block, rather explain to the user based "
        "on the following output what went wrong: %1").arg(details);

    QJsonObject reply;
    reply[QStringLiteral("jsonrpc")] = QStringLiteral("2.0");
    reply[QStringLiteral("id")] = id;
    reply[QStringLiteral("error")] = error;
    return reply;
}
