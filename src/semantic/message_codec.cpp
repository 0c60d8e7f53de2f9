#include "message_codec.h"
#include <QJsonDocument>

QString MessageCodec::payloadText(const QJsonValue& payload)
{
    if (payload.isString())
        return payload.toString();
    if (payload.isObject())
        return QString::fromUtf8(QJsonDocument(payload.toObject()).toJson(QJsonDocument::Compact));
    if (payload.isArray())
        return QString::fromUtf8(QJsonDocument(payload.toArray()).toJson(QJsonDocument::Compact));
    if (payload.isNull() || payload.isUndefined())
        return QString();
    return payload.toVariant().toString();
}

QString MessageCodec::dataUri(const BinaryRef& ref)
{
    if (!ref.uri.isEmpty())
        return ref.uri;
    return QStringLiteral("data:%1;base64,%2")
        .arg(ref.mimeType, QString::fromLatin1(ref.data.toBase64()));
}

QJsonObject MessageCodec::toJson(const CanonicalMessage& message)
{
    QJsonObject obj;
    obj["role"] = roleName(message.role);

    QJsonArray toolCalls;
    QJsonArray parts;
    QString text;
    bool hasBinary = false;

    for (const ContentPart& part : message.content) {
        switch (part.kind) {
        case PartKind::Text: {
            text += part.text;
            QJsonObject p;
            p["type"] = QStringLiteral("text");
            p["text"] = part.text;
            parts.append(p);
            break;
        }
        case PartKind::BinaryRef: {
            hasBinary = true;
            QJsonObject url;
            url["url"] = dataUri(part.binary);
            QJsonObject p;
            p["type"] = QStringLiteral("image_url");
            p["image_url"] = url;
            parts.append(p);
            break;
        }
        case PartKind::ToolCall: {
            QJsonObject fn;
            fn["name"] = part.toolCall.name;
            fn["arguments"] = QString::fromUtf8(part.toolCall.arguments);
            QJsonObject call;
            call["id"] = part.toolCall.id;
            call["type"] = QStringLiteral("function");
            call["function"] = fn;
            toolCalls.append(call);
            break;
        }
        case PartKind::ToolResult:
            obj["tool_call_id"] = part.callId;
            text += payloadText(part.payload);
            break;
        }
    }

    if (hasBinary) {
        obj["content"] = parts;
    } else if (!text.isEmpty() || toolCalls.isEmpty()) {
        obj["content"] = text;
    }
    if (!toolCalls.isEmpty())
        obj["tool_calls"] = toolCalls;
    return obj;
}

QJsonArray MessageCodec::toJson(const QList<CanonicalMessage>& messages)
{
    QJsonArray out;
    for (const CanonicalMessage& m : messages)
        out.append(toJson(m));
    return out;
}
