#include "openai.h"
#include "provider_common.h"
#include <QJsonArray>
#include <QJsonDocument>

OpenAIAdapter::OpenAIAdapter(const QString& baseUrl)
    : m_baseUrl(baseUrl)
{
}

QString OpenAIAdapter::providerId() const
{
    return QStringLiteral("openai");
}

bool OpenAIAdapter::isStreaming(const InboundRequest& request) const
{
    const QJsonDocument doc = QJsonDocument::fromJson(request.body);
    return doc.isObject() && doc.object().value(QStringLiteral("stream")).toBool(false);
}

Result<ProviderRequest> OpenAIAdapter::buildUpstreamRequest(const InboundRequest& request,
                                                            const Credential& credential)
{
    QString auth = credential.upstreamKey;
    if (!auth.startsWith(QStringLiteral("Bearer "), Qt::CaseInsensitive))
        auth.prepend(QStringLiteral("Bearer "));

    ProviderRequest req;
    req.method = request.method;
    req.url = provider_common::joinUrl(m_baseUrl, request.path, request.query);
    req.headers = provider_common::forwardHeaders(request.headers,
                                                  QStringLiteral("authorization"), auth);
    req.body = request.body;
    req.stream = isStreaming(request);
    return req;
}

QList<ContentPart> OpenAIAdapter::parseContent(const QJsonValue& content) const
{
    QList<ContentPart> parts;
    if (content.isString()) {
        if (!content.toString().isEmpty())
            parts.append(ContentPart::fromText(content.toString()));
        return parts;
    }

    for (const QJsonValue& item : content.toArray()) {
        const QJsonObject obj = item.toObject();
        const QString type = obj.value(QStringLiteral("type")).toString();
        if (type == QStringLiteral("text")) {
            parts.append(ContentPart::fromText(obj.value(QStringLiteral("text")).toString()));
        } else if (type == QStringLiteral("image_url")) {
            const QJsonValue url = obj.value(QStringLiteral("image_url"));
            const QString href = url.isObject()
                ? url.toObject().value(QStringLiteral("url")).toString()
                : url.toString();
            parts.append(ContentPart::fromBinary(provider_common::binaryFromUrl(href)));
        } else if (type == QStringLiteral("input_audio")) {
            const QJsonObject audio = obj.value(QStringLiteral("input_audio")).toObject();
            BinaryRef ref;
            ref.mimeType = QStringLiteral("audio/") + audio.value(QStringLiteral("format")).toString();
            ref.data = QByteArray::fromBase64(audio.value(QStringLiteral("data")).toString().toLatin1());
            parts.append(ContentPart::fromBinary(ref));
        }
    }
    return parts;
}

Result<QList<CanonicalMessage>> OpenAIAdapter::requestMessages(const QJsonObject& body) const
{
    QList<CanonicalMessage> out;
    const QJsonArray messages = body.value(QStringLiteral("messages")).toArray();

    for (const QJsonValue& value : messages) {
        const QJsonObject msg = value.toObject();
        const auto role = roleFromName(msg.value(QStringLiteral("role")).toString());
        if (!role) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("invalid_role"),
                QStringLiteral("Unknown message role '%1'")
                    .arg(msg.value(QStringLiteral("role")).toString())));
        }

        CanonicalMessage message;
        message.role = *role;
        message.index = out.size();

        if (*role == Role::Tool) {
            message.content.append(ContentPart::fromToolResult(
                msg.value(QStringLiteral("tool_call_id")).toString(),
                msg.value(QStringLiteral("content"))));
            out.append(message);
            continue;
        }

        message.content = parseContent(msg.value(QStringLiteral("content")));
        for (const QJsonValue& tc : msg.value(QStringLiteral("tool_calls")).toArray()) {
            const QJsonObject call = tc.toObject();
            const QJsonObject fn = call.value(QStringLiteral("function")).toObject();
            ToolCall toolCall;
            toolCall.id = call.value(QStringLiteral("id")).toString();
            toolCall.name = fn.value(QStringLiteral("name")).toString();
            toolCall.arguments = fn.value(QStringLiteral("arguments")).toString().toUtf8();
            message.content.append(ContentPart::fromToolCall(toolCall));
        }
        out.append(message);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Response side
// ---------------------------------------------------------------------------

StreamFrame OpenAIAdapter::parseChoice(const QJsonObject& choice, const QString& key) const
{
    StreamFrame frame;
    frame.candidateIndex = choice.value(QStringLiteral("index")).toInt();

    const QJsonObject delta = choice.value(key).toObject();
    if (delta.contains(QStringLiteral("role"))) {
        frame.role = roleFromName(delta.value(QStringLiteral("role")).toString());
    }

    const QString text = delta.value(QStringLiteral("content")).toString();
    if (!text.isEmpty()) {
        frame.deltas.append(PartDelta::textDelta(text, 0));
    }

    const QJsonArray toolCalls = delta.value(QStringLiteral("tool_calls")).toArray();
    for (int i = 0; i < toolCalls.size(); ++i) {
        const QJsonObject call = toolCalls.at(i).toObject();
        const QJsonObject fn = call.value(QStringLiteral("function")).toObject();
        // Streamed fragments carry an index; a full message lists calls in order
        const int toolIndex = call.value(QStringLiteral("index")).toInt(i);
        frame.deltas.append(PartDelta::toolCallDelta(
            kToolSlotBase + toolIndex,
            call.value(QStringLiteral("id")).toString(),
            fn.value(QStringLiteral("name")).toString(),
            fn.value(QStringLiteral("arguments")).toString().toUtf8()));
    }

    const QJsonValue finish = choice.value(QStringLiteral("finish_reason"));
    if (finish.isString() && !finish.toString().isEmpty()) {
        frame.stopReason = finish.toString();
        frame.messageComplete = true;
    }
    return frame;
}

Result<QList<StreamFrame>> OpenAIAdapter::parseStreamChunk(const WireUnit& unit)
{
    QList<StreamFrame> frames;
    const QByteArray data = unit.data.trimmed();
    if (data.isEmpty()) {
        return frames;
    }

    if (data == "[DONE]") {
        StreamFrame frame;
        frame.streamEnd = true;
        frames.append(frame);
        return frames;
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(provider_common::malformedUpstream(
            providerId(), err.errorString(), data));
    }

    const QJsonObject root = doc.object();
    if (root.contains(QStringLiteral("error"))) {
        return std::unexpected(DomainFailure::upstream(
            502, data, root.value(QStringLiteral("error")).toObject()
                           .value(QStringLiteral("message")).toString()));
    }

    // Usage-only chunks have an empty choices array
    for (const QJsonValue& choice : root.value(QStringLiteral("choices")).toArray()) {
        frames.append(parseChoice(choice.toObject(), QStringLiteral("delta")));
    }
    return frames;
}

bool OpenAIAdapter::isMessageComplete(const StreamFrame& frame) const
{
    return frame.messageComplete;
}

Result<QList<StreamFrame>> OpenAIAdapter::parseResponse(const QByteArray& body)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(provider_common::malformedUpstream(
            providerId(), err.errorString(), body));
    }

    QList<StreamFrame> frames;
    for (const QJsonValue& choice : doc.object().value(QStringLiteral("choices")).toArray()) {
        StreamFrame frame = parseChoice(choice.toObject(), QStringLiteral("message"));
        frame.messageComplete = true;
        frames.append(frame);
    }
    return frames;
}
