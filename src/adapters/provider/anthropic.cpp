#include "anthropic.h"
#include "provider_common.h"
#include <QJsonArray>
#include <QJsonDocument>

namespace {

BinaryRef imageSource(const QJsonObject& source)
{
    if (source.value(QStringLiteral("type")).toString() == QStringLiteral("url"))
        return provider_common::binaryFromUrl(source.value(QStringLiteral("url")).toString());

    BinaryRef ref;
    ref.mimeType = source.value(QStringLiteral("media_type")).toString();
    ref.data = QByteArray::fromBase64(source.value(QStringLiteral("data")).toString().toLatin1());
    return ref;
}

}

AnthropicAdapter::AnthropicAdapter(const QString& baseUrl)
    : m_baseUrl(baseUrl)
{
}

QString AnthropicAdapter::providerId() const
{
    return QStringLiteral("anthropic");
}

bool AnthropicAdapter::isStreaming(const InboundRequest& request) const
{
    const QJsonDocument doc = QJsonDocument::fromJson(request.body);
    return doc.isObject() && doc.object().value(QStringLiteral("stream")).toBool(false);
}

Result<ProviderRequest> AnthropicAdapter::buildUpstreamRequest(const InboundRequest& request,
                                                               const Credential& credential)
{
    ProviderRequest req;
    req.method = request.method;
    req.url = provider_common::joinUrl(m_baseUrl, request.path, request.query);
    req.headers = provider_common::forwardHeaders(request.headers,
                                                  QStringLiteral("x-api-key"),
                                                  credential.upstreamKey);
    req.body = request.body;
    req.stream = isStreaming(request);
    return req;
}

Result<QList<CanonicalMessage>> AnthropicAdapter::requestMessages(const QJsonObject& body) const
{
    QList<CanonicalMessage> out;

    const QJsonValue system = body.value(QStringLiteral("system"));
    if (system.isString() || system.isArray()) {
        CanonicalMessage sys;
        sys.role = Role::System;
        if (system.isString()) {
            sys.content.append(ContentPart::fromText(system.toString()));
        } else {
            for (const QJsonValue& block : system.toArray())
                sys.content.append(ContentPart::fromText(
                    block.toObject().value(QStringLiteral("text")).toString()));
        }
        out.append(sys);
    }

    for (const QJsonValue& value : body.value(QStringLiteral("messages")).toArray()) {
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
        QList<CanonicalMessage> toolResults;

        const QJsonValue content = msg.value(QStringLiteral("content"));
        if (content.isString()) {
            message.content.append(ContentPart::fromText(content.toString()));
        }
        for (const QJsonValue& blockValue : content.toArray()) {
            const QJsonObject block = blockValue.toObject();
            const QString type = block.value(QStringLiteral("type")).toString();
            if (type == QStringLiteral("text")) {
                message.content.append(ContentPart::fromText(block.value(QStringLiteral("text")).toString()));
            } else if (type == QStringLiteral("image")) {
                message.content.append(ContentPart::fromBinary(
                    imageSource(block.value(QStringLiteral("source")).toObject())));
            } else if (type == QStringLiteral("tool_use")) {
                ToolCall call;
                call.id = block.value(QStringLiteral("id")).toString();
                call.name = block.value(QStringLiteral("name")).toString();
                call.arguments = provider_common::compactJson(block.value(QStringLiteral("input")));
                message.content.append(ContentPart::fromToolCall(call));
            } else if (type == QStringLiteral("tool_result")) {
                // Tool results travel inside a user turn; they become tool messages
                CanonicalMessage result;
                result.role = Role::Tool;
                result.content.append(ContentPart::fromToolResult(
                    block.value(QStringLiteral("tool_use_id")).toString(),
                    block.value(QStringLiteral("content"))));
                toolResults.append(result);
            }
        }

        for (CanonicalMessage& result : toolResults) {
            result.index = out.size();
            out.append(result);
        }
        if (!message.content.isEmpty() || toolResults.isEmpty()) {
            message.index = out.size();
            out.append(message);
        }
    }

    for (int i = 0; i < out.size(); ++i)
        out[i].index = i;
    return out;
}

// ---------------------------------------------------------------------------
// Response side
// ---------------------------------------------------------------------------

std::optional<PartDelta> AnthropicAdapter::blockDelta(const QJsonObject& block, int slot,
                                                      bool streaming)
{
    const QString type = block.value(QStringLiteral("type")).toString();
    if (type == QStringLiteral("text")) {
        return PartDelta::textDelta(block.value(QStringLiteral("text")).toString(), slot);
    }
    if (type == QStringLiteral("tool_use")) {
        // A streamed block opens with an empty input and fills it via input_json_delta
        const QJsonObject input = block.value(QStringLiteral("input")).toObject();
        const QByteArray args = (streaming && input.isEmpty())
            ? QByteArray()
            : provider_common::compactJson(input);
        return PartDelta::toolCallDelta(slot,
                                        block.value(QStringLiteral("id")).toString(),
                                        block.value(QStringLiteral("name")).toString(),
                                        args);
    }
    // thinking and redacted_thinking blocks are not part of the canonical message
    return std::nullopt;
}

Result<QList<StreamFrame>> AnthropicAdapter::parseStreamChunk(const WireUnit& unit)
{
    QList<StreamFrame> frames;
    if (unit.data.trimmed().isEmpty()) {
        return frames;
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(unit.data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(provider_common::malformedUpstream(
            providerId(), err.errorString(), unit.data));
    }

    const QJsonObject root = doc.object();
    QString type = root.value(QStringLiteral("type")).toString();
    if (type.isEmpty())
        type = unit.event;

    StreamFrame frame;

    if (type == QStringLiteral("message_start")) {
        const QJsonObject message = root.value(QStringLiteral("message")).toObject();
        frame.role = roleFromName(message.value(QStringLiteral("role")).toString());
        if (!frame.role)
            frame.role = Role::Assistant;
    } else if (type == QStringLiteral("content_block_start")) {
        const int slot = root.value(QStringLiteral("index")).toInt();
        auto delta = blockDelta(root.value(QStringLiteral("content_block")).toObject(), slot, true);
        if (delta)
            frame.deltas.append(*delta);
    } else if (type == QStringLiteral("content_block_delta")) {
        const int slot = root.value(QStringLiteral("index")).toInt();
        const QJsonObject delta = root.value(QStringLiteral("delta")).toObject();
        const QString deltaType = delta.value(QStringLiteral("type")).toString();
        if (deltaType == QStringLiteral("text_delta")) {
            frame.deltas.append(PartDelta::textDelta(
                delta.value(QStringLiteral("text")).toString(), slot));
        } else if (deltaType == QStringLiteral("input_json_delta")) {
            frame.deltas.append(PartDelta::toolCallDelta(
                slot, QString(), QString(),
                delta.value(QStringLiteral("partial_json")).toString().toUtf8()));
        }
    } else if (type == QStringLiteral("message_delta")) {
        frame.stopReason = root.value(QStringLiteral("delta")).toObject()
                               .value(QStringLiteral("stop_reason")).toString();
    } else if (type == QStringLiteral("message_stop")) {
        frame.messageComplete = true;
        frame.streamEnd = true;
    } else if (type == QStringLiteral("error")) {
        return std::unexpected(DomainFailure::upstream(
            502, unit.data, root.value(QStringLiteral("error")).toObject()
                                .value(QStringLiteral("message")).toString()));
    } else {
        // ping, content_block_stop
        return frames;
    }

    frames.append(frame);
    return frames;
}

bool AnthropicAdapter::isMessageComplete(const StreamFrame& frame) const
{
    // message_delta already names the stop reason; the message ends at message_stop
    return frame.messageComplete;
}

Result<QList<StreamFrame>> AnthropicAdapter::parseResponse(const QByteArray& body)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(provider_common::malformedUpstream(
            providerId(), err.errorString(), body));
    }

    const QJsonObject root = doc.object();
    StreamFrame frame;
    frame.role = roleFromName(root.value(QStringLiteral("role")).toString());
    if (!frame.role)
        frame.role = Role::Assistant;

    const QJsonArray content = root.value(QStringLiteral("content")).toArray();
    for (int i = 0; i < content.size(); ++i) {
        auto delta = blockDelta(content.at(i).toObject(), i, false);
        if (delta)
            frame.deltas.append(*delta);
    }
    frame.stopReason = root.value(QStringLiteral("stop_reason")).toString();
    frame.messageComplete = true;
    return QList<StreamFrame>{frame};
}
