#include "gemini.h"
#include "provider_common.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QUrlQuery>

GeminiAdapter::GeminiAdapter(const QString& baseUrl)
    : m_baseUrl(baseUrl)
{
}

QString GeminiAdapter::providerId() const
{
    return QStringLiteral("gemini");
}

bool GeminiAdapter::isStreaming(const InboundRequest& request) const
{
    return request.path.contains(QStringLiteral(":streamGenerateContent"));
}

WireFormat GeminiAdapter::streamFormat(const InboundRequest& request) const
{
    const QUrlQuery query(request.query);
    return query.queryItemValue(QStringLiteral("alt")) == QStringLiteral("sse")
        ? WireFormat::Sse
        : WireFormat::JsonLines;
}

Result<ProviderRequest> GeminiAdapter::buildUpstreamRequest(const InboundRequest& request,
                                                            const Credential& credential)
{
    // The key may have come in as ?key=; it travels upstream only as a header
    QUrlQuery query(request.query);
    query.removeAllQueryItems(QStringLiteral("key"));

    ProviderRequest req;
    req.method = request.method;
    req.url = provider_common::joinUrl(m_baseUrl, request.path,
                                       query.toString(QUrl::FullyEncoded));
    req.headers = provider_common::forwardHeaders(request.headers,
                                                  QStringLiteral("x-goog-api-key"),
                                                  credential.upstreamKey);
    req.body = request.body;
    req.stream = isStreaming(request);
    return req;
}

Result<QList<CanonicalMessage>> GeminiAdapter::requestMessages(const QJsonObject& body) const
{
    QList<CanonicalMessage> out;

    const QJsonObject system = body.value(QStringLiteral("systemInstruction")).toObject();
    if (!system.isEmpty()) {
        CanonicalMessage sys;
        sys.role = Role::System;
        for (const QJsonValue& part : system.value(QStringLiteral("parts")).toArray())
            sys.content.append(ContentPart::fromText(part.toObject().value(QStringLiteral("text")).toString()));
        out.append(sys);
    }

    for (const QJsonValue& value : body.value(QStringLiteral("contents")).toArray()) {
        const QJsonObject entry = value.toObject();
        const QString roleText = entry.value(QStringLiteral("role")).toString(QStringLiteral("user"));
        const auto role = roleFromName(roleText);
        if (!role) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("invalid_role"),
                QStringLiteral("Unknown content role '%1'").arg(roleText)));
        }

        CanonicalMessage message;
        message.role = *role;
        QList<CanonicalMessage> toolResults;

        for (const QJsonValue& partValue : entry.value(QStringLiteral("parts")).toArray()) {
            const QJsonObject part = partValue.toObject();
            if (part.contains(QStringLiteral("text"))) {
                message.content.append(ContentPart::fromText(part.value(QStringLiteral("text")).toString()));
            } else if (part.contains(QStringLiteral("inlineData"))) {
                const QJsonObject data = part.value(QStringLiteral("inlineData")).toObject();
                BinaryRef ref;
                ref.mimeType = data.value(QStringLiteral("mimeType")).toString();
                ref.data = QByteArray::fromBase64(data.value(QStringLiteral("data")).toString().toLatin1());
                message.content.append(ContentPart::fromBinary(ref));
            } else if (part.contains(QStringLiteral("functionCall"))) {
                const QJsonObject fc = part.value(QStringLiteral("functionCall")).toObject();
                ToolCall call;
                call.id = fc.value(QStringLiteral("id")).toString();
                call.name = fc.value(QStringLiteral("name")).toString();
                call.arguments = provider_common::compactJson(fc.value(QStringLiteral("args")));
                message.content.append(ContentPart::fromToolCall(call));
            } else if (part.contains(QStringLiteral("functionResponse"))) {
                const QJsonObject fr = part.value(QStringLiteral("functionResponse")).toObject();
                QString callId = fr.value(QStringLiteral("id")).toString();
                if (callId.isEmpty())
                    callId = fr.value(QStringLiteral("name")).toString();
                CanonicalMessage result;
                result.role = Role::Tool;
                result.content.append(ContentPart::fromToolResult(
                    callId, fr.value(QStringLiteral("response"))));
                toolResults.append(result);
            }
        }

        if (!message.content.isEmpty() || toolResults.isEmpty())
            out.append(message);
        out.append(toolResults);
    }

    for (int i = 0; i < out.size(); ++i)
        out[i].index = i;
    return out;
}

// ---------------------------------------------------------------------------
// Response side
// ---------------------------------------------------------------------------

Result<QList<StreamFrame>> GeminiAdapter::parseObject(const QJsonObject& root,
                                                      const QByteArray& raw) const
{
    if (root.contains(QStringLiteral("error"))) {
        return std::unexpected(DomainFailure::upstream(
            502, raw, root.value(QStringLiteral("error")).toObject()
                          .value(QStringLiteral("message")).toString()));
    }

    QList<StreamFrame> frames;
    const QJsonArray candidates = root.value(QStringLiteral("candidates")).toArray();
    for (int i = 0; i < candidates.size(); ++i) {
        const QJsonObject candidate = candidates.at(i).toObject();
        const QJsonObject content = candidate.value(QStringLiteral("content")).toObject();

        StreamFrame frame;
        frame.candidateIndex = candidate.value(QStringLiteral("index")).toInt(i);
        if (content.contains(QStringLiteral("role")))
            frame.role = roleFromName(content.value(QStringLiteral("role")).toString());

        // Gemini parts carry no index; each one follows the previous
        for (const QJsonValue& partValue : content.value(QStringLiteral("parts")).toArray()) {
            const QJsonObject part = partValue.toObject();
            if (part.value(QStringLiteral("thought")).toBool(false))
                continue;
            if (part.contains(QStringLiteral("text"))) {
                frame.deltas.append(PartDelta::textDelta(part.value(QStringLiteral("text")).toString()));
            } else if (part.contains(QStringLiteral("functionCall"))) {
                const QJsonObject fc = part.value(QStringLiteral("functionCall")).toObject();
                frame.deltas.append(PartDelta::toolCallDelta(
                    -1,
                    fc.value(QStringLiteral("id")).toString(),
                    fc.value(QStringLiteral("name")).toString(),
                    provider_common::compactJson(fc.value(QStringLiteral("args")))));
            } else if (part.contains(QStringLiteral("inlineData"))) {
                const QJsonObject data = part.value(QStringLiteral("inlineData")).toObject();
                BinaryRef ref;
                ref.mimeType = data.value(QStringLiteral("mimeType")).toString();
                ref.data = QByteArray::fromBase64(data.value(QStringLiteral("data")).toString().toLatin1());
                frame.deltas.append(PartDelta::binaryDelta(ref));
            }
        }

        const QString finish = candidate.value(QStringLiteral("finishReason")).toString();
        if (!finish.isEmpty()) {
            frame.stopReason = finish;
            frame.messageComplete = true;
        }
        frames.append(frame);
    }
    return frames;
}

Result<QList<StreamFrame>> GeminiAdapter::parseStreamChunk(const WireUnit& unit)
{
    if (unit.data.trimmed().isEmpty()) {
        return QList<StreamFrame>{};
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(unit.data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(provider_common::malformedUpstream(
            providerId(), err.errorString(), unit.data));
    }
    return parseObject(doc.object(), unit.data);
}

bool GeminiAdapter::isMessageComplete(const StreamFrame& frame) const
{
    return frame.messageComplete;
}

Result<QList<StreamFrame>> GeminiAdapter::parseResponse(const QByteArray& body)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError) {
        return std::unexpected(provider_common::malformedUpstream(
            providerId(), err.errorString(), body));
    }

    if (doc.isObject()) {
        auto frames = parseObject(doc.object(), body);
        if (frames) {
            for (StreamFrame& frame : *frames)
                frame.messageComplete = true;
        }
        return frames;
    }

    // A buffered streamGenerateContent body is an array of chunks
    QList<StreamFrame> frames;
    for (const QJsonValue& item : doc.array()) {
        auto chunk = parseObject(item.toObject(), body);
        if (!chunk)
            return chunk;
        frames.append(*chunk);
    }
    return frames;
}
