#pragma once
#include "message.h"
#include <QJsonArray>
#include <QJsonObject>

// Serializes canonical messages in the OpenAI-compatible shape the trace store
// and the guardrails service read.
class MessageCodec {
public:
    static QJsonObject toJson(const CanonicalMessage& message);
    static QJsonArray toJson(const QList<CanonicalMessage>& messages);

    static QString payloadText(const QJsonValue& payload);
    static QString dataUri(const BinaryRef& ref);
};
