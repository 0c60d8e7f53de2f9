#pragma once
#include "semantic/result.h"
#include <QJsonArray>
#include <QJsonObject>

struct JsonRpcMessage {
    QJsonObject object;

    QString method() const { return object.value(QStringLiteral("method")).toString(); }
    QJsonValue id() const { return object.value(QStringLiteral("id")); }
    bool hasId() const { return object.contains(QStringLiteral("id")) && !id().isNull(); }
    QJsonObject params() const { return object.value(QStringLiteral("params")).toObject(); }
    QJsonObject result() const { return object.value(QStringLiteral("result")).toObject(); }

    bool isRequest() const { return !method().isEmpty() && hasId(); }
    bool isNotification() const { return !method().isEmpty() && !hasId(); }
    bool isResponse() const {
        return method().isEmpty() && hasId()
               && (object.contains(QStringLiteral("result")) || object.contains(QStringLiteral("error")));
    }
};

class JsonRpc {
public:
    static const QString kToolCall;
    static const QString kListTools;
    static const QString kInitialize;
    static constexpr int kBlockedErrorCode = -32600;

    // A single message or a batch array
    static Result<QList<JsonRpcMessage>> parse(const QByteArray& body, bool* isBatch = nullptr);
    static QByteArray serialize(const QList<QJsonObject>& messages, bool asBatch);

    // Map key for an id: numbers and strings that print the same stay distinct
    static QString idKey(const QJsonValue& id);
    static QString toolCallId(const QJsonValue& id);

    static QJsonObject blockedToolCallError(const QJsonValue& id, const QString& details);
};
