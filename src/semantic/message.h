#pragma once
#include "types.h"
#include <QString>
#include <QByteArray>
#include <QJsonValue>
#include <QList>
#include <optional>

struct ToolCall {
    QString id;
    QString name;
    QByteArray arguments;

    bool operator==(const ToolCall&) const = default;
};

struct BinaryRef {
    QString mimeType;
    QString uri;
    QByteArray data;

    bool operator==(const BinaryRef&) const = default;
};

struct ContentPart {
    PartKind kind = PartKind::Text;
    QString text;
    ToolCall toolCall;
    QString callId;
    QJsonValue payload;
    BinaryRef binary;

    static ContentPart fromText(const QString& text) {
        ContentPart part;
        part.text = text;
        return part;
    }
    static ContentPart fromToolCall(const ToolCall& call) {
        ContentPart part;
        part.kind = PartKind::ToolCall;
        part.toolCall = call;
        return part;
    }
    static ContentPart fromToolResult(const QString& callId, const QJsonValue& payload) {
        ContentPart part;
        part.kind = PartKind::ToolResult;
        part.callId = callId;
        part.payload = payload;
        return part;
    }
    static ContentPart fromBinary(const BinaryRef& ref) {
        ContentPart part;
        part.kind = PartKind::BinaryRef;
        part.binary = ref;
        return part;
    }

    bool operator==(const ContentPart&) const = default;
};

struct CanonicalMessage {
    Role role = Role::Assistant;
    QList<ContentPart> content;
    int index = 0;

    QString text() const {
        QString out;
        for (const ContentPart& part : content) {
            if (part.kind == PartKind::Text)
                out += part.text;
        }
        return out;
    }

    QList<ToolCall> toolCalls() const {
        QList<ToolCall> calls;
        for (const ContentPart& part : content) {
            if (part.kind == PartKind::ToolCall)
                calls.append(part.toolCall);
        }
        return calls;
    }

    bool operator==(const CanonicalMessage&) const = default;
};

inline QString roleName(Role role) {
    switch (role) {
    case Role::User:      return QStringLiteral("user");
    case Role::System:    return QStringLiteral("system");
    case Role::Tool:      return QStringLiteral("tool");
    case Role::Assistant:
    default:              return QStringLiteral("assistant");
    }
}

inline std::optional<Role> roleFromName(const QString& name) {
    const QString n = name.trimmed().toLower();
    if (n == QStringLiteral("user"))
        return Role::User;
    if (n == QStringLiteral("assistant") || n == QStringLiteral("model"))
        return Role::Assistant;
    if (n == QStringLiteral("system") || n == QStringLiteral("developer"))
        return Role::System;
    if (n == QStringLiteral("tool") || n == QStringLiteral("function"))
        return Role::Tool;
    return std::nullopt;
}
