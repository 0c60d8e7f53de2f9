#pragma once
#include "semantic/result.h"
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <functional>

struct TracePushRequest {
    QString projectRef;
    QString traceId;          // empty creates a new trace
    QJsonArray messages;
    QJsonArray annotations;
    QJsonObject metadata;
    QString token;            // gateway token, without the "Bearer " prefix
};

class ITraceStore {
public:
    using PushCallback = std::function<void(Result<QString> traceId)>;

    virtual ~ITraceStore() = default;
    virtual void push(const TracePushRequest& request, PushCallback done) = 0;
};
