#pragma once
#include "frame.h"
#include "message.h"
#include "result.h"
#include "credential/credential_extractor.h"
#include <QByteArray>
#include <QJsonObject>
#include <QMap>

// A client request as seen by a provider adapter. Header names are lower-case,
// path is the provider-native path below the adapter base
// (e.g. "/chat/completions" for OpenAI, "/v1/messages" for Anthropic).
struct InboundRequest {
    QString method = QStringLiteral("POST");
    QString path;
    QString query;
    QMap<QString, QString> headers;
    QByteArray body;
};

struct ProviderRequest {
    QString method;
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    bool stream = false;
};

// One framed piece of an upstream body. raw is forwarded verbatim, data is
// what the adapter parses (empty for comments and partial JSON lines).
struct WireUnit {
    QByteArray raw;
    QString event;
    QByteArray data;

    bool hasPayload() const { return !data.isEmpty(); }
};

class IProviderAdapter {
public:
    virtual ~IProviderAdapter() = default;
    virtual QString providerId() const = 0;
    virtual ProviderFamily family() const = 0;

    virtual bool isStreaming(const InboundRequest& request) const = 0;
    virtual WireFormat streamFormat(const InboundRequest& request) const = 0;

    virtual Result<ProviderRequest> buildUpstreamRequest(
        const InboundRequest& request, const Credential& credential) = 0;
    virtual Result<QList<CanonicalMessage>> requestMessages(
        const QJsonObject& body) const = 0;

    virtual Result<QList<StreamFrame>> parseStreamChunk(const WireUnit& unit) = 0;
    virtual bool isMessageComplete(const StreamFrame& frame) const = 0;
    virtual Result<QList<StreamFrame>> parseResponse(const QByteArray& body) = 0;
};
