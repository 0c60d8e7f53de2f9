#pragma once
#include "semantic/ports.h"

class GeminiAdapter : public IProviderAdapter {
public:
    explicit GeminiAdapter(const QString& baseUrl = QStringLiteral("https://generativelanguage.googleapis.com"));
    ~GeminiAdapter() override = default;

    QString providerId() const override;
    ProviderFamily family() const override { return ProviderFamily::Gemini; }

    bool isStreaming(const InboundRequest& request) const override;
    WireFormat streamFormat(const InboundRequest& request) const override;

    Result<ProviderRequest> buildUpstreamRequest(
        const InboundRequest& request, const Credential& credential) override;
    Result<QList<CanonicalMessage>> requestMessages(const QJsonObject& body) const override;

    Result<QList<StreamFrame>> parseStreamChunk(const WireUnit& unit) override;
    bool isMessageComplete(const StreamFrame& frame) const override;
    Result<QList<StreamFrame>> parseResponse(const QByteArray& body) override;

private:
    QString m_baseUrl;

    Result<QList<StreamFrame>> parseObject(const QJsonObject& root, const QByteArray& raw) const;
};
