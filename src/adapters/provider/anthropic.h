#pragma once
#include "semantic/ports.h"

class AnthropicAdapter : public IProviderAdapter {
public:
    explicit AnthropicAdapter(const QString& baseUrl = QStringLiteral("https://api.anthropic.com"));
    ~AnthropicAdapter() override = default;

    QString providerId() const override;
    ProviderFamily family() const override { return ProviderFamily::Anthropic; }

    bool isStreaming(const InboundRequest& request) const override;
    WireFormat streamFormat(const InboundRequest&) const override { return WireFormat::Sse; }

    Result<ProviderRequest> buildUpstreamRequest(
        const InboundRequest& request, const Credential& credential) override;
    Result<QList<CanonicalMessage>> requestMessages(const QJsonObject& body) const override;

    Result<QList<StreamFrame>> parseStreamChunk(const WireUnit& unit) override;
    bool isMessageComplete(const StreamFrame& frame) const override;
    Result<QList<StreamFrame>> parseResponse(const QByteArray& body) override;

private:
    QString m_baseUrl;

    static std::optional<PartDelta> blockDelta(const QJsonObject& block, int slot, bool streaming);
};
