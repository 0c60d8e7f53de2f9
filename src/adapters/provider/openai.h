#pragma once
#include "semantic/ports.h"

class OpenAIAdapter : public IProviderAdapter {
public:
    explicit OpenAIAdapter(const QString& baseUrl = QStringLiteral("https://api.openai.com/v1"));
    ~OpenAIAdapter() override = default;

    QString providerId() const override;
    ProviderFamily family() const override { return ProviderFamily::OpenAI; }

    bool isStreaming(const InboundRequest& request) const override;
    WireFormat streamFormat(const InboundRequest&) const override { return WireFormat::Sse; }

    Result<ProviderRequest> buildUpstreamRequest(
        const InboundRequest& request, const Credential& credential) override;
    Result<QList<CanonicalMessage>> requestMessages(const QJsonObject& body) const override;

    Result<QList<StreamFrame>> parseStreamChunk(const WireUnit& unit) override;
    bool isMessageComplete(const StreamFrame& frame) const override;
    Result<QList<StreamFrame>> parseResponse(const QByteArray& body) override;

protected:
    // Text occupies slot 0, tool call j occupies slot j + 1
    static constexpr int kToolSlotBase = 1;

    QList<ContentPart> parseContent(const QJsonValue& content) const;
    StreamFrame parseChoice(const QJsonObject& choice, const QString& key) const;

private:
    QString m_baseUrl;
};
