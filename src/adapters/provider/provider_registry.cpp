#include "provider_registry.h"
#include "openai.h"
#include "anthropic.h"
#include "gemini.h"
#include "core/log_manager.h"

void ProviderRegistry::registerProvider(const QString& providerId, Factory factory)
{
    const QString id = providerId.trimmed().toLower();
    if (id.isEmpty() || !factory) {
        return;
    }
    m_factories[id] = std::move(factory);
}

void ProviderRegistry::registerDefaults(const QMap<QString, QString>& baseUrlOverrides)
{
    const QString openaiUrl = baseUrlOverrides.value(QStringLiteral("openai"),
                                                     QStringLiteral("https://api.openai.com/v1"));
    const QString anthropicUrl = baseUrlOverrides.value(QStringLiteral("anthropic"),
                                                        QStringLiteral("https://api.anthropic.com"));
    const QString geminiUrl = baseUrlOverrides.value(QStringLiteral("gemini"),
                                                     QStringLiteral("https://generativelanguage.googleapis.com"));

    registerProvider(QStringLiteral("openai"), [openaiUrl]() {
        return std::make_unique<OpenAIAdapter>(openaiUrl);
    });
    registerProvider(QStringLiteral("anthropic"), [anthropicUrl]() {
        return std::make_unique<AnthropicAdapter>(anthropicUrl);
    });
    registerProvider(QStringLiteral("gemini"), [geminiUrl]() {
        return std::make_unique<GeminiAdapter>(geminiUrl);
    });

    LOG_INFO(QStringLiteral("ProviderRegistry: registered %1 providers").arg(m_factories.size()));
}

bool ProviderRegistry::contains(const QString& providerId) const
{
    return m_factories.contains(providerId.trimmed().toLower());
}

QStringList ProviderRegistry::providers() const
{
    return m_factories.keys();
}

Result<std::unique_ptr<IProviderAdapter>> ProviderRegistry::create(const QString& providerId) const
{
    const auto it = m_factories.constFind(providerId.trimmed().toLower());
    if (it == m_factories.constEnd()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("unknown_provider"),
            QStringLiteral("Unsupported provider '%1'").arg(providerId)));
    }
    return it.value()();
}
