#include "config_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

namespace {

QString envString(const QProcessEnvironment& env, const char* key, const QString& fallback = QString())
{
    const QString value = env.value(QString::fromUtf8(key)).trimmed();
    return value.isEmpty() ? fallback : value;
}

int envInt(const QProcessEnvironment& env, const char* key, int fallback, int minValue, int maxValue)
{
    const QString raw = env.value(QString::fromUtf8(key)).trimmed();
    if (raw.isEmpty())
        return fallback;

    bool ok = false;
    const int value = raw.toInt(&ok);
    if (!ok) {
        LOG_WARNING(QStringLiteral("ConfigStore: %1='%2' is not a number, using %3")
                        .arg(QString::fromUtf8(key), raw)
                        .arg(fallback));
        return fallback;
    }
    return qBound(minValue, value, maxValue);
}

bool envBool(const QProcessEnvironment& env, const char* key, bool fallback)
{
    const QString raw = env.value(QString::fromUtf8(key)).trimmed().toLower();
    if (raw.isEmpty())
        return fallback;
    return raw == QStringLiteral("1") || raw == QStringLiteral("true")
        || raw == QStringLiteral("yes") || raw == QStringLiteral("on");
}

QString stripTrailingSlash(QString url)
{
    while (url.endsWith(QLatin1Char('/')))
        url.chop(1);
    return url;
}

}

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

void ConfigStore::loadFromEnvironment(const QProcessEnvironment& env)
{
    GatewayConfig cfg;

    cfg.explorer.apiUrl = stripTrailingSlash(envString(env, "INVARIANT_API_URL", cfg.explorer.apiUrl));
    cfg.explorer.apiKey = envString(env, "INVARIANT_API_KEY");
    cfg.explorer.guardrailsApiUrl = stripTrailingSlash(envString(env, "GUARDRAILS_API_URL"));
    cfg.guardrailsFile = envString(env, "GUARDRAILS_FILE_PATH");
    cfg.logDir = envString(env, "LOG_DIR");

    cfg.runtime.devMode = envBool(env, "DEV_MODE", false);
    cfg.runtime.listenPort = envInt(env, "PORT", cfg.runtime.listenPort, 1, 65535);
    cfg.runtime.connectTimeout = envInt(env, "UPSTREAM_CONNECT_TIMEOUT_MS",
                                        cfg.runtime.connectTimeout, 100, 600000);
    cfg.runtime.readTimeout = envInt(env, "UPSTREAM_READ_TIMEOUT_MS",
                                     cfg.runtime.readTimeout, 100, 3600000);

    const QString openai = envString(env, "OPENAI_BASE_URL");
    const QString anthropic = envString(env, "ANTHROPIC_BASE_URL");
    const QString gemini = envString(env, "GEMINI_BASE_URL");
    if (!openai.isEmpty())
        cfg.providerBaseUrls[QStringLiteral("openai")] = stripTrailingSlash(openai);
    if (!anthropic.isEmpty())
        cfg.providerBaseUrls[QStringLiteral("anthropic")] = stripTrailingSlash(anthropic);
    if (!gemini.isEmpty())
        cfg.providerBaseUrls[QStringLiteral("gemini")] = stripTrailingSlash(gemini);

    m_config = cfg;
    emit configChanged();
}

VoidResult ConfigStore::validate() const
{
    if (m_config.guardrailsFile.isEmpty()) {
        return {};
    }

    QFile file(m_config.guardrailsFile);
    if (!QFileInfo(file).isFile() || !file.open(QIODevice::ReadOnly)) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("guardrails_file_unreadable"),
            QStringLiteral("GUARDRAILS_FILE_PATH '%1' is not a readable file")
                .arg(m_config.guardrailsFile)));
    }

    // Rule files evaluate locally; anything else is sent to the guardrails service
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    const bool localRules = doc.isObject() && doc.object().contains(QStringLiteral("rules"));
    if (!localRules && m_config.explorer.apiKey.isEmpty()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_api_key"),
            QStringLiteral("GUARDRAILS_FILE_PATH holds policy text, which requires INVARIANT_API_KEY")));
    }
    return {};
}

void ConfigStore::setListenPort(int port)
{
    m_config.runtime.listenPort = qBound(1, port, 65535);
    emit configChanged();
}

void ConfigStore::setDevMode(bool enabled)
{
    m_config.runtime.devMode = enabled;
    emit configChanged();
}
