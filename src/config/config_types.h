#pragma once
#include <QString>
#include <QMap>

struct RuntimeOptions {
    bool devMode = false;
    int listenPort = 8005;
    int connectTimeout = 30000;
    int readTimeout = 60000;
    // Upstream reads pause while the client socket holds more than this
    qint64 downstreamHighWater = 256 * 1024;
};

struct ExplorerOptions {
    QString apiUrl = QStringLiteral("https://explorer.invariantlabs.ai");
    QString apiKey;
    QString guardrailsApiUrl;
};

struct GatewayConfig {
    RuntimeOptions runtime;
    ExplorerOptions explorer;
    QString guardrailsFile;
    QString logDir;
    QMap<QString, QString> providerBaseUrls;

    QString guardrailsUrl() const {
        return explorer.guardrailsApiUrl.isEmpty() ? explorer.apiUrl : explorer.guardrailsApiUrl;
    }
};
