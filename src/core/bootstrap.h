#pragma once
#include "config/config_types.h"
#include "guardrails/policy.h"
#include <QObject>
#include <memory>

class QFileSystemWatcher;
class QNetworkAccessManager;
class ExplorerClient;
class GuardrailsClient;
class GuardrailsEngine;
class McpBridge;
class PolicyLoader;
class ProviderRegistry;
class ProxyServer;
class QtExecutor;
class SessionRegistry;
class StdioBridge;
struct StdioOptions;

// Builds the object graph for one process: clients of the external store,
// the policy cache, the provider adapters and either the HTTP server or the
// stdio bridge.
class Bootstrap : public QObject {
    Q_OBJECT

public:
    explicit Bootstrap(const GatewayConfig& config, QObject* parent = nullptr);
    ~Bootstrap() override;

    bool startServer();
    StdioBridge* startStdio(const StdioOptions& options);
    void stopAll();

    bool isProxyRunning() const;
    QList<PolicySource> baseSources() const;

    GuardrailsEngine* guardrails() const { return m_guardrails; }
    SessionRegistry* sessions() const { return m_sessions; }
    ProxyServer* proxy() const { return m_proxy; }

signals:
    void stepProgress(const QString& step, bool success, const QString& message);
    void proxyStatusChanged(bool running);

private:
    void watchGuardrailsFile();

    GatewayConfig m_config;
    QNetworkAccessManager* m_nam;
    ExplorerClient* m_explorer;
    GuardrailsClient* m_guardrailsClient;
    std::unique_ptr<PolicyLoader> m_loader;
    GuardrailsEngine* m_guardrails;
    std::unique_ptr<ProviderRegistry> m_providers;
    std::unique_ptr<QtExecutor> m_executor;
    SessionRegistry* m_sessions;
    McpBridge* m_mcp = nullptr;
    ProxyServer* m_proxy = nullptr;
    QFileSystemWatcher* m_watcher = nullptr;
};
