#include "bootstrap.h"
#include "log_manager.h"
#include "adapters/executor/qt_executor.h"
#include "adapters/provider/provider_registry.h"
#include "guardrails/guardrails_client.h"
#include "guardrails/guardrails_engine.h"
#include "guardrails/policy_loader.h"
#include "mcp/mcp_bridge.h"
#include "mcp/session_registry.h"
#include "mcp/stdio_bridge.h"
#include "proxy/proxy_server.h"
#include "trace/explorer_client.h"
#include <QFileSystemWatcher>
#include <QNetworkAccessManager>

Bootstrap::Bootstrap(const GatewayConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_nam(new QNetworkAccessManager(this))
    , m_explorer(new ExplorerClient(m_nam, config.explorer.apiUrl, this))
    , m_guardrailsClient(new GuardrailsClient(m_nam, config.guardrailsUrl(), this))
    , m_loader(std::make_unique<PolicyLoader>(m_guardrailsClient, m_explorer, config.explorer.apiKey))
    , m_guardrails(new GuardrailsEngine(m_loader.get(), this))
    , m_providers(std::make_unique<ProviderRegistry>())
    , m_executor(std::make_unique<QtExecutor>(m_nam))
    , m_sessions(new SessionRegistry(m_explorer, m_guardrails, this))
{
    m_providers->registerDefaults(config.providerBaseUrls);

    connect(m_guardrails, &GuardrailsEngine::policyLoaded, this, [](const QString& key) {
        LOG_INFO(QStringLiteral("Guardrails: loaded %1").arg(key));
    });
    connect(m_guardrails, &GuardrailsEngine::policyLoadFailed, this,
            [](const QString& key, const DomainFailure& failure) {
        LOG_WARNING(QStringLiteral("Guardrails: %1 failed to load: %2").arg(key, failure.message));
    });

    if (config.runtime.devMode)
        watchGuardrailsFile();
}

Bootstrap::~Bootstrap()
{
    stopAll();
}

QList<PolicySource> Bootstrap::baseSources() const
{
    QList<PolicySource> sources;
    if (!m_config.guardrailsFile.isEmpty())
        sources.append({PolicySource::Kind::File, m_config.guardrailsFile});
    return sources;
}

bool Bootstrap::isProxyRunning() const
{
    return m_proxy && m_proxy->isRunning();
}

// Dev mode: edits to the guardrails file take effect on the next request
void Bootstrap::watchGuardrailsFile()
{
    if (m_config.guardrailsFile.isEmpty())
        return;
    m_watcher = new QFileSystemWatcher(this);
    m_watcher->addPath(m_config.guardrailsFile);
    const QString key = PolicySource{PolicySource::Kind::File, m_config.guardrailsFile}.key();
    connect(m_watcher, &QFileSystemWatcher::fileChanged, this, [this, key](const QString& path) {
        LOG_INFO(QStringLiteral("Guardrails file changed, reloading: %1").arg(path));
        m_guardrails->invalidate(key);
        // Editors that replace the file drop it from the watch list
        if (!m_watcher->files().contains(path))
            m_watcher->addPath(path);
    });
}

bool Bootstrap::startServer()
{
    LOG_INFO(QStringLiteral("========== starting gateway =========="));
    LOG_INFO(QStringLiteral("[1/2] wiring (explorer %1, guardrails %2, providers %3)")
                 .arg(m_config.explorer.apiUrl, m_config.guardrailsUrl(),
                      m_providers->providers().join(QStringLiteral(", "))));

    McpBridgeDeps mcpDeps;
    mcpDeps.executor = m_executor.get();
    mcpDeps.registry = m_sessions;
    mcpDeps.runtime = m_config.runtime;
    mcpDeps.defaultToken = m_config.explorer.apiKey;
    mcpDeps.baseSources = baseSources();
    m_mcp = new McpBridge(mcpDeps, this);

    ProxyServerDeps proxyDeps;
    proxyDeps.providers = m_providers.get();
    proxyDeps.executor = m_executor.get();
    proxyDeps.traceStore = m_explorer;
    proxyDeps.guardrails = m_guardrails;
    proxyDeps.mcp = m_mcp;
    proxyDeps.baseSources = baseSources();
    m_proxy = new ProxyServer(proxyDeps, this);
    connect(m_proxy, &ProxyServer::statusChanged, this, &Bootstrap::proxyStatusChanged);
    emit stepProgress(QStringLiteral("wire"), true, QStringLiteral("components ready"));

    LOG_INFO(QStringLiteral("[2/2] listening on port %1...").arg(m_config.runtime.listenPort));
    if (ProxyServer::isPortInUse(m_config.runtime.listenPort)) {
        emit stepProgress(QStringLiteral("listen"), false,
                          QStringLiteral("port %1 is in use").arg(m_config.runtime.listenPort));
        return false;
    }
    if (!m_proxy->start(m_config.runtime)) {
        emit stepProgress(QStringLiteral("listen"), false, QStringLiteral("failed to listen"));
        return false;
    }
    emit stepProgress(QStringLiteral("listen"), true,
                      QStringLiteral("listening on %1").arg(m_proxy->serverPort()));
    LOG_INFO(QStringLiteral("========== gateway running =========="));
    return true;
}

StdioBridge* Bootstrap::startStdio(const StdioOptions& options)
{
    McpSessionOptions sessionOptions;
    sessionOptions.sessionId = SessionRegistry::generateStatelessId();
    sessionOptions.transport = TransportKind::McpStdio;
    sessionOptions.project = options.project;
    sessionOptions.pushExplorer = options.pushExplorer;
    sessionOptions.token = m_config.explorer.apiKey;
    sessionOptions.policySources = baseSources();
    if (!sessionOptions.token.isEmpty())
        sessionOptions.policySources.append({PolicySource::Kind::Project, options.project});

    auto* bridge = new StdioBridge(options, sessionOptions, m_explorer, m_guardrails, this);
    if (!bridge->start()) {
        delete bridge;
        return nullptr;
    }
    return bridge;
}

void Bootstrap::stopAll()
{
    m_sessions->closeAll();
    if (m_proxy)
        m_proxy->stop();
}
