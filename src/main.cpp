#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QStandardPaths>
#include <cstdio>

#include "config/config_store.h"
#include "core/bootstrap.h"
#include "core/log_manager.h"
#include "mcp/stdio_bridge.h"

namespace {

QString resolveLogDir(const GatewayConfig& config)
{
    if (!config.logDir.isEmpty())
        return config.logDir;
    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(dataDir);
    return dataDir + QStringLiteral("/logs");
}

int runStdio(QCoreApplication& app, ConfigStore& configStore, const QStringList& args)
{
    auto options = StdioBridge::parseArguments(args);
    if (!options) {
        std::fprintf(stderr, "%s\n", qPrintable(options.error().message));
        return StdioBridge::kUsageExitCode;
    }

    // stdout carries the protocol
    LogManager::instance().setConsoleEcho(false);

    Bootstrap bootstrap(configStore.config());
    StdioBridge* bridge = bootstrap.startStdio(*options);
    if (!bridge)
        return 1;
    QObject::connect(bridge, &StdioBridge::finished, &app, [&app](int exitCode) {
        app.exit(exitCode);
    });
    return app.exec();
}

int runServer(QCoreApplication& app, ConfigStore& configStore)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Tracing and guardrails gateway for LLM and MCP traffic"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("mode"), QStringLiteral("serve (default) or mcp"));
    QCommandLineOption portOption(QStringList{QStringLiteral("p"), QStringLiteral("port")},
                                  QStringLiteral("Listen port."), QStringLiteral("port"));
    QCommandLineOption devOption(QStringLiteral("dev"),
                                 QStringLiteral("Dev mode: debug logging, guardrails file reload."));
    parser.addOption(portOption);
    parser.addOption(devOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty() && positional.first() != QStringLiteral("serve")) {
        std::fprintf(stderr, "unknown mode '%s'\n", qPrintable(positional.first()));
        return 2;
    }

    if (parser.isSet(portOption)) {
        bool ok = false;
        const int port = parser.value(portOption).toInt(&ok);
        if (!ok) {
            std::fprintf(stderr, "invalid port '%s'\n", qPrintable(parser.value(portOption)));
            return 2;
        }
        configStore.setListenPort(port);
    }
    if (parser.isSet(devOption))
        configStore.setDevMode(true);
    if (configStore.config().runtime.devMode)
        LogManager::instance().setMinimumLevel(LogManager::Debug);

    Bootstrap bootstrap(configStore.config());
    if (!bootstrap.startServer())
        return 1;
    return app.exec();
}

}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("tracegate"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    // --- Config + Log ---
    ConfigStore configStore;
    configStore.loadFromEnvironment();

    const QStringList args = app.arguments();
    const bool stdioMode = args.size() > 1 && args.at(1) == QStringLiteral("mcp");

    LogManager::instance().initialize(resolveLogDir(configStore.config()));
    LogManager::instance().setConsoleEcho(!stdioMode);
    if (configStore.config().runtime.devMode)
        LogManager::instance().setMinimumLevel(LogManager::Debug);
    LOG_INFO(QStringLiteral("tracegate v1.0.0 starting (%1 mode)")
                 .arg(stdioMode ? QStringLiteral("mcp") : QStringLiteral("serve")));

    auto valid = configStore.validate();
    if (!valid) {
        LOG_ERROR(QStringLiteral("Configuration error: %1").arg(valid.error().message));
        std::fprintf(stderr, "%s\n", qPrintable(valid.error().message));
        return 1;
    }

    // Everything after "mcp" is ours to parse; --exec and beyond belongs to the child
    if (stdioMode)
        return runStdio(app, configStore, args.mid(2));
    return runServer(app, configStore);
}
