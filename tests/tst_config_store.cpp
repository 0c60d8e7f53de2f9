#include <QTest>
#include <QSignalSpy>
#include <QTemporaryFile>
#include "config/config_store.h"

class TestConfigStore : public QObject {
    Q_OBJECT

private slots:
    void testDefaults() {
        ConfigStore store;
        store.loadFromEnvironment(QProcessEnvironment());
        const GatewayConfig& cfg = store.config();
        QCOMPARE(cfg.runtime.listenPort, 8005);
        QVERIFY(!cfg.runtime.devMode);
        QCOMPARE(cfg.explorer.apiUrl, QStringLiteral("https://explorer.invariantlabs.ai"));
        QCOMPARE(cfg.guardrailsUrl(), cfg.explorer.apiUrl);
        QVERIFY(cfg.providerBaseUrls.isEmpty());
        QVERIFY(store.validate().has_value());
    }

    void testEnvironmentOverrides() {
        QProcessEnvironment env;
        env.insert(QStringLiteral("INVARIANT_API_URL"), QStringLiteral("http://explorer.local/"));
        env.insert(QStringLiteral("GUARDRAILS_API_URL"), QStringLiteral("http://guard.local//"));
        env.insert(QStringLiteral("INVARIANT_API_KEY"), QStringLiteral("inv-key"));
        env.insert(QStringLiteral("PORT"), QStringLiteral("9100"));
        env.insert(QStringLiteral("DEV_MODE"), QStringLiteral("true"));
        env.insert(QStringLiteral("OPENAI_BASE_URL"), QStringLiteral("http://localhost:4000/"));

        ConfigStore store;
        QSignalSpy changed(&store, &ConfigStore::configChanged);
        store.loadFromEnvironment(env);
        QCOMPARE(changed.count(), 1);

        const GatewayConfig& cfg = store.config();
        QCOMPARE(cfg.explorer.apiUrl, QStringLiteral("http://explorer.local"));
        QCOMPARE(cfg.guardrailsUrl(), QStringLiteral("http://guard.local"));
        QCOMPARE(cfg.explorer.apiKey, QStringLiteral("inv-key"));
        QCOMPARE(cfg.runtime.listenPort, 9100);
        QVERIFY(cfg.runtime.devMode);
        QCOMPARE(cfg.providerBaseUrls.value(QStringLiteral("openai")), QStringLiteral("http://localhost:4000"));
    }

    void testBadNumbersFallBack() {
        QProcessEnvironment env;
        env.insert(QStringLiteral("PORT"), QStringLiteral("eighty"));
        env.insert(QStringLiteral("UPSTREAM_READ_TIMEOUT_MS"), QStringLiteral("5"));
        ConfigStore store;
        store.loadFromEnvironment(env);
        QCOMPARE(store.config().runtime.listenPort, 8005);
        QCOMPARE(store.config().runtime.readTimeout, 100);

        store.setListenPort(70000);
        QCOMPARE(store.runtimeConfig().listenPort, 65535);
    }

    void testValidateGuardrailsFile() {
        QProcessEnvironment env;
        env.insert(QStringLiteral("GUARDRAILS_FILE_PATH"), QStringLiteral("/nonexistent/rules.json"));
        ConfigStore missing;
        missing.loadFromEnvironment(env);
        auto result = missing.validate();
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("guardrails_file_unreadable"));

        QTemporaryFile rules;
        QVERIFY(rules.open());
        rules.write(R"({"rules":[{"id":"r","pattern":"x"}]})");
        rules.flush();
        env.insert(QStringLiteral("GUARDRAILS_FILE_PATH"), rules.fileName());
        ConfigStore local;
        local.loadFromEnvironment(env);
        QVERIFY(local.validate().has_value());

        QTemporaryFile text;
        QVERIFY(text.open());
        text.write("raise \"no\" if:\n  (msg: Message)\n");
        text.flush();
        env.insert(QStringLiteral("GUARDRAILS_FILE_PATH"), text.fileName());
        ConfigStore remote;
        remote.loadFromEnvironment(env);
        auto needsKey = remote.validate();
        QVERIFY(!needsKey.has_value());
        QCOMPARE(needsKey.error().code, QStringLiteral("missing_api_key"));

        env.insert(QStringLiteral("INVARIANT_API_KEY"), QStringLiteral("k"));
        remote.loadFromEnvironment(env);
        QVERIFY(remote.validate().has_value());
    }
};

QTEST_MAIN(TestConfigStore)
#include "tst_config_store.moc"
