#include <QTest>
#include "credential/credential_extractor.h"

class TestCredential : public QObject {
    Q_OBJECT

private slots:
    void testCompositeKey() {
        auto result = CredentialExtractor::parse(QStringLiteral("sk-abc|invariant-auth: inv-123"));
        QVERIFY(result.has_value());
        QCOMPARE(result->upstreamKey, QStringLiteral("sk-abc"));
        QVERIFY(result->hasGatewayToken());
        QCOMPARE(*result->gatewayToken, QStringLiteral("inv-123"));
        QCOMPARE(result->bearerToken(), QStringLiteral("Bearer inv-123"));
    }

    void testPlainKey() {
        auto result = CredentialExtractor::parse(QStringLiteral("sk-abc"));
        QVERIFY(result.has_value());
        QCOMPARE(result->upstreamKey, QStringLiteral("sk-abc"));
        QVERIFY(!result->gatewayToken.has_value());
        QVERIFY(result->bearerToken().isEmpty());
    }

    void testEmptyHeader() {
        auto result = CredentialExtractor::parse(QString());
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::CredentialError);
        QCOMPARE(result.error().httpStatus(), 401);
    }

    void testEmptyUpstreamKey() {
        auto result = CredentialExtractor::parse(QStringLiteral("|invariant-auth: inv-123"));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::CredentialError);
    }

    void testFirstSeparatorWins() {
        auto result = CredentialExtractor::parse(
            QStringLiteral("sk-abc|invariant-auth: inv-1|invariant-auth: inv-2"));
        QVERIFY(result.has_value());
        QCOMPARE(result->upstreamKey, QStringLiteral("sk-abc"));
        QCOMPARE(*result->gatewayToken, QStringLiteral("inv-1|invariant-auth: inv-2"));
    }

    void testBearerPrefixKept() {
        // OpenAI clients send "Bearer <key>"; the prefix travels with the upstream key
        QMap<QString, QString> headers;
        headers[QStringLiteral("authorization")] = QStringLiteral("Bearer sk-abc|invariant-auth: inv-9");
        auto result = CredentialExtractor::extract(ProviderFamily::OpenAI, headers);
        QVERIFY(result.has_value());
        QCOMPARE(result->upstreamKey, QStringLiteral("Bearer sk-abc"));
        QCOMPARE(*result->gatewayToken, QStringLiteral("inv-9"));
    }

    void testAnthropicHeader() {
        QMap<QString, QString> headers;
        headers[QStringLiteral("x-api-key")] = QStringLiteral("sk-ant|invariant-auth: inv-1");
        auto result = CredentialExtractor::extract(ProviderFamily::Anthropic, headers);
        QVERIFY(result.has_value());
        QCOMPARE(result->upstreamKey, QStringLiteral("sk-ant"));
    }

    void testGeminiQueryKey() {
        auto result = CredentialExtractor::extract(ProviderFamily::Gemini, {},
                                                   QStringLiteral("alt=sse&key=g-key"));
        QVERIFY(result.has_value());
        QCOMPARE(result->upstreamKey, QStringLiteral("g-key"));
        QVERIFY(!result->hasGatewayToken());
    }

    void testDedicatedHeaderOverrides() {
        QMap<QString, QString> headers;
        headers[QStringLiteral("authorization")] = QStringLiteral("sk-abc|invariant-auth: inv-1");
        headers[QStringLiteral("invariant-authorization")] = QStringLiteral("Bearer inv-2");
        auto result = CredentialExtractor::extract(ProviderFamily::OpenAI, headers);
        QVERIFY(result.has_value());
        QCOMPARE(*result->gatewayToken, QStringLiteral("inv-2"));
    }

    void testDedicatedHeaderMalformed() {
        QMap<QString, QString> headers;
        headers[QStringLiteral("authorization")] = QStringLiteral("sk-abc");
        headers[QStringLiteral("invariant-authorization")] = QStringLiteral("inv-2");
        auto result = CredentialExtractor::extract(ProviderFamily::OpenAI, headers);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::CredentialError);
    }
};

QTEST_MAIN(TestCredential)
#include "tst_credential.moc"
