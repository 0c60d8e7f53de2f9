#include <QTest>
#include <QJsonDocument>
#include <QTcpSocket>
#include "fakes.h"
#include "adapters/provider/provider_registry.h"
#include "proxy/proxy_server.h"
#include "proxy/request_router.h"

namespace {

const QStringList kProviders{QStringLiteral("anthropic"), QStringLiteral("gemini"),
                             QStringLiteral("openai")};

}

class TestRequestRouter : public QObject {
    Q_OBJECT

private slots:
    void testLlmRoutes_data() {
        QTest::addColumn<QString>("path");
        QTest::addColumn<QString>("project");
        QTest::addColumn<QString>("provider");
        QTest::addColumn<QString>("upstreamPath");

        QTest::newRow("project openai")
            << "/api/v1/gateway/my-proj/openai/chat/completions"
            << "my-proj" << "openai" << "/chat/completions";
        QTest::newRow("no project")
            << "/api/v1/gateway/anthropic/v1/messages"
            << "" << "anthropic" << "/v1/messages";
        QTest::newRow("gemini model path")
            << "/api/v1/gateway/p/gemini/v1beta/models/gemini-2.0-flash:streamGenerateContent"
            << "p" << "gemini" << "/v1beta/models/gemini-2.0-flash:streamGenerateContent";
        QTest::newRow("project named like a path")
            << "/api/v1/gateway/v1/openai/chat/completions"
            << "v1" << "openai" << "/chat/completions";
    }

    void testLlmRoutes() {
        QFETCH(QString, path);
        QFETCH(QString, project);
        QFETCH(QString, provider);
        QFETCH(QString, upstreamPath);

        RequestRouter router;
        router.registerDefaults(kProviders);
        auto route = router.match(QStringLiteral("POST"), path);
        QVERIFY(route.has_value());
        QCOMPARE(route->kind, RouteKind::LlmProxy);
        QCOMPARE(route->project, project);
        QCOMPARE(route->provider, provider);
        QCOMPARE(route->upstreamPath, upstreamPath);
    }

    void testUnknownRoutes() {
        RequestRouter router;
        router.registerDefaults(kProviders);
        QVERIFY(!router.match(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/proj/mistral/chat")));
        QVERIFY(!router.match(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/openai")));
        QVERIFY(!router.match(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/openai/")));
        QVERIFY(!router.match(QStringLiteral("POST"), QStringLiteral("/v1/chat/completions")));
    }

    void testFixedRoutes() {
        RequestRouter router;
        router.registerDefaults(kProviders);

        QCOMPARE(router.match(QStringLiteral("GET"), QStringLiteral("/api/v1/gateway/health"))->kind,
                 RouteKind::Health);
        QCOMPARE(router.match(QStringLiteral("GET"), QStringLiteral("/api/v1/gateway/mcp/sse"))->kind,
                 RouteKind::McpSseOpen);
        QCOMPARE(router.match(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/sse/messages/"))->kind,
                 RouteKind::McpSseMessage);
        QCOMPARE(router.match(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/sse/messages"))->kind,
                 RouteKind::McpSseMessage);
        for (const QString& method : {QStringLiteral("GET"), QStringLiteral("POST"), QStringLiteral("DELETE")}) {
            auto route = router.match(method, QStringLiteral("/api/v1/gateway/mcp/streamable"));
            QVERIFY(route.has_value());
            QCOMPARE(route->kind, RouteKind::McpStreamable);
        }
        // POST on the SSE stream path is not an LLM call for project "mcp"
        QVERIFY(!router.match(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/sse")));
    }

    void testParseHttpRequest() {
        const QByteArray raw =
            "POST /api/v1/gateway/mcp/sse/messages/?session_id=abc&x=1 HTTP/1.1\r\n"
            "Host: localhost:8005\r\n"
            "Content-Type: application/json\r\n"
            "MCP-Server-Base-Url: http://mcp.local\r\n"
            "\r\n"
            "{\"jsonrpc\":\"2.0\"}";
        const HttpRequest req = ProxyServer::parseHttpRequest(raw);
        QCOMPARE(req.method, QStringLiteral("POST"));
        QCOMPARE(req.path, QStringLiteral("/api/v1/gateway/mcp/sse/messages/"));
        QCOMPARE(req.query, QStringLiteral("session_id=abc&x=1"));
        QCOMPARE(req.queryItem(QStringLiteral("session_id")), QStringLiteral("abc"));
        QCOMPARE(req.header(QStringLiteral("MCP-Server-Base-Url")), QStringLiteral("http://mcp.local"));
        QCOMPARE(req.body, QByteArray("{\"jsonrpc\":\"2.0\"}"));
    }

    void testDispatch() {
        ProviderRegistry providers;
        providers.registerDefaults();
        FakeExecutor executor;
        FakeTraceStore store;

        ProxyServerDeps deps;
        deps.providers = &providers;
        deps.executor = &executor;
        deps.traceStore = &store;
        ProxyServer server(deps);

        FakeChannel health;
        HttpRequest req;
        req.method = QStringLiteral("GET");
        req.path = QStringLiteral("/api/v1/gateway/health");
        server.handleRequest(req, &health);
        QCOMPARE(health.status, 200);
        QCOMPARE(QJsonDocument::fromJson(health.body).object().value(QStringLiteral("status")).toString(),
                 QStringLiteral("ok"));

        FakeChannel missing;
        req.path = QStringLiteral("/nowhere");
        server.handleRequest(req, &missing);
        QCOMPARE(missing.status, 404);

        FakeChannel noKey;
        req.method = QStringLiteral("POST");
        req.path = QStringLiteral("/api/v1/gateway/proj/openai/chat/completions");
        req.body = "{\"messages\":[]}";
        server.handleRequest(req, &noKey);
        QCOMPARE(noKey.status, 401);
        QVERIFY(executor.requests.isEmpty());
    }

    void testDefaultUpstreamUrls_data() {
        QTest::addColumn<QString>("path");
        QTest::addColumn<QString>("authHeader");
        QTest::addColumn<QString>("expectedUrl");

        QTest::newRow("openai")
            << "/api/v1/gateway/proj/openai/chat/completions"
            << "authorization" << "https://api.openai.com/v1/chat/completions";
        QTest::newRow("openai without project")
            << "/api/v1/gateway/openai/chat/completions"
            << "authorization" << "https://api.openai.com/v1/chat/completions";
        QTest::newRow("anthropic")
            << "/api/v1/gateway/proj/anthropic/v1/messages"
            << "x-api-key" << "https://api.anthropic.com/v1/messages";
        QTest::newRow("gemini")
            << "/api/v1/gateway/proj/gemini/v1beta/models/gemini-2.0-flash:generateContent"
            << "x-goog-api-key"
            << "https://generativelanguage.googleapis.com/v1beta/models/gemini-2.0-flash:generateContent";
    }

    void testDefaultUpstreamUrls() {
        QFETCH(QString, path);
        QFETCH(QString, authHeader);
        QFETCH(QString, expectedUrl);

        ProviderRegistry providers;
        providers.registerDefaults();
        FakeExecutor executor;
        FakeTraceStore store;

        ProxyServerDeps deps;
        deps.providers = &providers;
        deps.executor = &executor;
        deps.traceStore = &store;
        ProxyServer server(deps);

        auto* channel = new FakeChannel;
        QPointer<FakeChannel> guard(channel);
        HttpRequest req;
        req.method = QStringLiteral("POST");
        req.path = path;
        req.headers[authHeader] = QStringLiteral("sk-upstream");
        req.body = R"({"model":"m","messages":[{"role":"user","content":"hi"}]})";
        server.handleRequest(req, channel);

        QCOMPARE(executor.requests.size(), 1);
        QCOMPARE(executor.requests[0].url, expectedUrl);

        channel->hangUp();
        QTRY_VERIFY(guard.isNull());
    }

    void testChunkedBodyClosesConnection() {
        ProviderRegistry providers;
        providers.registerDefaults();
        FakeExecutor executor;
        FakeTraceStore store;

        ProxyServerDeps deps;
        deps.providers = &providers;
        deps.executor = &executor;
        deps.traceStore = &store;
        ProxyServer server(deps);
        RuntimeOptions runtime;
        runtime.listenPort = 0;
        QVERIFY(server.start(runtime));

        QTcpSocket client;
        QByteArray received;
        connect(&client, &QTcpSocket::readyRead, this, [&]() { received += client.readAll(); });
        client.connectToHost(QHostAddress::LocalHost, server.serverPort());
        QTRY_COMPARE(client.state(), QAbstractSocket::ConnectedState);

        client.write("POST /api/v1/gateway/proj/openai/chat/completions HTTP/1.1\r\n"
                     "Host: localhost\r\n"
                     "Transfer-Encoding: chunked\r\n"
                     "\r\n");
        QTRY_VERIFY(received.contains("chunked_body"));
        QVERIFY(received.startsWith("HTTP/1.1 400"));

        // A request hidden in the body never gets an answer of its own
        client.write("2c\r\nGET /api/v1/gateway/health HTTP/1.1\r\nHost: x\r\n\r\n\r\n0\r\n\r\n");
        QTRY_COMPARE(client.state(), QAbstractSocket::UnconnectedState);
        QCOMPARE(received.count("HTTP/1.1 "), 1);
        QVERIFY(executor.requests.isEmpty());
        server.stop();
    }

    void testDispatchOpensUpstream() {
        ProviderRegistry providers;
        providers.registerDefaults({{QStringLiteral("anthropic"), QStringLiteral("http://claude.local")}});
        FakeExecutor executor;
        FakeTraceStore store;

        ProxyServerDeps deps;
        deps.providers = &providers;
        deps.executor = &executor;
        deps.traceStore = &store;
        ProxyServer server(deps);

        auto* channel = new FakeChannel;
        QPointer<FakeChannel> guard(channel);
        HttpRequest req;
        req.method = QStringLiteral("POST");
        req.path = QStringLiteral("/api/v1/gateway/proj/anthropic/v1/messages");
        req.headers[QStringLiteral("x-api-key")] = QStringLiteral("sk-ant|invariant-auth: inv-1");
        req.body = R"({"model":"claude","messages":[{"role":"user","content":"hi"}]})";
        server.handleRequest(req, channel);

        QCOMPARE(executor.requests.size(), 1);
        QCOMPARE(executor.requests[0].url, QStringLiteral("http://claude.local/v1/messages"));
        QCOMPARE(executor.requests[0].headers.value(QStringLiteral("x-api-key")), QStringLiteral("sk-ant"));
        QCOMPARE(store.requests.size(), 1);
        QCOMPARE(store.requests[0].projectRef, QStringLiteral("proj"));

        executor.last()->respond(200, QStringLiteral("application/json"));
        executor.last()->feed(R"({"role":"assistant","content":[{"type":"text","text":"hello"}],"stop_reason":"end_turn"})");
        executor.last()->finish();
        QCOMPARE(guard->status, 200);
        QCOMPARE(store.requests.size(), 2);
        QTRY_VERIFY(guard.isNull());
    }
};

QTEST_MAIN(TestRequestRouter)
#include "tst_request_router.moc"
