#include <QTest>
#include <QSignalSpy>
#include <QJsonDocument>
#include "fakes.h"
#include "guardrails/guardrails_engine.h"
#include "guardrails/rule_policy.h"
#include "mcp/jsonrpc.h"
#include "mcp/mcp_bridge.h"
#include "mcp/session_registry.h"
#include "trace/trace_assembler.h"

namespace {

const QString kBase = QStringLiteral("http://mcp.local");

JsonRpcMessage rpc(const QByteArray& json)
{
    return JsonRpcMessage{QJsonDocument::fromJson(json).object()};
}

QByteArray toolCall(int id, const QString& name)
{
    return QStringLiteral(R"({"jsonrpc":"2.0","id":%1,"method":"tools/call","params":{"name":"%2","arguments":{"path":"/tmp/x"}}})")
        .arg(id).arg(name).toUtf8();
}

PolicyHandle denyTool(const QString& tool)
{
    const QByteArray json = QStringLiteral(R"({"rules":[{"id":"deny","message":"%1 is not allowed","tool":"%1"}]})")
                                .arg(tool).toUtf8();
    auto policy = RulePolicy::fromJson(QJsonDocument::fromJson(json).object());
    return policy ? PolicyHandle(*policy) : PolicyHandle();
}

McpSession::Verdict screen(McpSession* session, const QByteArray& json)
{
    std::optional<McpSession::Verdict> verdict;
    session->handleClientMessage(rpc(json), [&](McpSession::Verdict v) { verdict = v; });
    return verdict ? *verdict : McpSession::Verdict(std::unexpected(DomainFailure::internal(QStringLiteral("pending"))));
}

HttpRequest request(const QString& method, const QString& path, const QByteArray& body = {})
{
    HttpRequest req;
    req.method = method;
    req.path = path;
    req.body = body;
    req.headers[QStringLiteral("mcp-server-base-url")] = kBase + QStringLiteral("/");
    req.headers[QStringLiteral("content-type")] = QStringLiteral("application/json");
    return req;
}

}

class TestMcpSession : public QObject {
    Q_OBJECT

private:
    FakeTraceStore m_store;
    FakePolicyLoader m_loader;
    FakeExecutor m_executor;

    McpBridgeDeps bridgeDeps(SessionRegistry* registry) {
        McpBridgeDeps deps;
        deps.executor = &m_executor;
        deps.registry = registry;
        deps.baseSources = {{PolicySource::Kind::File, QStringLiteral("/etc/mcp-rules.json")}};
        return deps;
    }

private slots:
    void init() {
        m_store = FakeTraceStore();
        m_loader = FakePolicyLoader();
        m_executor = FakeExecutor();
    }

    void testJsonRpcParse() {
        bool batch = true;
        auto single = JsonRpc::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping"})", &batch);
        QVERIFY(single.has_value());
        QVERIFY(!batch);
        QVERIFY(single->first().isRequest());

        auto many = JsonRpc::parse(R"([{"jsonrpc":"2.0","method":"notifications/initialized"},{"jsonrpc":"2.0","id":"a","result":{}}])", &batch);
        QVERIFY(many.has_value());
        QVERIFY(batch);
        QVERIFY(many->at(0).isNotification());
        QVERIFY(many->at(1).isResponse());

        QVERIFY(!JsonRpc::parse("{oops").has_value());
        QVERIFY(!JsonRpc::parse("[1,2]").has_value());
        QVERIFY(!JsonRpc::parse("42").has_value());
    }

    void testIdKeysKeepTypes() {
        QVERIFY(JsonRpc::idKey(QJsonValue(1)) != JsonRpc::idKey(QJsonValue(QStringLiteral("1"))));
        QCOMPARE(JsonRpc::toolCallId(QJsonValue(7)), QStringLiteral("call_7"));
    }

    void testBlockedToolCallError() {
        const QJsonObject reply = JsonRpc::blockedToolCallError(QJsonValue(3), QStringLiteral("details"));
        QCOMPARE(reply.value(QStringLiteral("id")).toInt(), 3);
        const QJsonObject error = reply.value(QStringLiteral("error")).toObject();
        QCOMPARE(error.value(QStringLiteral("code")).toInt(), -32600);
        QVERIFY(error.value(QStringLiteral("message")).toString().endsWith(QStringLiteral("details")));
    }

    void testEndpointRewrite() {
        const QString data = QStringLiteral("/messages/?session_id=4f2c9a");
        QCOMPARE(McpBridge::extractSessionId(data), QStringLiteral("4f2c9a"));
        QCOMPARE(McpBridge::rewriteEndpoint(data),
                 QStringLiteral("/api/v1/gateway/mcp/sse/messages/?session_id=4f2c9a"));
        QVERIFY(McpBridge::extractSessionId(QStringLiteral("/messages/")).isEmpty());
    }

    void testRegistryRekey() {
        SessionRegistry registry(&m_store, nullptr);
        McpSessionOptions options;
        options.sessionId = SessionRegistry::generateStatelessId();
        options.transport = TransportKind::McpStreamableStateless;
        QVERIFY(options.sessionId.startsWith(SessionRegistry::kStatelessPrefix));

        McpSession* session = registry.create(options);
        QCOMPARE(registry.create(options), session);
        QCOMPARE(registry.count(), 1);

        QVERIFY(registry.rekey(options.sessionId, QStringLiteral("srv-9")));
        QCOMPARE(session->id(), QStringLiteral("srv-9"));
        QCOMPARE(session->metadata().value(QStringLiteral("session_id")).toString(), QStringLiteral("srv-9"));
        QVERIFY(!registry.contains(options.sessionId));
        QCOMPARE(registry.find(QStringLiteral("srv-9")), session);

        QSignalSpy closed(session, &McpSession::closed);
        registry.remove(QStringLiteral("srv-9"));
        QCOMPARE(closed.count(), 1);
        QCOMPARE(registry.count(), 0);
    }

    void testToolCallAndResultTraced() {
        SessionRegistry registry(&m_store, nullptr);
        McpSessionOptions options;
        options.sessionId = QStringLiteral("s1");
        McpSession* session = registry.create(options);
        session->open();

        auto verdict = screen(session, toolCall(5, QStringLiteral("read_file")));
        QVERIFY(verdict.has_value());
        QVERIFY(!verdict->has_value());
        QCOMPARE(session->pendingMethod(QJsonValue(5)), JsonRpc::kToolCall);

        session->handleServerMessage(rpc(R"({"jsonrpc":"2.0","id":5,"result":{"content":[{"type":"text","text":"data"}]}})"));
        const QList<CanonicalMessage>& entries = session->trace()->entries();
        QCOMPARE(entries.size(), 2);
        QCOMPARE(entries[0].toolCalls().first().name, QStringLiteral("read_file"));
        QCOMPARE(entries[0].toolCalls().first().id, QStringLiteral("call_5"));
        QCOMPARE(entries[1].role, Role::Tool);
        QCOMPARE(entries[1].content.first().callId, QStringLiteral("call_5"));
    }

    void testServerInfoAndToolsInMetadata() {
        SessionRegistry registry(&m_store, nullptr);
        McpSessionOptions options;
        options.sessionId = QStringLiteral("s2");
        McpSession* session = registry.create(options);
        session->open();

        screen(session, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"clientInfo":{"name":"cli"}}})");
        session->handleServerMessage(rpc(R"({"jsonrpc":"2.0","id":1,"result":{"serverInfo":{"name":"files"}}})"));
        screen(session, R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
        session->handleServerMessage(rpc(R"({"jsonrpc":"2.0","id":2,"result":{"tools":[{"name":"read_file"}]}})"));

        const QJsonObject metadata = session->metadata();
        QCOMPARE(metadata.value(QStringLiteral("mcp_client")).toString(), QStringLiteral("cli"));
        QCOMPARE(metadata.value(QStringLiteral("mcp_server")).toString(), QStringLiteral("files"));
        QCOMPARE(metadata.value(QStringLiteral("tools")).toArray().size(), 1);
        QVERIFY(session->trace()->entries().isEmpty());
    }

    void testBlockedToolCallAnswered() {
        m_loader.policy = denyTool(QStringLiteral("delete_file"));
        GuardrailsEngine engine(&m_loader);
        SessionRegistry registry(&m_store, &engine);
        McpSessionOptions options;
        options.sessionId = QStringLiteral("s3");
        options.policySources = {{PolicySource::Kind::File, QStringLiteral("/etc/mcp-rules.json")}};
        McpSession* session = registry.create(options);
        session->open();

        auto allowed = screen(session, toolCall(1, QStringLiteral("read_file")));
        QVERIFY(allowed.has_value() && !allowed->has_value());

        auto blocked = screen(session, toolCall(2, QStringLiteral("delete_file")));
        QVERIFY(blocked.has_value());
        QVERIFY(blocked->has_value());
        const QJsonObject reply = **blocked;
        QCOMPARE(reply.value(QStringLiteral("id")).toInt(), 2);
        QVERIFY(reply.value(QStringLiteral("error")).toObject().value(QStringLiteral("message"))
                    .toString().contains(QStringLiteral("delete_file is not allowed")));
        // Blocked calls still enter the trace
        QCOMPARE(session->trace()->entries().size(), 2);
    }

    void testGuardrailsOutageIsAnError() {
        m_loader.failing = true;
        GuardrailsEngine engine(&m_loader);
        SessionRegistry registry(&m_store, &engine);
        McpSessionOptions options;
        options.sessionId = QStringLiteral("s4");
        options.policySources = {{PolicySource::Kind::File, QStringLiteral("/etc/mcp-rules.json")}};
        McpSession* session = registry.create(options);
        session->open();

        auto verdict = screen(session, toolCall(1, QStringLiteral("read_file")));
        QVERIFY(!verdict.has_value());
        QCOMPARE(verdict.error().kind, ErrorKind::GuardrailsUnavailable);
    }

    void testClosedSessionRejectsMessages() {
        SessionRegistry registry(&m_store, nullptr);
        McpSessionOptions options;
        options.sessionId = QStringLiteral("s5");
        McpSession* session = registry.create(options);
        session->open();
        session->close();
        QCOMPARE(session->state(), SessionState::Closed);
        auto verdict = screen(session, toolCall(1, QStringLiteral("read_file")));
        QVERIFY(!verdict.has_value());
        QCOMPARE(verdict.error().kind, ErrorKind::SessionNotFound);
    }

    void testSseSessionLifecycle() {
        m_loader.policy = denyTool(QStringLiteral("delete_file"));
        GuardrailsEngine engine(&m_loader);
        SessionRegistry registry(&m_store, &engine);
        McpBridge bridge(bridgeDeps(&registry));

        QPointer<FakeChannel> stream = new FakeChannel;
        HttpRequest open = request(QStringLiteral("GET"), QStringLiteral("/api/v1/gateway/mcp/sse"));
        bridge.openSse(open, stream);
        QCOMPARE(m_executor.requests.size(), 1);
        QCOMPARE(m_executor.requests[0].url, kBase + QStringLiteral("/sse"));

        FakeUpstream* upstream = m_executor.last();
        upstream->respond(200, QStringLiteral("text/event-stream"));
        upstream->feed("event: endpoint\ndata: /messages/?session_id=abc\n\n");
        QVERIFY(registry.contains(QStringLiteral("abc")));
        QCOMPARE(stream->chunks.size(), 1);
        QVERIFY(stream->chunks[0].contains("/api/v1/gateway/mcp/sse/messages/?session_id=abc"));

        // A blocked call is answered on the event stream, nothing goes upstream
        QPointer<FakeChannel> post = new FakeChannel;
        HttpRequest blocked = request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/sse/messages/"),
                                      toolCall(9, QStringLiteral("delete_file")));
        blocked.query = QStringLiteral("session_id=abc");
        bridge.postSseMessage(blocked, post);
        QCOMPARE(post->status, 202);
        QCOMPARE(m_executor.requests.size(), 1);
        QCOMPARE(stream->chunks.size(), 2);
        QVERIFY(stream->chunks[1].startsWith("event: message\n"));
        QVERIFY(stream->chunks[1].contains("-32600"));
        delete post;

        // An allowed call is forwarded to the server's message endpoint
        QPointer<FakeChannel> allowed = new FakeChannel;
        HttpRequest forward = request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/sse/messages/"),
                                      toolCall(10, QStringLiteral("read_file")));
        forward.query = QStringLiteral("session_id=abc");
        bridge.postSseMessage(forward, allowed);
        QCOMPARE(m_executor.requests.size(), 2);
        QCOMPARE(m_executor.requests[1].url, kBase + QStringLiteral("/messages/?session_id=abc"));
        m_executor.last()->respond(202, QStringLiteral("text/plain"));
        m_executor.last()->feed("Accepted");
        m_executor.last()->finish();
        QCOMPARE(allowed->status, 202);

        // The tool result arrives on the event stream and is traced
        upstream->feed("event: message\ndata: {\"jsonrpc\":\"2.0\",\"id\":10,\"result\":{\"content\":[]}}\n\n");
        McpSession* session = registry.find(QStringLiteral("abc"));
        QVERIFY(session);
        QCOMPARE(session->trace()->entries().size(), 3);

        upstream->finish();
        QVERIFY(stream->ended);
        QVERIFY(!registry.contains(QStringLiteral("abc")));
    }

    void testSsePostErrors() {
        SessionRegistry registry(&m_store, nullptr);
        McpBridge bridge(bridgeDeps(&registry));

        FakeChannel* missing = new FakeChannel;
        bridge.postSseMessage(request(QStringLiteral("POST"), QStringLiteral("/x"), "{}"), missing);
        QCOMPARE(missing->status, 400);
        delete missing;

        FakeChannel* unknown = new FakeChannel;
        HttpRequest req = request(QStringLiteral("POST"), QStringLiteral("/x"), "{}");
        req.query = QStringLiteral("session_id=nope");
        bridge.postSseMessage(req, unknown);
        QCOMPARE(unknown->status, 404);
        delete unknown;
    }

    void testStreamableInitializeBecomesStateful() {
        SessionRegistry registry(&m_store, nullptr);
        McpBridge bridge(bridgeDeps(&registry));

        QPointer<FakeChannel> channel = new FakeChannel;
        bridge.handleStreamable(request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/streamable"),
            R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"), channel);
        QCOMPARE(m_executor.requests.size(), 1);
        QCOMPARE(m_executor.requests[0].url, kBase + QStringLiteral("/mcp"));
        QCOMPARE(registry.count(), 1);

        FakeUpstream* upstream = m_executor.last();
        upstream->setHeader(QStringLiteral("mcp-session-id"), QStringLiteral("srv-1"));
        upstream->respond(200, QStringLiteral("application/json"));
        upstream->feed(R"({"jsonrpc":"2.0","id":1,"result":{"serverInfo":{"name":"files"}}})");
        upstream->finish();

        QCOMPARE(channel->status, 200);
        QCOMPARE(channel->headers.value(QStringLiteral("mcp-session-id")), QStringLiteral("srv-1"));
        QVERIFY(registry.contains(QStringLiteral("srv-1")));
        QVERIFY(registry.isStatefulServer(kBase));
        McpSession* session = registry.find(QStringLiteral("srv-1"));
        QCOMPARE(session->transport(), TransportKind::McpStreamableStateful);
        QCOMPARE(session->metadata().value(QStringLiteral("mcp_server")).toString(), QStringLiteral("files"));

        // Later calls to that server need the session header
        FakeChannel* noSid = new FakeChannel;
        bridge.handleStreamable(request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/streamable"),
                                        toolCall(2, QStringLiteral("read_file"))), noSid);
        QCOMPARE(noSid->status, 400);
        delete noSid;

        FakeChannel* badSid = new FakeChannel;
        HttpRequest stale = request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/streamable"),
                                    toolCall(3, QStringLiteral("read_file")));
        stale.headers[QStringLiteral("mcp-session-id")] = QStringLiteral("gone");
        bridge.handleStreamable(stale, badSid);
        QCOMPARE(badSid->status, 404);
        delete badSid;
    }

    void testStatefulCallsShareSession() {
        SessionRegistry registry(&m_store, nullptr);
        McpBridge bridge(bridgeDeps(&registry));

        QPointer<FakeChannel> init = new FakeChannel;
        bridge.handleStreamable(request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/streamable"),
            R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"), init);
        m_executor.last()->setHeader(QStringLiteral("mcp-session-id"), QStringLiteral("srv-2"));
        m_executor.last()->respond(200, QStringLiteral("application/json"));
        m_executor.last()->feed(R"({"jsonrpc":"2.0","id":1,"result":{}})");
        m_executor.last()->finish();
        McpSession* session = registry.find(QStringLiteral("srv-2"));
        QVERIFY(session);

        QPointer<FakeChannel> call = new FakeChannel;
        HttpRequest next = request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/streamable"),
                                   toolCall(2, QStringLiteral("read_file")));
        next.headers[QStringLiteral("mcp-session-id")] = QStringLiteral("srv-2");
        bridge.handleStreamable(next, call);
        QCOMPARE(m_executor.requests.size(), 2);
        QCOMPARE(m_executor.requests[1].headers.value(QStringLiteral("mcp-session-id")), QStringLiteral("srv-2"));

        m_executor.last()->respond(200, QStringLiteral("application/json"));
        m_executor.last()->feed(R"({"jsonrpc":"2.0","id":2,"result":{"content":[]}})");
        m_executor.last()->finish();

        QCOMPARE(call->status, 200);
        QCOMPARE(registry.count(), 1);
        QCOMPARE(registry.find(QStringLiteral("srv-2")), session);
        QCOMPARE(session->trace()->entries().size(), 2);
        QCOMPARE(session->state(), SessionState::Open);
    }

    void testStatelessCallsAreIndependent() {
        SessionRegistry registry(&m_store, nullptr);
        McpBridge bridge(bridgeDeps(&registry));

        QPointer<FakeChannel> first = new FakeChannel;
        QPointer<FakeChannel> second = new FakeChannel;
        bridge.handleStreamable(request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/streamable"),
                                        toolCall(1, QStringLiteral("read_file"))), first);
        bridge.handleStreamable(request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/streamable"),
                                        toolCall(1, QStringLiteral("read_file"))), second);
        QCOMPARE(m_executor.requests.size(), 2);
        QCOMPARE(registry.count(), 2);
        for (const ProviderRequest& sent : m_executor.requests)
            QVERIFY(!sent.headers.contains(QStringLiteral("mcp-session-id")));

        FakeUpstream* secondUpstream = m_executor.upstreams[1];
        secondUpstream->respond(200, QStringLiteral("application/json"));
        secondUpstream->feed(R"({"jsonrpc":"2.0","id":1,"result":{"content":[]}})");
        secondUpstream->finish();
        QCOMPARE(second->status, 200);
        QCOMPARE(registry.count(), 1);

        FakeUpstream* firstUpstream = m_executor.upstreams[0];
        firstUpstream->respond(200, QStringLiteral("application/json"));
        firstUpstream->feed(R"({"jsonrpc":"2.0","id":1,"result":{"content":[]}})");
        firstUpstream->finish();
        QCOMPARE(first->status, 200);
        QCOMPARE(registry.count(), 0);
        QVERIFY(!registry.isStatefulServer(kBase));
    }

    void testBlockedResultRefusesLaterToolCalls() {
        const QByteArray json = R"({"rules":[{"id":"leak","message":"secret in tool output","role":"tool","pattern":"hunter2"}]})";
        auto rules = RulePolicy::fromJson(QJsonDocument::fromJson(json).object());
        QVERIFY(rules.has_value());
        m_loader.policy = *rules;
        GuardrailsEngine engine(&m_loader);
        SessionRegistry registry(&m_store, &engine);
        McpSessionOptions options;
        options.sessionId = QStringLiteral("s6");
        options.policySources = {{PolicySource::Kind::File, QStringLiteral("/etc/mcp-rules.json")}};
        McpSession* session = registry.create(options);
        session->open();

        auto first = screen(session, toolCall(1, QStringLiteral("read_file")));
        QVERIFY(first.has_value() && !first->has_value());
        QVERIFY(!session->isBlocked());

        session->handleServerMessage(rpc(R"({"jsonrpc":"2.0","id":1,"result":{"content":[{"type":"text","text":"password=hunter2"}]}})"));
        QVERIFY(session->isBlocked());

        auto refused = screen(session, toolCall(2, QStringLiteral("list_dir")));
        QVERIFY(refused.has_value());
        QVERIFY(refused->has_value());
        const QJsonObject error = (**refused).value(QStringLiteral("error")).toObject();
        QCOMPARE(error.value(QStringLiteral("code")).toInt(), -32600);
        QVERIFY(error.value(QStringLiteral("message")).toString().contains(QStringLiteral("leak")));
        QCOMPARE((**refused).value(QStringLiteral("id")).toInt(), 2);
    }

    void testClientGoneDuringCheckKeepsStatefulSession() {
        m_loader.autoReply = false;
        GuardrailsEngine engine(&m_loader);
        SessionRegistry registry(&m_store, &engine);
        McpBridge bridge(bridgeDeps(&registry));

        McpSessionOptions options;
        options.sessionId = QStringLiteral("srv-7");
        options.transport = TransportKind::McpStreamableStateful;
        options.serverBaseUrl = kBase;
        options.policySources = {{PolicySource::Kind::File, QStringLiteral("/etc/mcp-rules.json")}};
        registry.create(options)->open();
        registry.markStateful(kBase);

        auto* statefulChannel = new FakeChannel;
        HttpRequest call = request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/streamable"),
                                   toolCall(4, QStringLiteral("read_file")));
        call.headers[QStringLiteral("mcp-session-id")] = QStringLiteral("srv-7");
        bridge.handleStreamable(call, statefulChannel);
        QCOMPARE(m_loader.waiting.size(), 1);
        delete statefulChannel;
        m_loader.replyAll();

        QVERIFY(m_executor.requests.isEmpty());
        QVERIFY(registry.contains(QStringLiteral("srv-7")));
        QCOMPARE(registry.find(QStringLiteral("srv-7"))->state(), SessionState::Open);

        // An ephemeral session goes away with its call
        engine.invalidate(QStringLiteral("file:/etc/mcp-rules.json"));
        SessionRegistry statelessRegistry(&m_store, &engine);
        McpBridge statelessBridge(bridgeDeps(&statelessRegistry));
        auto* statelessChannel = new FakeChannel;
        statelessBridge.handleStreamable(request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/streamable"),
                                                 toolCall(5, QStringLiteral("read_file"))), statelessChannel);
        QCOMPARE(statelessRegistry.count(), 1);
        delete statelessChannel;
        m_loader.replyAll();
        QCOMPARE(statelessRegistry.count(), 0);
    }

    void testStatelessSessionReleased() {
        SessionRegistry registry(&m_store, nullptr);
        McpBridge bridge(bridgeDeps(&registry));

        QPointer<FakeChannel> channel = new FakeChannel;
        bridge.handleStreamable(request(QStringLiteral("POST"), QStringLiteral("/api/v1/gateway/mcp/streamable"),
                                        toolCall(1, QStringLiteral("read_file"))), channel);
        QCOMPARE(registry.count(), 1);

        FakeUpstream* upstream = m_executor.last();
        upstream->respond(200, QStringLiteral("text/event-stream"));
        upstream->feed("event: message\ndata: {\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"content\":[]}}\n\n");
        upstream->finish();

        QVERIFY(channel->ended);
        QCOMPARE(channel->chunks.size(), 1);
        QCOMPARE(registry.count(), 0);
    }

    void testStreamableRejectsOtherMethods() {
        SessionRegistry registry(&m_store, nullptr);
        McpBridge bridge(bridgeDeps(&registry));

        FakeChannel* put = new FakeChannel;
        bridge.handleStreamable(request(QStringLiteral("PUT"), QStringLiteral("/x")), put);
        QCOMPARE(put->status, 400);
        delete put;

        FakeChannel* noBase = new FakeChannel;
        HttpRequest req = request(QStringLiteral("POST"), QStringLiteral("/x"), "{}");
        req.headers.remove(QStringLiteral("mcp-server-base-url"));
        bridge.handleStreamable(req, noBase);
        QCOMPARE(noBase->status, 400);
        delete noBase;
    }
};

QTEST_MAIN(TestMcpSession)
#include "tst_mcp_session.moc"
