#include <QTest>
#include <QSignalSpy>
#include <QJsonDocument>
#include "fakes.h"
#include "adapters/provider/openai.h"
#include "guardrails/guardrails_engine.h"
#include "guardrails/rule_policy.h"
#include "pipeline/llm_session.h"
#include "trace/trace_assembler.h"

namespace {

const QByteArray kStreamBody =
    R"({"model":"gpt-4o","stream":true,"messages":[{"role":"user","content":"hi"}]})";

QByteArray sseChunk(const QByteArray& json)
{
    return "data: " + json + "\n\n";
}

QByteArray textChunk(const QString& text, bool last = false)
{
    QJsonObject delta;
    delta["content"] = text;
    QJsonObject choice;
    choice["index"] = 0;
    choice["delta"] = delta;
    if (last)
        choice["finish_reason"] = QStringLiteral("stop");
    QJsonObject root;
    root["choices"] = QJsonArray{choice};
    return sseChunk(QJsonDocument(root).toJson(QJsonDocument::Compact));
}

PolicyHandle rules(const QByteArray& json)
{
    auto policy = RulePolicy::fromJson(QJsonDocument::fromJson(json).object());
    return policy ? PolicyHandle(*policy) : PolicyHandle();
}

// One session wired to in-process collaborators
struct Harness {
    FakeExecutor executor;
    FakeTraceStore store;
    FakePolicyLoader loader;
    GuardrailsEngine engine{&loader};
    FakeChannel channel;
    std::unique_ptr<LlmSession> session;
    int connectTimeout = 30000;
    int readTimeout = 60000;

    LlmCallContext context(const QByteArray& body, bool withToken = true,
                           bool withPolicy = false) {
        LlmCallContext ctx;
        ctx.request.path = QStringLiteral("/v1/chat/completions");
        ctx.request.headers[QStringLiteral("content-type")] = QStringLiteral("application/json");
        ctx.request.body = body;
        ctx.project = QStringLiteral("proj");
        ctx.credential.upstreamKey = QStringLiteral("sk-up");
        if (withToken)
            ctx.credential.gatewayToken = QStringLiteral("inv-tok");
        if (withPolicy)
            ctx.policySources.append({PolicySource::Kind::File, QStringLiteral("/etc/rules.json")});
        return ctx;
    }

    void start(const LlmCallContext& ctx, qint64 highWater = 256 * 1024) {
        LlmSessionDeps deps;
        deps.executor = &executor;
        deps.traceStore = &store;
        deps.guardrails = &engine;
        deps.runtime.downstreamHighWater = highWater;
        deps.runtime.connectTimeout = connectTimeout;
        deps.runtime.readTimeout = readTimeout;
        session = std::make_unique<LlmSession>(std::make_unique<OpenAIAdapter>(), &channel, deps);
        session->start(ctx);
    }
};

}

class TestLlmSession : public QObject {
    Q_OBJECT

private slots:
    void testPreCheckBlockSkipsUpstream() {
        Harness h;
        h.loader.policy = rules(R"({"rules":[{"id":"deny","message":"no hi","pattern":"hi","role":"user"}]})");
        h.start(h.context(kStreamBody, true, true));

        QVERIFY(h.executor.requests.isEmpty());
        QVERIFY(h.session->isBlocked());
        QCOMPARE(h.channel.status, 400);
        const QJsonObject error = QJsonDocument::fromJson(h.channel.body).object()
                                      .value(QStringLiteral("error")).toObject();
        QVERIFY(error.value(QStringLiteral("message")).toString().contains(QStringLiteral("no hi")));
        QCOMPARE(error.value(QStringLiteral("violations")).toArray().size(), 1);
        QCOMPARE(h.session->state(), SessionState::Closed);
    }

    void testGuardrailsUnavailableFailsRequest() {
        Harness h;
        h.loader.failing = true;
        h.start(h.context(kStreamBody, true, true));
        QVERIFY(h.executor.requests.isEmpty());
        QCOMPARE(h.channel.status, 503);
    }

    void testStreamRelayedUnitByUnit() {
        Harness h;
        h.start(h.context(kStreamBody));
        QCOMPARE(h.executor.requests.size(), 1);
        QCOMPARE(h.executor.requests[0].headers.value(QStringLiteral("authorization")),
                 QStringLiteral("Bearer sk-up"));

        FakeUpstream* upstream = h.executor.last();
        QVERIFY(upstream);
        upstream->respond(200, QStringLiteral("text/event-stream"));
        QCOMPARE(h.channel.status, 200);
        QVERIFY(h.channel.chunked);

        upstream->feed(textChunk(QStringLiteral("Hel")));
        QCOMPARE(h.channel.chunks.size(), 1);
        upstream->feed(textChunk(QStringLiteral("lo"), true) + sseChunk("[DONE]"));
        QCOMPARE(h.channel.chunks.size(), 3);
        QVERIFY(!h.channel.ended);

        upstream->finish();
        QVERIFY(h.channel.ended);
        QCOMPARE(h.channel.body, textChunk(QStringLiteral("Hel")) + textChunk(QStringLiteral("lo"), true)
                                 + sseChunk("[DONE]"));

        TraceAssembler* trace = h.session->trace();
        QVERIFY(trace);
        QCOMPARE(trace->entries().size(), 2);
        QCOMPARE(trace->entries().at(1).text(), QStringLiteral("Hello"));
        QCOMPARE(h.store.requests.size(), 2);
    }

    void testConnectTimeoutAnswers504() {
        Harness h;
        h.connectTimeout = 50;
        h.start(h.context(kStreamBody));
        QPointer<FakeUpstream> upstream = h.executor.last();
        QVERIFY(upstream);

        QTRY_COMPARE(h.channel.status, 504);
        QVERIFY(!h.channel.chunked);
        const QJsonObject error = QJsonDocument::fromJson(h.channel.body).object()
                                      .value(QStringLiteral("error")).toObject();
        QCOMPARE(error.value(QStringLiteral("type")).toString(), QStringLiteral("timeout"));
        QVERIFY(upstream.isNull() || upstream->aborted);
        QCOMPARE(h.session->state(), SessionState::Closed);
    }

    void testReadTimeoutEndsStreamWithErrorEvent() {
        Harness h;
        h.readTimeout = 50;
        h.start(h.context(kStreamBody));
        QPointer<FakeUpstream> upstream = h.executor.last();
        upstream->respond(200, QStringLiteral("text/event-stream"));
        upstream->feed(textChunk(QStringLiteral("Hel")));
        QCOMPARE(h.channel.chunks.size(), 1);

        QTRY_VERIFY(h.channel.ended);
        QCOMPARE(h.channel.status, 200);
        QCOMPARE(h.channel.chunks.size(), 2);
        const QByteArray last = h.channel.chunks.last();
        QVERIFY(last.startsWith("data: "));
        const QJsonObject error = QJsonDocument::fromJson(last.mid(6).trimmed()).object()
                                      .value(QStringLiteral("error")).toObject();
        QCOMPARE(error.value(QStringLiteral("type")).toString(), QStringLiteral("timeout"));
        QVERIFY(!h.channel.body.contains("[DONE]"));
        QVERIFY(upstream.isNull() || upstream->aborted);
    }

    void testTracePushFailureLeavesStreamIntact() {
        Harness h;
        h.store.failing = true;
        h.start(h.context(kStreamBody));
        FakeUpstream* upstream = h.executor.last();
        upstream->respond(200, QStringLiteral("text/event-stream"));
        upstream->feed(textChunk(QStringLiteral("ok"), true) + sseChunk("[DONE]"));
        upstream->finish();

        QVERIFY(h.channel.ended);
        QCOMPARE(h.channel.chunks.size(), 2);
        QVERIFY(!h.channel.body.contains("error"));
    }

    void testNoTokenMeansNoTrace() {
        Harness h;
        h.start(h.context(kStreamBody, false));
        QVERIFY(!h.session->trace());
        FakeUpstream* upstream = h.executor.last();
        upstream->respond(200, QStringLiteral("text/event-stream"));
        upstream->feed(textChunk(QStringLiteral("x"), true));
        upstream->finish();
        QVERIFY(h.channel.ended);
        QVERIFY(h.store.requests.isEmpty());
    }

    void testDisconnectAbortsUpstream() {
        Harness h;
        h.start(h.context(kStreamBody));
        QPointer<FakeUpstream> upstream = h.executor.last();
        upstream->respond(200, QStringLiteral("text/event-stream"));
        upstream->feed(textChunk(QStringLiteral("partial")));

        QSignalSpy finished(h.session.get(), &LlmSession::finished);
        h.channel.hangUp();
        QCOMPARE(finished.count(), 1);
        QVERIFY(upstream);
        QVERIFY(upstream->aborted);
        QCOMPARE(h.session->state(), SessionState::Closed);
    }

    void testBackpressurePausesReads() {
        Harness h;
        h.start(h.context(kStreamBody), 10);
        FakeUpstream* upstream = h.executor.last();
        upstream->respond(200, QStringLiteral("text/event-stream"));

        h.channel.pending = 1000;
        upstream->feed(textChunk(QStringLiteral("a")) + textChunk(QStringLiteral("b"))
                       + textChunk(QStringLiteral("c"), true));
        QVERIFY(h.session->isPaused());
        QCOMPARE(h.channel.chunks.size(), 1);

        upstream->feed(sseChunk("[DONE]"));
        QCOMPARE(h.channel.chunks.size(), 1);

        h.channel.drain();
        QTRY_COMPARE(h.channel.chunks.size(), 4);
        QVERIFY(!h.session->isPaused());
    }

    void testInvalidToolArgumentsEndStreamWithError() {
        Harness h;
        h.start(h.context(kStreamBody));
        FakeUpstream* upstream = h.executor.last();
        upstream->respond(200, QStringLiteral("text/event-stream"));
        upstream->feed(sseChunk(R"({"choices":[{"index":0,"delta":{"tool_calls":[{"index":0,"id":"c1","function":{"name":"f","arguments":"{bad"}}]}}]})"));
        upstream->feed(sseChunk(R"({"choices":[{"index":0,"delta":{},"finish_reason":"tool_calls"}]})"));

        QVERIFY(h.session->isBlocked());
        QVERIFY(h.channel.ended);
        QVERIFY(upstream->aborted);
        QVERIFY(h.channel.chunks.last().contains("transport_error"));
        QVERIFY(h.channel.chunks.last().startsWith("data: "));
    }

    void testPostCheckBlockWritesErrorEvent() {
        Harness h;
        h.loader.policy = rules(R"({"rules":[{"id":"leak","message":"secret leaked","pattern":"secret","role":"assistant"}]})");
        h.start(h.context(kStreamBody, true, true));
        FakeUpstream* upstream = h.executor.last();
        QVERIFY(upstream);
        upstream->respond(200, QStringLiteral("text/event-stream"));
        upstream->feed(textChunk(QStringLiteral("the secret"), true) + sseChunk("[DONE]"));

        QVERIFY(h.session->isBlocked());
        QVERIFY(h.channel.ended);
        QCOMPARE(h.channel.chunks.size(), 2);
        QCOMPARE(h.channel.chunks[0], textChunk(QStringLiteral("the secret"), true));
        QVERIFY(h.channel.chunks[1].contains("secret leaked"));
        QVERIFY(!h.channel.body.contains("[DONE]"));

        const QJsonArray annotations = h.store.requests.last().annotations;
        QVERIFY(!annotations.isEmpty());
    }

    void testWholeResponseRelayed() {
        Harness h;
        h.start(h.context(R"({"messages":[{"role":"user","content":"hi"}]})"));
        FakeUpstream* upstream = h.executor.last();
        upstream->respond(200, QStringLiteral("application/json"));
        const QByteArray body = R"({"choices":[{"index":0,"message":{"role":"assistant","content":"Hello"},"finish_reason":"stop"}]})";
        upstream->feed(body.left(20));
        QCOMPARE(h.channel.status, 0);
        upstream->feed(body.mid(20));
        upstream->finish();

        QCOMPARE(h.channel.status, 200);
        QCOMPARE(h.channel.body, body);
        QVERIFY(!h.channel.chunked);
        QCOMPARE(h.session->trace()->entries().size(), 2);
    }

    void testUpstreamErrorPassedThrough() {
        Harness h;
        h.start(h.context(kStreamBody));
        FakeUpstream* upstream = h.executor.last();
        upstream->respond(429, QStringLiteral("application/json"));
        upstream->feed(R"({"error":{"message":"rate limited"}})");
        upstream->finish();

        QCOMPARE(h.channel.status, 429);
        QVERIFY(h.channel.body.contains("rate limited"));
        QCOMPARE(h.session->trace()->entries().size(), 1);
    }
};

QTEST_MAIN(TestLlmSession)
#include "tst_llm_session.moc"
