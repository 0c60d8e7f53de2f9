#include <QTest>
#include <QSignalSpy>
#include "fakes.h"
#include "trace/trace_assembler.h"

namespace {

CanonicalMessage textMessage(Role role, const QString& text)
{
    CanonicalMessage message;
    message.role = role;
    message.content.append(ContentPart::fromText(text));
    return message;
}

QJsonObject annotation(const QString& content, const QString& address)
{
    QJsonObject obj;
    obj["content"] = content;
    obj["address"] = address;
    return obj;
}

}

class TestTraceAssembler : public QObject {
    Q_OBJECT

private slots:
    void testPushDisabledWithoutToken() {
        FakeTraceStore store;
        TraceAssembler trace(&store, QStringLiteral("proj"), QString());
        QVERIFY(!trace.isPushEnabled());

        QSignalSpy drained(&trace, &TraceAssembler::drained);
        trace.append(textMessage(Role::User, QStringLiteral("hi")));
        trace.close();
        QVERIFY(store.requests.isEmpty());
        QCOMPARE(drained.count(), 1);
        QCOMPARE(trace.entries().size(), 1);
    }

    void testFirstPushCreatesTraceThenAppends() {
        FakeTraceStore store;
        TraceAssembler trace(&store, QStringLiteral("proj"), QStringLiteral("tok"));

        trace.append(textMessage(Role::User, QStringLiteral("question")));
        QCOMPARE(store.requests.size(), 1);
        QVERIFY(store.requests[0].traceId.isEmpty());
        QCOMPARE(store.requests[0].projectRef, QStringLiteral("proj"));
        QCOMPARE(store.requests[0].token, QStringLiteral("tok"));
        QCOMPARE(trace.traceId(), QStringLiteral("trace-1"));

        trace.append(textMessage(Role::Assistant, QStringLiteral("answer")));
        QCOMPARE(store.requests.size(), 2);
        QCOMPARE(store.requests[1].traceId, QStringLiteral("trace-1"));
        QCOMPARE(store.requests[1].messages.size(), 1);
        QCOMPARE(trace.pushState(), PushState::Pushed);
        QCOMPARE(trace.pushedCount(), 2);
    }

    void testOnePushInFlight() {
        FakeTraceStore store;
        store.autoReply = false;
        TraceAssembler trace(&store, QStringLiteral("proj"), QStringLiteral("tok"));

        trace.append(textMessage(Role::User, QStringLiteral("a")));
        trace.append(textMessage(Role::Assistant, QStringLiteral("b")));
        trace.append(textMessage(Role::User, QStringLiteral("c")));
        QCOMPARE(store.requests.size(), 1);
        QVERIFY(trace.isPushInFlight());

        store.replyNext();
        // Entries completed while the first push was out go together
        QCOMPARE(store.requests.size(), 2);
        QCOMPARE(store.requests[1].messages.size(), 2);
        QCOMPARE(trace.pushState(), PushState::PartiallyPushed);

        store.replyNext();
        QCOMPARE(trace.pushState(), PushState::Pushed);
        QCOMPARE(trace.entries().at(2).index, 2);
    }

    void testFailureRetriedOnceAtClose() {
        FakeTraceStore store;
        store.failing = true;
        TraceAssembler trace(&store, QStringLiteral("proj"), QStringLiteral("tok"));
        QSignalSpy failed(&trace, &TraceAssembler::pushFailed);
        QSignalSpy drained(&trace, &TraceAssembler::drained);

        trace.append(textMessage(Role::User, QStringLiteral("a")));
        QCOMPARE(trace.pushState(), PushState::Failed);
        trace.append(textMessage(Role::Assistant, QStringLiteral("b")));
        QCOMPARE(store.requests.size(), 1);

        store.failing = false;
        trace.close();
        QCOMPARE(store.requests.size(), 2);
        QCOMPARE(store.requests[1].messages.size(), 2);
        QCOMPARE(trace.pushState(), PushState::Pushed);
        QCOMPARE(failed.count(), 1);
        QCOMPARE(drained.count(), 1);
    }

    void testRetryFailureStillDrains() {
        FakeTraceStore store;
        store.failing = true;
        TraceAssembler trace(&store, QStringLiteral("proj"), QStringLiteral("tok"));
        QSignalSpy drained(&trace, &TraceAssembler::drained);

        trace.append(textMessage(Role::User, QStringLiteral("a")));
        trace.close();
        QCOMPARE(store.requests.size(), 2);
        QCOMPARE(trace.pushState(), PushState::Failed);
        QCOMPARE(drained.count(), 1);
    }

    void testAnnotationsDeduplicated() {
        FakeTraceStore store;
        TraceAssembler trace(&store, QStringLiteral("proj"), QStringLiteral("tok"));

        const QJsonArray first{annotation(QStringLiteral("pii"), QStringLiteral("messages.0.content"))};
        trace.append(textMessage(Role::User, QStringLiteral("a")), first);
        QCOMPARE(store.requests[0].annotations.size(), 1);

        trace.addAnnotations(first);
        trace.append(textMessage(Role::Assistant, QStringLiteral("b")), first);
        QVERIFY(store.requests[1].annotations.isEmpty());

        trace.addAnnotations({annotation(QStringLiteral("pii"), QStringLiteral("messages.1.content"))});
        trace.close();
        // Annotation-only push for the already existing trace
        QCOMPARE(store.requests.size(), 3);
        QVERIFY(store.requests[2].messages.isEmpty());
        QCOMPARE(store.requests[2].annotations.size(), 1);
    }

    void testAppendAfterCloseIgnored() {
        FakeTraceStore store;
        TraceAssembler trace(&store, QStringLiteral("proj"), QStringLiteral("tok"));
        trace.close();
        trace.append(textMessage(Role::User, QStringLiteral("late")));
        QVERIFY(trace.entries().isEmpty());
        QVERIFY(store.requests.isEmpty());
    }

    void testDrainWaitsForInFlightPush() {
        FakeTraceStore store;
        store.autoReply = false;
        TraceAssembler trace(&store, QStringLiteral("proj"), QStringLiteral("tok"));
        QSignalSpy drained(&trace, &TraceAssembler::drained);

        trace.append(textMessage(Role::User, QStringLiteral("a")));
        trace.close();
        QCOMPARE(drained.count(), 0);
        store.replyNext();
        QCOMPARE(drained.count(), 1);
    }
};

QTEST_MAIN(TestTraceAssembler)
#include "tst_trace_assembler.moc"
