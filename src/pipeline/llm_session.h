#pragma once
#include "config/config_types.h"
#include "guardrails/policy.h"
#include "semantic/ports.h"
#include "semantic/upstream_stream.h"
#include "semantic/features/message_assembler.h"
#include <QObject>
#include <QPointer>
#include <memory>

class DownstreamChannel;
class GuardrailsEngine;
class ITraceStore;
class StreamSession;
class TraceAssembler;

struct LlmCallContext {
    InboundRequest request;
    QString project;                  // empty: proxy without pushing
    Credential credential;
    QList<PolicySource> policySources;
};

struct LlmSessionDeps {
    IExecutor* executor = nullptr;
    ITraceStore* traceStore = nullptr;
    GuardrailsEngine* guardrails = nullptr;
    RuntimeOptions runtime;
};

// Drives one LLM call: pre-check, upstream open, unit-by-unit relay to the
// client, and the trace/post-check work on each completed message. The relay
// never waits on tracing or policy calls.
class LlmSession : public QObject {
    Q_OBJECT
public:
    LlmSession(std::unique_ptr<IProviderAdapter> adapter, DownstreamChannel* channel,
               const LlmSessionDeps& deps, QObject* parent = nullptr);
    ~LlmSession() override;

    void start(const LlmCallContext& context);
    // Client went away: stop reading upstream, flush what was traced
    void abort();

    SessionState state() const { return m_state; }
    bool isBlocked() const { return m_blockFailure.has_value(); }
    bool isPaused() const;
    bool upstreamOpened() const { return m_stream != nullptr; }
    TraceAssembler* trace() const { return m_trace; }

signals:
    void finished();

private slots:
    void onHeadersReady(int status, const QMap<QString, QString>& headers);
    void onUnit(const WireUnit& unit);
    void onUpstreamFinished();
    void onUpstreamError(const DomainFailure& failure);
    void onDrained();
    void onDisconnected();

private:
    std::unique_ptr<IProviderAdapter> m_adapter;
    DownstreamChannel* m_channel;
    LlmSessionDeps m_deps;
    LlmCallContext m_context;
    StreamSession* m_stream = nullptr;
    QPointer<TraceAssembler> m_trace;
    MessageAssembler m_assembler;
    SessionState m_state = SessionState::Negotiating;
    std::optional<DomainFailure> m_blockFailure;
    int m_upstreamStatus = 0;
    QMap<QString, QString> m_upstreamHeaders;
    int m_pendingChecks = 0;
    bool m_observing = false;
    bool m_relayChunked = false;
    bool m_upstreamDone = false;
    bool m_errorWritten = false;
    bool m_done = false;

    void runPreCheck(const QList<CanonicalMessage>& requestMessages);
    void openUpstream();
    void handleFrames(const QList<StreamFrame>& frames);
    void completeCandidate(int candidateIndex);
    void runPostCheck();
    void block(const DomainFailure& failure);
    void writeTerminalError(const DomainFailure& failure);
    void maybeFinish();
    void finish();
    bool hasGuardrails() const;

    static QMap<QString, QString> responseHeaders(const QMap<QString, QString>& upstream);
};
