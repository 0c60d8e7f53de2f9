#include "llm_session.h"
#include "core/log_manager.h"
#include "guardrails/guardrails_engine.h"
#include "proxy/downstream_channel.h"
#include "proxy/http_writer.h"
#include "semantic/message_codec.h"
#include "semantic/stream_session.h"
#include "trace/trace_assembler.h"
#include <QJsonDocument>

LlmSession::LlmSession(std::unique_ptr<IProviderAdapter> adapter, DownstreamChannel* channel,
                       const LlmSessionDeps& deps, QObject* parent)
    : QObject(parent)
    , m_adapter(std::move(adapter))
    , m_channel(channel)
    , m_deps(deps)
{
    Q_ASSERT(m_adapter);
    Q_ASSERT(m_channel);
    connect(m_channel, &DownstreamChannel::drained, this, &LlmSession::onDrained);
    connect(m_channel, &DownstreamChannel::disconnected, this, &LlmSession::onDisconnected);
}

LlmSession::~LlmSession()
{
    if (!m_done && m_stream)
        m_stream->abort();
    if (m_trace && !m_trace->isClosed())
        m_trace->closeAndRelease();
}

bool LlmSession::isPaused() const
{
    return m_stream && m_stream->isPaused();
}

bool LlmSession::hasGuardrails() const
{
    return m_deps.guardrails && !m_context.policySources.isEmpty();
}

QMap<QString, QString> LlmSession::responseHeaders(const QMap<QString, QString>& upstream)
{
    static const QStringList hopByHop = {
        QStringLiteral("content-length"), QStringLiteral("transfer-encoding"),
        QStringLiteral("connection"), QStringLiteral("keep-alive"),
        QStringLiteral("content-encoding"), QStringLiteral("date"),
        QStringLiteral("server")
    };
    QMap<QString, QString> out;
    for (auto it = upstream.constBegin(); it != upstream.constEnd(); ++it) {
        if (!hopByHop.contains(it.key()))
            out.insert(it.key(), it.value());
    }
    return out;
}

// ------------------------------------------------------------------
// Start / pre-check
// ------------------------------------------------------------------

void LlmSession::start(const LlmCallContext& context)
{
    m_context = context;
    m_observing = m_context.credential.hasGatewayToken();

    if (!m_observing) {
        // No gateway token: plain proxy, no trace and no guardrails
        openUpstream();
        return;
    }

    const QString project = m_context.project;
    m_trace = new TraceAssembler(m_deps.traceStore, project, *m_context.credential.gatewayToken);
    QJsonObject metadata;
    metadata[QStringLiteral("source")] = QStringLiteral("gateway");
    metadata[QStringLiteral("provider")] = m_adapter->providerId();
    m_trace->setMetadata(metadata);

    QList<CanonicalMessage> requestMessages;
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(m_context.request.body, &err);
    if (err.error == QJsonParseError::NoError && doc.isObject()) {
        auto parsed = m_adapter->requestMessages(doc.object());
        if (!parsed) {
            LOG_WARNING(QStringLiteral("LlmSession: request messages not traced: %1")
                            .arg(parsed.error().message));
        } else {
            requestMessages = *parsed;
        }
    } else if (!m_context.request.body.isEmpty()) {
        LOG_WARNING(QStringLiteral("LlmSession: request body is not a JSON object"));
    }

    runPreCheck(requestMessages);
}

void LlmSession::runPreCheck(const QList<CanonicalMessage>& requestMessages)
{
    if (!hasGuardrails()) {
        for (const CanonicalMessage& msg : requestMessages)
            m_trace->append(msg);
        openUpstream();
        return;
    }

    QPointer<LlmSession> guard(this);
    m_deps.guardrails->evaluate(
        m_context.policySources, MessageCodec::toJson(requestMessages),
        *m_context.credential.gatewayToken,
        [guard, requestMessages](Result<PolicyResult> result) {
        if (!guard || guard->m_done)
            return;
        LlmSession* self = guard.data();

        if (!result) {
            LOG_ERROR(QStringLiteral("LlmSession: pre-check unavailable: %1")
                          .arg(result.error().message));
            self->m_channel->writeBody(result.error().httpStatus(), result.error().toBody());
            self->finish();
            return;
        }

        for (const CanonicalMessage& msg : requestMessages)
            self->m_trace->append(msg);
        self->m_trace->addAnnotations(result->annotations);

        if (result->isBlocked()) {
            const DomainFailure failure = DomainFailure::guardrailViolation(
                QStringLiteral("[Invariant Guardrails] Request blocked: %1").arg(result->summary()),
                result->violationsJson());
            LOG_INFO(QStringLiteral("LlmSession: pre-check blocked request: %1")
                         .arg(result->summary()));
            self->m_blockFailure = failure;
            self->m_channel->writeBody(failure.httpStatus(), failure.toBody());
            self->finish();
            return;
        }

        self->openUpstream();
    });
}

void LlmSession::openUpstream()
{
    if (m_done)
        return;

    auto built = m_adapter->buildUpstreamRequest(m_context.request, m_context.credential);
    if (!built) {
        m_channel->writeBody(built.error().httpStatus(), built.error().toBody());
        finish();
        return;
    }

    LOG_INFO(QStringLiteral("LlmSession: %1 %2 (stream=%3)")
                 .arg(built->method, built->url)
                 .arg(built->stream ? QStringLiteral("yes") : QStringLiteral("no")));

    UpstreamStream* upstream = m_deps.executor->open(*built, nullptr);
    m_stream = new StreamSession(upstream, WireFormat::Whole, this);
    m_stream->setTimeouts(m_deps.runtime.connectTimeout, m_deps.runtime.readTimeout);

    connect(m_stream, &StreamSession::headersReady, this, &LlmSession::onHeadersReady);
    connect(m_stream, &StreamSession::unitReady, this, &LlmSession::onUnit);
    connect(m_stream, &StreamSession::finished, this, &LlmSession::onUpstreamFinished);
    connect(m_stream, &StreamSession::error, this, &LlmSession::onUpstreamError);

    m_state = SessionState::Open;
    m_stream->start();
}

// ------------------------------------------------------------------
// Relay
// ------------------------------------------------------------------

void LlmSession::onHeadersReady(int status, const QMap<QString, QString>& headers)
{
    m_upstreamStatus = status;
    m_upstreamHeaders = headers;

    const bool ok = status >= 200 && status < 300;
    if (ok && m_adapter->isStreaming(m_context.request)) {
        m_relayChunked = true;
        m_stream->setFormat(m_adapter->streamFormat(m_context.request));
        m_channel->writeHead(status, responseHeaders(headers), true);
    } else {
        // Whole body: either a non-streaming call or an upstream error passed through
        m_stream->setFormat(WireFormat::Whole);
    }
}

void LlmSession::onUnit(const WireUnit& unit)
{
    if (m_done)
        return;

    if (m_relayChunked) {
        m_channel->writeChunk(unit.raw);

        if (m_observing && unit.hasPayload()) {
            auto frames = m_adapter->parseStreamChunk(unit);
            if (frames) {
                handleFrames(*frames);
            } else if (frames.error().kind == ErrorKind::UpstreamProviderError) {
                LOG_WARNING(QStringLiteral("LlmSession: upstream error event: %1")
                                .arg(frames.error().message));
            } else {
                LOG_WARNING(QStringLiteral("LlmSession: unreadable stream unit: %1")
                                .arg(frames.error().message));
            }
        }

        if (!m_done && m_stream && !m_stream->isDone()
            && m_channel->pendingBytes() > m_deps.runtime.downstreamHighWater) {
            m_stream->pause();
        }
        return;
    }

    const QString contentType = m_upstreamHeaders.value(
        QStringLiteral("content-type"), QStringLiteral("application/json"));
    QMap<QString, QString> headers = responseHeaders(m_upstreamHeaders);
    headers.remove(QStringLiteral("content-type"));
    m_channel->writeBody(m_upstreamStatus, unit.raw, contentType, headers);

    if (m_upstreamStatus < 200 || m_upstreamStatus >= 300) {
        LOG_WARNING(QStringLiteral("LlmSession: upstream answered HTTP %1").arg(m_upstreamStatus));
        return;
    }

    if (m_observing) {
        auto frames = m_adapter->parseResponse(unit.raw);
        if (!frames) {
            LOG_WARNING(QStringLiteral("LlmSession: response not traced: %1")
                            .arg(frames.error().message));
            return;
        }
        handleFrames(*frames);
    }
}

void LlmSession::handleFrames(const QList<StreamFrame>& frames)
{
    for (const StreamFrame& frame : frames) {
        if (m_done)
            return;
        m_assembler.addFrame(frame);
        if (m_adapter->isMessageComplete(frame))
            completeCandidate(frame.candidateIndex);
    }
}

void LlmSession::completeCandidate(int candidateIndex)
{
    if (m_done || !m_assembler.hasCandidate(candidateIndex))
        return;

    auto message = m_assembler.complete(candidateIndex);
    if (!message) {
        LOG_ERROR(QStringLiteral("LlmSession: %1").arg(message.error().message));
        block(message.error());
        return;
    }

    m_trace->append(*message);
    runPostCheck();
}

void LlmSession::runPostCheck()
{
    if (!hasGuardrails())
        return;

    ++m_pendingChecks;
    QPointer<LlmSession> guard(this);
    m_deps.guardrails->evaluate(
        m_context.policySources, m_trace->messagesJson(),
        *m_context.credential.gatewayToken,
        [guard](Result<PolicyResult> result) {
        if (!guard)
            return;
        LlmSession* self = guard.data();
        --self->m_pendingChecks;
        if (self->m_done)
            return;

        if (!result) {
            LOG_ERROR(QStringLiteral("LlmSession: post-check unavailable: %1")
                          .arg(result.error().message));
            self->block(result.error());
        } else {
            if (self->m_trace)
                self->m_trace->addAnnotations(result->annotations);
            if (result->isBlocked()) {
                LOG_INFO(QStringLiteral("LlmSession: post-check blocked response: %1")
                             .arg(result->summary()));
                self->block(DomainFailure::guardrailViolation(
                    QStringLiteral("[Invariant Guardrails] Response blocked: %1")
                        .arg(result->summary()),
                    result->violationsJson()));
            }
        }
        self->maybeFinish();
    });
}

// ------------------------------------------------------------------
// Termination
// ------------------------------------------------------------------

void LlmSession::block(const DomainFailure& failure)
{
    if (m_blockFailure)
        return;
    m_blockFailure = failure;

    if (!m_relayChunked) {
        // The whole body is already with the client; the trace keeps the verdict
        return;
    }

    if (m_stream && !m_stream->isDone()) {
        m_stream->abort();
        m_upstreamDone = true;
    }
    maybeFinish();
}

void LlmSession::writeTerminalError(const DomainFailure& failure)
{
    if (m_errorWritten || !m_channel->isOpen())
        return;
    m_errorWritten = true;

    if (!m_channel->headersSent()) {
        m_channel->writeBody(failure.httpStatus(), failure.toBody());
        return;
    }

    const QByteArray json = QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact);
    switch (m_stream ? m_stream->format() : WireFormat::Sse) {
    case WireFormat::Sse:
        m_channel->writeChunk(HttpWriter::sseEvent(
            json, m_adapter->family() == ProviderFamily::Anthropic ? QStringLiteral("error")
                                                                   : QString()));
        break;
    case WireFormat::JsonLines:
    case WireFormat::Whole:
        m_channel->writeChunk(json + "\n");
        break;
    }
}

void LlmSession::onUpstreamFinished()
{
    m_upstreamDone = true;
    if (m_observing) {
        // Streams that end without an explicit stop still yield their messages
        for (int candidate : m_assembler.openCandidates())
            completeCandidate(candidate);
    }
    maybeFinish();
}

void LlmSession::onUpstreamError(const DomainFailure& failure)
{
    if (m_done)
        return;
    m_upstreamDone = true;
    writeTerminalError(failure);
    if (m_relayChunked)
        m_channel->endChunks();
    finish();
}

void LlmSession::maybeFinish()
{
    if (m_done || !m_upstreamDone || m_pendingChecks > 0)
        return;

    if (m_relayChunked) {
        if (m_blockFailure)
            writeTerminalError(*m_blockFailure);
        m_channel->endChunks();
    }
    finish();
}

void LlmSession::onDrained()
{
    if (m_stream && m_stream->isPaused()
        && m_channel->pendingBytes() <= m_deps.runtime.downstreamHighWater)
        m_stream->resume();
}

void LlmSession::onDisconnected()
{
    LOG_DEBUG(QStringLiteral("LlmSession: client disconnected"));
    abort();
}

void LlmSession::abort()
{
    if (m_done)
        return;
    if (m_stream)
        m_stream->abort();
    m_upstreamDone = true;
    finish();
}

void LlmSession::finish()
{
    if (m_done)
        return;
    m_done = true;
    m_state = SessionState::Closing;

    if (m_trace)
        m_trace->closeAndRelease();

    m_state = SessionState::Closed;
    emit finished();
}
