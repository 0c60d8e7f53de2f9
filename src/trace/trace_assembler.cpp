#include "trace_assembler.h"
#include "semantic/message_codec.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QPointer>

TraceAssembler::TraceAssembler(ITraceStore* store, const QString& projectRef,
                               const QString& token, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_projectRef(projectRef)
    , m_token(token)
{
}

bool TraceAssembler::isPushEnabled() const
{
    return m_store && !m_projectRef.isEmpty() && !m_token.isEmpty();
}

QJsonArray TraceAssembler::messagesJson() const
{
    return MessageCodec::toJson(m_entries);
}

void TraceAssembler::append(const CanonicalMessage& message, const QJsonArray& annotations)
{
    if (m_closed) {
        LOG_WARNING(QStringLiteral("TraceAssembler: append after close ignored"));
        return;
    }
    CanonicalMessage entry = message;
    entry.index = m_entries.size();
    m_entries.append(entry);
    addAnnotations(annotations);
    pushNext();
}

void TraceAssembler::addAnnotations(const QJsonArray& annotations)
{
    for (const QJsonValue& value : annotations) {
        const QJsonObject obj = value.toObject();
        const QString key = obj.value(QStringLiteral("content")).toString()
                            + QLatin1Char('\n')
                            + obj.value(QStringLiteral("address")).toString();
        if (m_annotationKeys.contains(key))
            continue;
        m_annotationKeys.insert(key);
        m_pendingAnnotations.append(obj);
    }
}

void TraceAssembler::close()
{
    if (m_closed)
        return;
    m_closed = true;

    if (m_state == PushState::Failed && !m_retried) {
        m_retried = true;
        LOG_INFO(QStringLiteral("TraceAssembler: retrying failed push for %1").arg(m_projectRef));
    }
    pushNext();
}

void TraceAssembler::closeAndRelease()
{
    connect(this, &TraceAssembler::drained, this, &QObject::deleteLater);
    close();
}

void TraceAssembler::finishDrain()
{
    if (m_drained)
        return;
    m_drained = true;
    emit drained();
}

void TraceAssembler::pushNext()
{
    if (m_inFlight)
        return;

    if (!isPushEnabled()) {
        if (m_closed)
            finishDrain();
        return;
    }

    // After a failure nothing more goes out until the retry at close
    if (m_state == PushState::Failed && !(m_closed && m_retried)) {
        if (m_closed)
            finishDrain();
        return;
    }

    const int total = m_entries.size();
    const bool annotationsOnly = m_pushedCount >= total && !m_pendingAnnotations.isEmpty()
                                 && !m_traceId.isEmpty();
    if (m_pushedCount >= total && !annotationsOnly) {
        if (m_closed)
            finishDrain();
        return;
    }

    TracePushRequest request;
    request.projectRef = m_projectRef;
    request.traceId = m_traceId;
    request.token = m_token;
    request.metadata = m_metadata;
    request.messages = MessageCodec::toJson(m_entries.mid(m_pushedCount));
    request.annotations = m_pendingAnnotations;

    const QJsonArray sentAnnotations = m_pendingAnnotations;
    m_pendingAnnotations = QJsonArray();
    m_inFlight = true;

    QPointer<TraceAssembler> guard(this);
    m_store->push(request, [guard, total, sentAnnotations](Result<QString> result) {
        if (!guard)
            return;
        TraceAssembler* self = guard.data();
        self->m_inFlight = false;

        if (!result) {
            // Put the annotations back in front of anything added meanwhile
            QJsonArray restored = sentAnnotations;
            for (const QJsonValue& v : self->m_pendingAnnotations)
                restored.append(v);
            self->m_pendingAnnotations = restored;

            const bool retryNow = self->m_closed && !self->m_retried;
            self->m_state = PushState::Failed;
            LOG_WARNING(QStringLiteral("TraceAssembler: %1").arg(result.error().message));
            emit self->pushFailed(result.error());
            if (!guard)
                return;

            if (retryNow) {
                self->m_retried = true;
                self->pushNext();
            } else if (self->m_closed) {
                self->finishDrain();
            }
            return;
        }

        if (self->m_traceId.isEmpty())
            self->m_traceId = *result;
        self->m_pushedCount = total;
        self->m_state = total == self->m_entries.size() ? PushState::Pushed
                                                        : PushState::PartiallyPushed;
        LOG_DEBUG(QStringLiteral("TraceAssembler: pushed %1 entries to trace %2")
                      .arg(total).arg(self->m_traceId));
        emit self->pushed(self->m_traceId, total);
        if (!guard)
            return;
        self->pushNext();
    });
}
