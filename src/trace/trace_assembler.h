#pragma once
#include "trace_store.h"
#include "semantic/message.h"
#include "semantic/types.h"
#include <QObject>
#include <QSet>

// Ordered entry list of one session plus its push state. Only complete
// messages are appended. Pushes run one at a time, so the store always sees
// entries in completion order; entries that complete while a push is in
// flight ride along with the next one.
class TraceAssembler : public QObject {
    Q_OBJECT
public:
    TraceAssembler(ITraceStore* store, const QString& projectRef, const QString& token,
                   QObject* parent = nullptr);

    // Without a store, a project or a token the trace is assembled but never pushed
    bool isPushEnabled() const;

    void setMetadata(const QJsonObject& metadata) { m_metadata = metadata; }
    void insertMetadata(const QString& key, const QJsonValue& value) { m_metadata.insert(key, value); }
    QJsonObject metadata() const { return m_metadata; }

    void append(const CanonicalMessage& message, const QJsonArray& annotations = {});
    void addAnnotations(const QJsonArray& annotations);

    // Final flush. A failed push is retried once here; drained() follows
    // when nothing is left to do.
    void close();
    // close(), then deleteLater() once drained
    void closeAndRelease();

    const QList<CanonicalMessage>& entries() const { return m_entries; }
    QJsonArray messagesJson() const;

    PushState pushState() const { return m_state; }
    QString traceId() const { return m_traceId; }
    int pushedCount() const { return m_pushedCount; }
    bool isPushInFlight() const { return m_inFlight; }
    bool isClosed() const { return m_closed; }

signals:
    void pushed(const QString& traceId, int entryCount);
    void pushFailed(const DomainFailure& failure);
    void drained();

private:
    ITraceStore* m_store;
    QString m_projectRef;
    QString m_token;
    QJsonObject m_metadata;
    QList<CanonicalMessage> m_entries;
    QJsonArray m_pendingAnnotations;
    QSet<QString> m_annotationKeys;
    QString m_traceId;
    PushState m_state = PushState::Pending;
    int m_pushedCount = 0;
    bool m_inFlight = false;
    bool m_closed = false;
    bool m_retried = false;
    bool m_drained = false;

    void pushNext();
    void finishDrain();
};
