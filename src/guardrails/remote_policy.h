#pragma once
#include "policy.h"
#include <memory>

// Policy text checked by the remote guardrails service. Each entry is one
// guardrail; its errors become violations tagged with the entry id.
class RemotePolicy : public IPolicyEvaluator,
                     public std::enable_shared_from_this<RemotePolicy> {
public:
    struct Entry {
        QString id;
        QString text;
        bool blocking = true;
    };

    RemotePolicy(IGuardrailsService* service, QList<Entry> entries,
                 const QString& fallbackToken = QString());

    void evaluate(const QJsonArray& messages, const QString& token,
                  Callback done) const override;

    const QList<Entry>& entries() const { return m_entries; }

    // {"errors": [{"args": [msg], "ranges": [...]}]} entries to violations
    static PolicyResult fromErrors(const QJsonArray& errors, const Entry& entry);

private:
    IGuardrailsService* m_service;
    QList<Entry> m_entries;
    QString m_fallbackToken;
};
