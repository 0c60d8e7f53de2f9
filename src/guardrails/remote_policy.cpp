#include "remote_policy.h"
#include <QJsonObject>

RemotePolicy::RemotePolicy(IGuardrailsService* service, QList<Entry> entries,
                           const QString& fallbackToken)
    : m_service(service)
    , m_entries(std::move(entries))
    , m_fallbackToken(fallbackToken)
{
}

PolicyResult RemotePolicy::fromErrors(const QJsonArray& errors, const Entry& entry)
{
    PolicyResult result;
    for (const QJsonValue& value : errors) {
        const QJsonObject error = value.toObject();

        Violation v;
        v.ruleId = entry.id;
        v.blocking = entry.blocking;
        const QJsonArray args = error.value(QStringLiteral("args")).toArray();
        v.message = args.isEmpty() ? entry.id : args.first().toVariant().toString();
        for (const QJsonValue& r : error.value(QStringLiteral("ranges")).toArray())
            v.ranges.append(r.toString());

        if (v.blocking)
            result.decision = PolicyDecision::Block;
        for (const QJsonValue& a : policy_annotations::fromViolation(v))
            result.annotations.append(a);
        result.violations.append(v);
    }
    return result;
}

void RemotePolicy::evaluate(const QJsonArray& messages, const QString& token,
                            Callback done) const
{
    if (m_entries.isEmpty()) {
        done(PolicyResult{});
        return;
    }

    const QString authToken = token.isEmpty() ? m_fallbackToken : token;
    if (authToken.isEmpty()) {
        done(std::unexpected(DomainFailure::guardrailsUnavailable(
            QStringLiteral("No token available to call the guardrails service"))));
        return;
    }

    struct Pending {
        QList<std::optional<PolicyResult>> results;
        std::optional<DomainFailure> failure;
        int remaining = 0;
        Callback done;
    };
    auto pending = std::make_shared<Pending>();
    pending->results.resize(m_entries.size());
    pending->remaining = m_entries.size();
    pending->done = std::move(done);

    auto self = shared_from_this();
    for (int i = 0; i < m_entries.size(); ++i) {
        m_service->check(messages, m_entries[i].text, authToken,
                         [self, pending, i](Result<QJsonArray> errors) {
            if (!errors) {
                if (!pending->failure)
                    pending->failure = errors.error();
            } else {
                pending->results[i] = fromErrors(*errors, self->m_entries[i]);
            }

            if (--pending->remaining > 0)
                return;

            if (pending->failure) {
                pending->done(std::unexpected(*pending->failure));
                return;
            }
            PolicyResult merged;
            for (const auto& r : pending->results)
                merged.merge(*r);
            pending->done(merged);
        });
    }
}
