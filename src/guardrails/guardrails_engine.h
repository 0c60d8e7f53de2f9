#pragma once
#include "policy.h"
#include <QObject>
#include <QHash>

// Shared policy cache. Each source key is loaded at most once at a time;
// lookups that arrive while a load is running wait on it. Failed loads are
// not cached.
class GuardrailsEngine : public QObject {
    Q_OBJECT
public:
    using ResolveCallback = std::function<void(Result<PolicyHandle>)>;
    using EvaluateCallback = std::function<void(Result<PolicyResult>)>;

    explicit GuardrailsEngine(IPolicyLoader* loader, QObject* parent = nullptr);

    void resolve(const PolicySource& source, const QString& token, ResolveCallback done);

    // Every source is evaluated against the same message prefix and the
    // results merged. No sources allows everything.
    void evaluate(const QList<PolicySource>& sources, const QJsonArray& messages,
                  const QString& token, EvaluateCallback done);

    // Takes a PolicySource::key(); every token's entry for it is dropped
    void invalidate(const QString& sourceKey);
    // Take a PolicySource::cacheKey()
    bool isCached(const QString& cacheKey) const;
    bool isLoading(const QString& cacheKey) const;

signals:
    void policyLoaded(const QString& sourceKey);
    void policyLoadFailed(const QString& sourceKey, const DomainFailure& failure);

private:
    struct Entry {
        PolicyHandle handle;
        bool loading = false;
        QList<ResolveCallback> waiters;
    };

    IPolicyLoader* m_loader;
    QHash<QString, Entry> m_cache;
};
