#include "guardrails_engine.h"
#include "core/log_manager.h"
#include <QPointer>

GuardrailsEngine::GuardrailsEngine(IPolicyLoader* loader, QObject* parent)
    : QObject(parent)
    , m_loader(loader)
{
}

bool GuardrailsEngine::isCached(const QString& sourceKey) const
{
    auto it = m_cache.constFind(sourceKey);
    return it != m_cache.constEnd() && it->handle;
}

bool GuardrailsEngine::isLoading(const QString& sourceKey) const
{
    auto it = m_cache.constFind(sourceKey);
    return it != m_cache.constEnd() && it->loading;
}

void GuardrailsEngine::invalidate(const QString& sourceKey)
{
    // A source key also drops every per-token entry derived from it
    const QString tokenScoped = sourceKey + QLatin1Char('@');
    int dropped = 0;
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (!it->loading && (it.key() == sourceKey || it.key().startsWith(tokenScoped))) {
            it = m_cache.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    if (dropped > 0)
        LOG_DEBUG(QStringLiteral("GuardrailsEngine: invalidated %1").arg(sourceKey));
}

void GuardrailsEngine::resolve(const PolicySource& source, const QString& token,
                               ResolveCallback done)
{
    const QString key = source.cacheKey(token);
    auto it = m_cache.find(key);
    if (it != m_cache.end()) {
        if (it->handle) {
            done(it->handle);
            return;
        }
        it->waiters.append(std::move(done));
        return;
    }

    Entry& entry = m_cache[key];
    entry.loading = true;
    entry.waiters.append(std::move(done));

    LOG_INFO(QStringLiteral("GuardrailsEngine: loading %1").arg(key));
    QPointer<GuardrailsEngine> guard(this);
    m_loader->load(source, token, [guard, key](Result<PolicyHandle> loaded) {
        if (!guard)
            return;
        GuardrailsEngine* self = guard.data();
        auto entryIt = self->m_cache.find(key);
        if (entryIt == self->m_cache.end())
            return;

        const QList<ResolveCallback> waiters = entryIt->waiters;
        if (loaded) {
            entryIt->handle = *loaded;
            entryIt->loading = false;
            entryIt->waiters.clear();
            emit self->policyLoaded(key);
        } else {
            LOG_ERROR(QStringLiteral("GuardrailsEngine: loading %1 failed: %2")
                          .arg(key, loaded.error().message));
            self->m_cache.erase(entryIt);
            emit self->policyLoadFailed(key, loaded.error());
        }

        for (const ResolveCallback& waiter : waiters)
            waiter(loaded);
    });
}

void GuardrailsEngine::evaluate(const QList<PolicySource>& sources, const QJsonArray& messages,
                                const QString& token, EvaluateCallback done)
{
    if (sources.isEmpty()) {
        done(PolicyResult{});
        return;
    }

    struct Pending {
        QList<PolicyResult> results;
        std::optional<DomainFailure> failure;
        int remaining = 0;
        EvaluateCallback done;
    };
    auto pending = std::make_shared<Pending>();
    pending->results.resize(sources.size());
    pending->remaining = sources.size();
    pending->done = std::move(done);

    auto finishOne = [pending]() {
        if (--pending->remaining > 0)
            return;
        if (pending->failure) {
            pending->done(std::unexpected(*pending->failure));
            return;
        }
        PolicyResult merged;
        for (const PolicyResult& r : pending->results)
            merged.merge(r);
        pending->done(merged);
    };

    for (int i = 0; i < sources.size(); ++i) {
        resolve(sources[i], token,
                [pending, finishOne, messages, token, i](Result<PolicyHandle> handle) {
            if (!handle) {
                if (!pending->failure)
                    pending->failure = handle.error();
                finishOne();
                return;
            }
            // Keep the evaluator alive for the duration of its callback
            PolicyHandle policy = *handle;
            policy->evaluate(messages, token,
                             [pending, finishOne, policy, i](Result<PolicyResult> result) {
                if (!result) {
                    if (!pending->failure)
                        pending->failure = result.error();
                } else {
                    pending->results[i] = *result;
                }
                finishOne();
            });
        });
    }
}
