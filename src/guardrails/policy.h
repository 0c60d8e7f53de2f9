#pragma once
#include "semantic/result.h"
#include "semantic/types.h"
#include <QCryptographicHash>
#include <QJsonArray>
#include <QStringList>
#include <functional>
#include <memory>

struct Violation {
    QString ruleId;
    QString message;
    QStringList ranges;
    bool blocking = true;
};

struct PolicyResult {
    PolicyDecision decision = PolicyDecision::Allow;
    QList<Violation> violations;
    QJsonArray annotations;

    bool isBlocked() const { return decision == PolicyDecision::Block; }
    // Blocking violations as [{rule_id, message}]
    QJsonArray violationsJson() const;
    QString summary() const;
    void merge(const PolicyResult& other);
};

struct PolicySource {
    enum class Kind { File, Project };

    Kind kind = Kind::File;
    QString value;

    QString key() const {
        return (kind == Kind::File ? QStringLiteral("file:") : QStringLiteral("project:")) + value;
    }

    // Project guardrails are resolved per user, so their cache entries are
    // partitioned by a digest of the caller's token. File sources are shared.
    QString cacheKey(const QString& token) const {
        if (kind == Kind::File)
            return key();
        const QByteArray digest = QCryptographicHash::hash(token.toUtf8(), QCryptographicHash::Sha256);
        return key() + QLatin1Char('@') + QString::fromLatin1(digest.toHex().left(16));
    }
};

// A compiled policy. Evaluation may go over the network, so results arrive
// through the callback.
class IPolicyEvaluator {
public:
    using Callback = std::function<void(Result<PolicyResult>)>;

    virtual ~IPolicyEvaluator() = default;
    virtual void evaluate(const QJsonArray& messages, const QString& token,
                          Callback done) const = 0;
};

using PolicyHandle = std::shared_ptr<const IPolicyEvaluator>;

// One enabled guardrail of a project as stored in the trace store
struct ProjectPolicy {
    QString id;
    QString name;
    QString content;
    bool blocking = true;
};

class IProjectPolicyStore {
public:
    using Callback = std::function<void(Result<QList<ProjectPolicy>>)>;

    virtual ~IProjectPolicyStore() = default;
    virtual void fetchProjectPolicies(const QString& project, const QString& token,
                                      Callback done) = 0;
};

// Remote policy checker: answers the raw error list for one policy text
class IGuardrailsService {
public:
    using Callback = std::function<void(Result<QJsonArray> errors)>;

    virtual ~IGuardrailsService() = default;
    virtual void check(const QJsonArray& messages, const QString& policy,
                       const QString& token, Callback done) = 0;
};

class IPolicyLoader {
public:
    using Callback = std::function<void(Result<PolicyHandle>)>;

    virtual ~IPolicyLoader() = default;
    virtual void load(const PolicySource& source, const QString& token, Callback done) = 0;
};

// Always allows. Stands in for a source that resolves to no guardrails.
class AllowAllPolicy : public IPolicyEvaluator {
public:
    void evaluate(const QJsonArray&, const QString&, Callback done) const override {
        done(PolicyResult{});
    }
};

namespace policy_annotations {

// ['messages.2', 'messages.2.content:25-30', 'messages.2.content'] -> ['messages.2.content:25-30']
QStringList removePrefixes(const QStringList& ranges);

QJsonArray fromViolation(const Violation& violation);

}
