#include "policy.h"
#include <QJsonObject>
#include <algorithm>

QJsonArray PolicyResult::violationsJson() const
{
    QJsonArray out;
    for (const Violation& v : violations) {
        if (!v.blocking)
            continue;
        QJsonObject obj;
        obj[QStringLiteral("rule_id")] = v.ruleId;
        obj[QStringLiteral("message")] = v.message;
        out.append(obj);
    }
    return out;
}

QString PolicyResult::summary() const
{
    QStringList parts;
    for (const Violation& v : violations) {
        if (v.blocking)
            parts.append(v.message);
    }
    return parts.join(QStringLiteral("; "));
}

void PolicyResult::merge(const PolicyResult& other)
{
    if (other.isBlocked())
        decision = PolicyDecision::Block;
    violations += other.violations;
    for (const QJsonValue& a : other.annotations)
        annotations.append(a);
}

namespace policy_annotations {

QStringList removePrefixes(const QStringList& ranges)
{
    QStringList sorted = ranges;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const QString& a, const QString& b) { return a.size() < b.size(); });

    QStringList result;
    for (int i = 0; i < sorted.size(); ++i) {
        bool isPrefix = false;
        for (int j = i + 1; j < sorted.size(); ++j) {
            if (sorted[j] != sorted[i] && sorted[j].startsWith(sorted[i])) {
                isPrefix = true;
                break;
            }
        }
        if (!isPrefix && !result.contains(sorted[i]))
            result.append(sorted[i]);
    }
    return result;
}

QJsonArray fromViolation(const Violation& violation)
{
    QJsonArray out;
    const QString action = violation.blocking ? QStringLiteral("block") : QStringLiteral("log");
    for (const QString& range : removePrefixes(violation.ranges)) {
        QJsonObject meta;
        meta[QStringLiteral("source")] = QStringLiteral("guardrails-error");
        meta[QStringLiteral("guardrail-action")] = action;

        QJsonObject annotation;
        annotation[QStringLiteral("content")] = violation.message;
        annotation[QStringLiteral("address")] = range;
        annotation[QStringLiteral("extra_metadata")] = meta;
        out.append(annotation);
    }
    return out;
}

}
