#include "rule_policy.h"
#include <QJsonDocument>

bool RulePolicy::isRuleDocument(const QByteArray& content)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(content, &err);
    return err.error == QJsonParseError::NoError && doc.isObject()
           && doc.object().value(QStringLiteral("rules")).isArray();
}

Result<std::shared_ptr<RulePolicy>> RulePolicy::fromJson(const QJsonObject& root)
{
    QList<Rule> rules;
    const QJsonArray array = root.value(QStringLiteral("rules")).toArray();
    for (int i = 0; i < array.size(); ++i) {
        const QJsonObject obj = array.at(i).toObject();

        Rule rule;
        rule.id = obj.value(QStringLiteral("id")).toString();
        if (rule.id.isEmpty())
            rule.id = QStringLiteral("rule-%1").arg(i);
        rule.message = obj.value(QStringLiteral("message")).toString(rule.id);
        rule.tool = obj.value(QStringLiteral("tool")).toString();

        const QString roleName = obj.value(QStringLiteral("role")).toString();
        if (!roleName.isEmpty()) {
            rule.role = roleFromName(roleName);
            if (!rule.role) {
                return std::unexpected(DomainFailure::guardrailsUnavailable(
                    QStringLiteral("Rule %1: unknown role '%2'").arg(rule.id, roleName)));
            }
        }

        const QString pattern = obj.value(QStringLiteral("pattern")).toString();
        if (!pattern.isEmpty()) {
            rule.pattern = QRegularExpression(pattern);
            if (!rule.pattern.isValid()) {
                return std::unexpected(DomainFailure::guardrailsUnavailable(
                    QStringLiteral("Rule %1: invalid pattern: %2")
                        .arg(rule.id, rule.pattern.errorString())));
            }
        }

        if (pattern.isEmpty() && rule.tool.isEmpty()) {
            return std::unexpected(DomainFailure::guardrailsUnavailable(
                QStringLiteral("Rule %1 needs a pattern or a tool").arg(rule.id)));
        }

        const QString action = obj.value(QStringLiteral("action")).toString(QStringLiteral("block"));
        if (action != QStringLiteral("block") && action != QStringLiteral("log")) {
            return std::unexpected(DomainFailure::guardrailsUnavailable(
                QStringLiteral("Rule %1: unknown action '%2'").arg(rule.id, action)));
        }
        rule.blocking = action == QStringLiteral("block");
        rules.append(rule);
    }
    return std::make_shared<RulePolicy>(rules);
}

RulePolicy::RulePolicy(QList<Rule> rules)
    : m_rules(std::move(rules))
{
}

void RulePolicy::evaluate(const QJsonArray& messages, const QString& token,
                          Callback done) const
{
    Q_UNUSED(token);
    done(check(messages));
}

PolicyResult RulePolicy::check(const QJsonArray& messages) const
{
    PolicyResult result;
    for (const Rule& rule : m_rules) {
        QStringList ranges;
        for (int i = 0; i < messages.size(); ++i) {
            const QJsonObject msg = messages.at(i).toObject();
            if (rule.role) {
                const auto role = roleFromName(msg.value(QStringLiteral("role")).toString());
                if (role != rule.role)
                    continue;
            }

            const QString address = QStringLiteral("messages.%1").arg(i);
            if (!rule.tool.isEmpty()) {
                ranges += matchToolCalls(rule, msg.value(QStringLiteral("tool_calls")).toArray(),
                                         address + QStringLiteral(".tool_calls"));
            } else {
                ranges += matchText(rule, msg.value(QStringLiteral("content")),
                                    address + QStringLiteral(".content"));
            }
        }

        if (ranges.isEmpty())
            continue;

        Violation v;
        v.ruleId = rule.id;
        v.message = rule.message;
        v.ranges = ranges;
        v.blocking = rule.blocking;
        if (v.blocking)
            result.decision = PolicyDecision::Block;
        result.violations.append(v);
        for (const QJsonValue& a : policy_annotations::fromViolation(v))
            result.annotations.append(a);
    }
    return result;
}

QStringList RulePolicy::matchText(const Rule& rule, const QJsonValue& content,
                                  const QString& address) const
{
    QStringList ranges;
    auto scan = [&](const QString& text, const QString& at) {
        auto it = rule.pattern.globalMatch(text);
        while (it.hasNext()) {
            const QRegularExpressionMatch m = it.next();
            if (m.capturedLength() == 0)
                continue;
            ranges.append(QStringLiteral("%1:%2-%3").arg(at).arg(m.capturedStart()).arg(m.capturedEnd()));
        }
    };

    if (content.isString()) {
        scan(content.toString(), address);
    } else if (content.isArray()) {
        const QJsonArray parts = content.toArray();
        for (int k = 0; k < parts.size(); ++k) {
            const QJsonObject part = parts.at(k).toObject();
            if (part.contains(QStringLiteral("text")))
                scan(part.value(QStringLiteral("text")).toString(),
                     QStringLiteral("%1.%2.text").arg(address).arg(k));
        }
    }
    return ranges;
}

QStringList RulePolicy::matchToolCalls(const Rule& rule, const QJsonArray& toolCalls,
                                       const QString& address) const
{
    QStringList ranges;
    for (int j = 0; j < toolCalls.size(); ++j) {
        const QJsonObject function = toolCalls.at(j).toObject()
                                         .value(QStringLiteral("function")).toObject();
        const QString name = function.value(QStringLiteral("name")).toString();
        if (rule.tool != QStringLiteral("*") && rule.tool != name)
            continue;

        const QString at = QStringLiteral("%1.%2").arg(address).arg(j);
        if (rule.pattern.pattern().isEmpty()) {
            ranges.append(at);
            continue;
        }

        const QString args = function.value(QStringLiteral("arguments")).toString();
        auto m = rule.pattern.match(args);
        if (m.hasMatch()) {
            ranges.append(QStringLiteral("%1.function.arguments:%2-%3")
                              .arg(at).arg(m.capturedStart()).arg(m.capturedEnd()));
        }
    }
    return ranges;
}
