#pragma once
#include "policy.h"
#include "semantic/message.h"
#include <QJsonObject>
#include <QRegularExpression>
#include <optional>

// Locally compiled guardrail rules, read from
// {"rules": [{"id", "message", "role"?, "pattern"?, "tool"?, "action"?}]}
class RulePolicy : public IPolicyEvaluator {
public:
    struct Rule {
        QString id;
        QString message;
        std::optional<Role> role;
        QRegularExpression pattern;
        QString tool;   // "*" matches any tool
        bool blocking = true;
    };

    static bool isRuleDocument(const QByteArray& content);
    static Result<std::shared_ptr<RulePolicy>> fromJson(const QJsonObject& root);

    explicit RulePolicy(QList<Rule> rules);

    void evaluate(const QJsonArray& messages, const QString& token,
                  Callback done) const override;
    PolicyResult check(const QJsonArray& messages) const;

    int ruleCount() const { return m_rules.size(); }

private:
    QList<Rule> m_rules;

    QStringList matchText(const Rule& rule, const QJsonValue& content,
                          const QString& address) const;
    QStringList matchToolCalls(const Rule& rule, const QJsonArray& toolCalls,
                               const QString& address) const;
};
