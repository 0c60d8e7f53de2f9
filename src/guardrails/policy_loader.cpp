#include "policy_loader.h"
#include "remote_policy.h"
#include "rule_policy.h"
#include "core/log_manager.h"
#include <QFile>
#include <QJsonDocument>

PolicyLoader::PolicyLoader(IGuardrailsService* service, IProjectPolicyStore* projects,
                           const QString& fallbackToken)
    : m_service(service)
    , m_projects(projects)
    , m_fallbackToken(fallbackToken)
{
}

void PolicyLoader::load(const PolicySource& source, const QString& token, Callback done)
{
    switch (source.kind) {
    case PolicySource::Kind::File:
        done(loadFile(source.value));
        return;
    case PolicySource::Kind::Project:
        loadProject(source.value, token, std::move(done));
        return;
    }
}

Result<PolicyHandle> PolicyLoader::loadFile(const QString& path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::unexpected(DomainFailure::guardrailsUnavailable(
            QStringLiteral("Unable to read guardrails file %1: %2").arg(path, file.errorString())));
    }
    const QByteArray content = file.readAll();

    if (content.trimmed().isEmpty()) {
        LOG_WARNING(QStringLiteral("Guardrails file %1 is empty, allowing everything").arg(path));
        return std::make_shared<AllowAllPolicy>();
    }

    if (RulePolicy::isRuleDocument(content)) {
        auto compiled = RulePolicy::fromJson(QJsonDocument::fromJson(content).object());
        if (!compiled)
            return std::unexpected(compiled.error());
        LOG_INFO(QStringLiteral("Loaded %1 guardrail rules from %2")
                     .arg((*compiled)->ruleCount()).arg(path));
        return PolicyHandle(*compiled);
    }

    if (!m_service) {
        return std::unexpected(DomainFailure::guardrailsUnavailable(
            QStringLiteral("Guardrails file %1 needs the guardrails service").arg(path)));
    }

    LOG_INFO(QStringLiteral("Loaded guardrails policy text from %1").arg(path));
    RemotePolicy::Entry entry{QStringLiteral("file"), QString::fromUtf8(content), true};
    return std::make_shared<RemotePolicy>(m_service, QList<RemotePolicy::Entry>{entry},
                                          m_fallbackToken);
}

void PolicyLoader::loadProject(const QString& project, const QString& token, Callback done)
{
    if (!m_projects || !m_service) {
        done(std::unexpected(DomainFailure::guardrailsUnavailable(
            QStringLiteral("Project guardrails are not configured"))));
        return;
    }

    const QString authToken = token.isEmpty() ? m_fallbackToken : token;
    IGuardrailsService* service = m_service;
    const QString fallbackToken = m_fallbackToken;
    m_projects->fetchProjectPolicies(project, authToken,
        [project, service, fallbackToken, done](Result<QList<ProjectPolicy>> policies) {
        if (!policies) {
            done(std::unexpected(policies.error()));
            return;
        }
        if (policies->isEmpty()) {
            LOG_DEBUG(QStringLiteral("Project %1 has no guardrails").arg(project));
            done(PolicyHandle(std::make_shared<AllowAllPolicy>()));
            return;
        }

        QList<RemotePolicy::Entry> entries;
        for (const ProjectPolicy& p : *policies)
            entries.append(RemotePolicy::Entry{p.id.isEmpty() ? p.name : p.id, p.content, p.blocking});
        LOG_INFO(QStringLiteral("Loaded %1 guardrails for project %2")
                     .arg(entries.size()).arg(project));
        done(PolicyHandle(std::make_shared<RemotePolicy>(service, entries, fallbackToken)));
    });
}
