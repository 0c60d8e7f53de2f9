#pragma once
#include "policy.h"

// Resolves a policy source into an evaluator. A file holding a rule document
// compiles locally; any other file content, and every project, is policy text
// for the guardrails service.
class PolicyLoader : public IPolicyLoader {
public:
    PolicyLoader(IGuardrailsService* service, IProjectPolicyStore* projects,
                 const QString& fallbackToken = QString());

    void load(const PolicySource& source, const QString& token, Callback done) override;

    Result<PolicyHandle> loadFile(const QString& path) const;

private:
    IGuardrailsService* m_service;
    IProjectPolicyStore* m_projects;
    QString m_fallbackToken;

    void loadProject(const QString& project, const QString& token, Callback done);
};
