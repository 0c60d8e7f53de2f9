#include "credential_extractor.h"
#include <QUrlQuery>

const QString CredentialExtractor::kSeparator = QStringLiteral("|invariant-auth:");

Result<Credential> CredentialExtractor::parse(const QString& headerValue)
{
    const QString value = headerValue.trimmed();
    if (value.isEmpty()) {
        return std::unexpected(DomainFailure::credential(
            QStringLiteral("Missing or empty authorization header")));
    }

    Credential credential;
    const int pos = value.indexOf(kSeparator);
    if (pos < 0) {
        credential.upstreamKey = value;
        return credential;
    }

    credential.upstreamKey = value.left(pos).trimmed();
    const QString token = value.mid(pos + kSeparator.size()).trimmed();
    if (!token.isEmpty()) {
        credential.gatewayToken = token;
    }

    if (credential.upstreamKey.isEmpty()) {
        return std::unexpected(DomainFailure::credential(
            QStringLiteral("Composite authorization header has an empty upstream key")));
    }
    return credential;
}

QString CredentialExtractor::headerFor(ProviderFamily family)
{
    switch (family) {
    case ProviderFamily::Anthropic: return QStringLiteral("x-api-key");
    case ProviderFamily::Gemini:    return QStringLiteral("x-goog-api-key");
    case ProviderFamily::OpenAI:
    case ProviderFamily::Mcp:
    default:                        return QStringLiteral("authorization");
    }
}

Result<Credential> CredentialExtractor::extract(ProviderFamily family,
                                                const QMap<QString, QString>& headers,
                                                const QString& query)
{
    QString raw = headers.value(headerFor(family));
    if (raw.isEmpty() && family == ProviderFamily::Gemini && !query.isEmpty()) {
        raw = QUrlQuery(query).queryItemValue(QStringLiteral("key"), QUrl::FullyDecoded);
    }

    auto parsed = parse(raw);
    if (!parsed) {
        return parsed;
    }

    const QString dedicated = headers.value(QStringLiteral("invariant-authorization")).trimmed();
    if (!dedicated.isEmpty()) {
        if (!dedicated.startsWith(QStringLiteral("Bearer "))) {
            return std::unexpected(DomainFailure::credential(
                QStringLiteral("invariant-authorization must be of the form 'Bearer <token>'")));
        }
        const QString token = dedicated.mid(7).trimmed();
        if (!token.isEmpty()) {
            parsed->gatewayToken = token;
        }
    }
    return parsed;
}
