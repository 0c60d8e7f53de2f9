#pragma once
#include "semantic/result.h"
#include "semantic/types.h"
#include <QString>
#include <QMap>
#include <optional>

struct Credential {
    QString upstreamKey;
    std::optional<QString> gatewayToken;

    bool hasGatewayToken() const { return gatewayToken.has_value() && !gatewayToken->isEmpty(); }
    QString bearerToken() const {
        return hasGatewayToken() ? QStringLiteral("Bearer ") + *gatewayToken : QString();
    }
};

class CredentialExtractor {
public:
    static const QString kSeparator;

    // Splits "<upstream_key>|invariant-auth: <gateway_token>". First occurrence wins.
    static Result<Credential> parse(const QString& headerValue);

    // Picks the header the provider family carries its key in, then parses it.
    // A separate "invariant-authorization: Bearer <token>" header overrides the
    // embedded gateway token.
    static Result<Credential> extract(ProviderFamily family,
                                      const QMap<QString, QString>& headers,
                                      const QString& query = QString());

    static QString headerFor(ProviderFamily family);
};
