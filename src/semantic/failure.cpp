#include "failure.h"
#include <QJsonDocument>

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::InvalidInput:          return 400;
    case ErrorKind::CredentialError:       return 401;
    case ErrorKind::GuardrailViolation:    return 400;
    case ErrorKind::TransportError:        return 400;
    case ErrorKind::SessionNotFound:       return 404;
    case ErrorKind::UpstreamProviderError: return upstreamStatus > 0 ? upstreamStatus : 502;
    case ErrorKind::GuardrailsUnavailable: return 503;
    case ErrorKind::Timeout:               return 504;
    case ErrorKind::TraceError:
    case ErrorKind::Internal:
    default:                               return 500;
    }
}

QString DomainFailure::kindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput:          return QStringLiteral("invalid_input");
    case ErrorKind::CredentialError:       return QStringLiteral("credential_error");
    case ErrorKind::GuardrailViolation:    return QStringLiteral("guardrail_violation");
    case ErrorKind::TransportError:        return QStringLiteral("transport_error");
    case ErrorKind::SessionNotFound:       return QStringLiteral("session_not_found");
    case ErrorKind::UpstreamProviderError: return QStringLiteral("upstream_provider_error");
    case ErrorKind::GuardrailsUnavailable: return QStringLiteral("guardrails_unavailable");
    case ErrorKind::TraceError:            return QStringLiteral("trace_error");
    case ErrorKind::Timeout:               return QStringLiteral("timeout");
    case ErrorKind::Internal:
    default:                               return QStringLiteral("internal");
    }
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject err;
    err["code"] = code;
    err["message"] = message;
    err["type"] = kindName(kind);
    if (!violations.isEmpty())
        err["violations"] = violations;
    QJsonObject root;
    root["error"] = err;
    return root;
}

QByteArray DomainFailure::toBody() const {
    // Upstream errors keep the provider's own payload
    if (kind == ErrorKind::UpstreamProviderError && !upstreamBody.isEmpty())
        return upstreamBody;
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg, false, false};
}

DomainFailure DomainFailure::credential(const QString& msg) {
    return {ErrorKind::CredentialError, "credential_error", msg, false, false};
}

DomainFailure DomainFailure::guardrailViolation(const QString& msg, const QJsonArray& violations) {
    DomainFailure f{ErrorKind::GuardrailViolation, "guardrail_violation", msg, false, false};
    f.violations = violations;
    return f;
}

DomainFailure DomainFailure::transport(const QString& code, const QString& msg) {
    return {ErrorKind::TransportError, code, msg, false, false};
}

DomainFailure DomainFailure::sessionNotFound(const QString& msg) {
    return {ErrorKind::SessionNotFound, "session_not_found", msg, false, false};
}

DomainFailure DomainFailure::upstream(int status, const QByteArray& body, const QString& msg) {
    DomainFailure f{ErrorKind::UpstreamProviderError,
                    QStringLiteral("upstream.http_%1").arg(status), msg,
                    status == 429 || status >= 500, status >= 500};
    f.upstreamStatus = status;
    f.upstreamBody = body;
    return f;
}

DomainFailure DomainFailure::guardrailsUnavailable(const QString& msg) {
    return {ErrorKind::GuardrailsUnavailable, "guardrails_unavailable", msg, true, true};
}

DomainFailure DomainFailure::trace(const QString& msg) {
    return {ErrorKind::TraceError, "trace_push_failed", msg, true, true};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, "timeout", msg, false, true};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg, false, false};
}
