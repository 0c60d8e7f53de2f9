#pragma once
#include "types.h"
#include <QString>
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    bool        retryable = false;
    bool        temporary = false;
    int         upstreamStatus = 0;
    QByteArray  upstreamBody;
    QJsonArray  violations;

    int httpStatus() const;
    QJsonObject toJson() const;
    QByteArray toBody() const;

    static QString kindName(ErrorKind kind);

    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure credential(const QString& msg);
    static DomainFailure guardrailViolation(const QString& msg, const QJsonArray& violations);
    static DomainFailure transport(const QString& code, const QString& msg);
    static DomainFailure sessionNotFound(const QString& msg);
    static DomainFailure upstream(int status, const QByteArray& body, const QString& msg);
    static DomainFailure guardrailsUnavailable(const QString& msg);
    static DomainFailure trace(const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure internal(const QString& msg);
};
