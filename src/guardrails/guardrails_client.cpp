#include "guardrails_client.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QUrl>

GuardrailsClient::GuardrailsClient(QNetworkAccessManager* nam, const QString& apiUrl,
                                   QObject* parent)
    : QObject(parent)
    , m_nam(nam)
    , m_apiUrl(apiUrl)
{
    while (m_apiUrl.endsWith(QLatin1Char('/')))
        m_apiUrl.chop(1);
}

void GuardrailsClient::check(const QJsonArray& messages, const QString& policy,
                             const QString& token, Callback done)
{
    QNetworkRequest req{QUrl{m_apiUrl + QStringLiteral("/api/v1/policy/check")}};
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    req.setRawHeader("accept", "application/json");
    req.setRawHeader("authorization", "Bearer " + token.toUtf8());
    req.setTransferTimeout(kRequestTimeoutMs);

    QJsonObject body;
    body[QStringLiteral("messages")] = messages;
    body[QStringLiteral("policy")] = policy;

    QNetworkReply* reply = m_nam->post(req, QJsonDocument(body).toJson(QJsonDocument::Compact));
    connect(reply, &QNetworkReply::finished, this, [reply, done]() {
        reply->deleteLater();
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status == 0) {
            LOG_ERROR(QStringLiteral("GuardrailsClient: %1").arg(reply->errorString()));
            done(std::unexpected(DomainFailure::guardrailsUnavailable(
                QStringLiteral("Guardrails service unreachable: %1").arg(reply->errorString()))));
            return;
        }
        done(parseCheckResponse(status, reply->readAll()));
    });
}

Result<QJsonArray> GuardrailsClient::parseCheckResponse(int status, const QByteArray& body)
{
    if (status != 200) {
        return std::unexpected(DomainFailure::guardrailsUnavailable(
            QStringLiteral("Guardrails check failed with HTTP %1: %2")
                .arg(status).arg(QString::fromUtf8(body.left(512)))));
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::guardrailsUnavailable(
            QStringLiteral("Guardrails check returned malformed JSON")));
    }
    return doc.object().value(QStringLiteral("errors")).toArray();
}
