#include "explorer_client.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QNetworkReply>
#include <QUrl>

namespace {

QString errorDetail(int status, const QByteArray& body, const QString& networkError)
{
    if (status > 0)
        return QStringLiteral("HTTP %1: %2").arg(status).arg(QString::fromUtf8(body.left(512)));
    return networkError;
}

}

ExplorerClient::ExplorerClient(QNetworkAccessManager* nam, const QString& apiUrl, QObject* parent)
    : QObject(parent)
    , m_nam(nam)
    , m_apiUrl(apiUrl)
{
    while (m_apiUrl.endsWith(QLatin1Char('/')))
        m_apiUrl.chop(1);
}

void ExplorerClient::send(const QByteArray& method, const QString& path,
                          const QJsonObject& body, const QString& token,
                          ReplyHandler handler)
{
    QNetworkRequest req{QUrl{m_apiUrl + path}};
    req.setRawHeader("accept", "application/json");
    if (!token.isEmpty())
        req.setRawHeader("authorization", "Bearer " + token.toUtf8());
    req.setTransferTimeout(kRequestTimeoutMs);

    QNetworkReply* reply = nullptr;
    if (method == "GET") {
        reply = m_nam->get(req);
    } else {
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
        reply = m_nam->sendCustomRequest(req, method,
                                         QJsonDocument(body).toJson(QJsonDocument::Compact));
    }

    connect(reply, &QNetworkReply::finished, this, [reply, handler]() {
        reply->deleteLater();
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QByteArray data = reply->readAll();
        const QString networkError =
            reply->error() == QNetworkReply::NoError ? QString() : reply->errorString();
        handler(status, data, networkError);
    });
}

// ========================================================================
// push
// ========================================================================

void ExplorerClient::push(const TracePushRequest& request, PushCallback done)
{
    if (request.traceId.isEmpty()) {
        QJsonObject body;
        body[QStringLiteral("messages")] = QJsonArray{request.messages};
        body[QStringLiteral("annotations")] = QJsonArray{request.annotations};
        body[QStringLiteral("dataset")] = request.projectRef;
        body[QStringLiteral("metadata")] = QJsonArray{request.metadata};

        send("POST", QStringLiteral("/api/v1/push/trace"), body, request.token,
             [done](int status, const QByteArray& data, const QString& networkError) {
                 if (status < 200 || status >= 300) {
                     done(std::unexpected(DomainFailure::trace(
                         QStringLiteral("Trace push failed: %1")
                             .arg(errorDetail(status, data, networkError)))));
                     return;
                 }
                 const QJsonArray ids = QJsonDocument::fromJson(data).object()
                                            .value(QStringLiteral("id")).toArray();
                 if (ids.isEmpty() || ids.first().toString().isEmpty()) {
                     done(std::unexpected(DomainFailure::trace(
                         QStringLiteral("Trace push response carries no trace id"))));
                     return;
                 }
                 done(ids.first().toString());
             });
        return;
    }

    QJsonObject body;
    body[QStringLiteral("messages")] = request.messages;
    body[QStringLiteral("annotations")] = request.annotations;

    const QString traceId = request.traceId;
    send("POST", QStringLiteral("/api/v1/trace/%1/messages").arg(traceId), body, request.token,
         [done, traceId](int status, const QByteArray& data, const QString& networkError) {
             if (status < 200 || status >= 300) {
                 done(std::unexpected(DomainFailure::trace(
                     QStringLiteral("Trace append to %1 failed: %2")
                         .arg(traceId, errorDetail(status, data, networkError)))));
                 return;
             }
             done(traceId);
         });
}

// ========================================================================
// fetchProjectPolicies
// ========================================================================

void ExplorerClient::fetchProjectPolicies(const QString& project, const QString& token,
                                          IProjectPolicyStore::Callback done)
{
    send("GET", QStringLiteral("/api/v1/user/info"), {}, token,
         [this, project, token, done](int status, const QByteArray& data,
                                      const QString& networkError) {
        if (status != 200) {
            done(std::unexpected(DomainFailure::guardrailsUnavailable(
                QStringLiteral("Failed to get user details from the trace store: %1")
                    .arg(errorDetail(status, data, networkError)))));
            return;
        }

        const QString username = QJsonDocument::fromJson(data).object()
                                     .value(QStringLiteral("username")).toString();
        if (username.isEmpty()) {
            done(std::unexpected(DomainFailure::guardrailsUnavailable(
                QStringLiteral("User details carry no username"))));
            return;
        }

        const QString path = QStringLiteral("/api/v1/dataset/byuser/%1/%2/policy")
                                 .arg(QString::fromUtf8(QUrl::toPercentEncoding(username)),
                                      QString::fromUtf8(QUrl::toPercentEncoding(project)));
        send("GET", path, {}, token,
             [project, done](int status, const QByteArray& data, const QString& networkError) {
            if (status == 404) {
                LOG_DEBUG(QStringLiteral("ExplorerClient: no project %1, no guardrails").arg(project));
                done(QList<ProjectPolicy>{});
                return;
            }
            if (status != 200) {
                done(std::unexpected(DomainFailure::guardrailsUnavailable(
                    QStringLiteral("Failed to get project guardrails: %1")
                        .arg(errorDetail(status, data, networkError)))));
                return;
            }
            done(parsePolicies(data));
        });
    });
}

Result<QList<ProjectPolicy>> ExplorerClient::parsePolicies(const QByteArray& body)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::guardrailsUnavailable(
            QStringLiteral("Project guardrails response is not a JSON object")));
    }

    QList<ProjectPolicy> policies;
    for (const QJsonValue& value : doc.object().value(QStringLiteral("policies")).toArray()) {
        const QJsonObject obj = value.toObject();
        if (!obj.value(QStringLiteral("enabled")).toBool(false))
            continue;

        const QString action = obj.value(QStringLiteral("action")).toString();
        if (action != QStringLiteral("block") && action != QStringLiteral("log")) {
            LOG_WARNING(QStringLiteral("Skipping guardrail %1 with unknown action '%2'")
                            .arg(obj.value(QStringLiteral("id")).toString(), action));
            continue;
        }

        ProjectPolicy policy;
        policy.id = obj.value(QStringLiteral("id")).toString();
        policy.name = obj.value(QStringLiteral("name")).toString();
        policy.content = obj.value(QStringLiteral("content")).toString();
        policy.blocking = action == QStringLiteral("block");
        policies.append(policy);
    }
    return policies;
}
