#pragma once
#include "trace_store.h"
#include "guardrails/policy.h"
#include <QObject>
#include <QNetworkAccessManager>

// HTTP client for the trace store: trace push/append and the per-project
// guardrail listing.
class ExplorerClient : public QObject, public ITraceStore, public IProjectPolicyStore {
    Q_OBJECT
public:
    static constexpr int kRequestTimeoutMs = 30000;

    ExplorerClient(QNetworkAccessManager* nam, const QString& apiUrl, QObject* parent = nullptr);

    QString apiUrl() const { return m_apiUrl; }

    void push(const TracePushRequest& request, PushCallback done) override;
    void fetchProjectPolicies(const QString& project, const QString& token,
                              IProjectPolicyStore::Callback done) override;

    static Result<QList<ProjectPolicy>> parsePolicies(const QByteArray& body);

private:
    using ReplyHandler = std::function<void(int status, const QByteArray& body,
                                            const QString& networkError)>;

    void send(const QByteArray& method, const QString& path, const QJsonObject& body,
              const QString& token, ReplyHandler handler);

    QNetworkAccessManager* m_nam;
    QString m_apiUrl;
};
