#pragma once
#include "policy.h"
#include <QObject>
#include <QNetworkAccessManager>

class GuardrailsClient : public QObject, public IGuardrailsService {
    Q_OBJECT
public:
    static constexpr int kRequestTimeoutMs = 30000;

    GuardrailsClient(QNetworkAccessManager* nam, const QString& apiUrl, QObject* parent = nullptr);

    void check(const QJsonArray& messages, const QString& policy,
               const QString& token, Callback done) override;

    static Result<QJsonArray> parseCheckResponse(int status, const QByteArray& body);

private:
    QNetworkAccessManager* m_nam;
    QString m_apiUrl;
};
