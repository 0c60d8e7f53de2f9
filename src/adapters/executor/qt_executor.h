#pragma once
#include "semantic/upstream_stream.h"
#include <QNetworkAccessManager>
#include <QNetworkReply>

class ReplyUpstream : public UpstreamStream {
    Q_OBJECT
public:
    explicit ReplyUpstream(QNetworkReply* reply, QObject* parent = nullptr);
    ~ReplyUpstream() override;

    int statusCode() const override;
    QMap<QString, QString> headers() const override;
    qint64 bytesAvailable() const override;
    QByteArray read(qint64 maxSize) override;
    bool isFinished() const override { return m_finished; }
    void abort() override;

private slots:
    void onMetaDataChanged();
    void onReadyRead();
    void onReplyFinished();
    void onReplyError(QNetworkReply::NetworkError code);

private:
    QNetworkReply* m_reply;
    bool m_metaEmitted = false;
    bool m_finished = false;
    bool m_failed = false;
    bool m_aborted = false;

    void emitMetaOnce();
};

class QtExecutor : public IExecutor {
public:
    static constexpr qint64 kReadBufferSize = 64 * 1024;

    explicit QtExecutor(QNetworkAccessManager* nam);

    UpstreamStream* open(const ProviderRequest& request, QObject* parent) override;

    static QNetworkRequest buildQtRequest(const ProviderRequest& request);

private:
    QNetworkAccessManager* m_nam;
};
