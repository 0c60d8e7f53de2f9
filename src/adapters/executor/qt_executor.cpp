#include "qt_executor.h"
#include "core/log_manager.h"
#include <QUrl>

// ========================================================================
// ReplyUpstream
// ========================================================================

ReplyUpstream::ReplyUpstream(QNetworkReply* reply, QObject* parent)
    : UpstreamStream(parent)
    , m_reply(reply)
{
    Q_ASSERT(m_reply);
    m_reply->setParent(this);
    m_reply->setReadBufferSize(QtExecutor::kReadBufferSize);

    connect(m_reply, &QNetworkReply::metaDataChanged,
            this, &ReplyUpstream::onMetaDataChanged);
    connect(m_reply, &QNetworkReply::readyRead,
            this, &ReplyUpstream::onReadyRead);
    connect(m_reply, &QNetworkReply::finished,
            this, &ReplyUpstream::onReplyFinished);
    connect(m_reply, &QNetworkReply::errorOccurred,
            this, &ReplyUpstream::onReplyError);
}

ReplyUpstream::~ReplyUpstream()
{
    if (m_reply && m_reply->isRunning()) {
        m_aborted = true;
        m_reply->abort();
    }
}

int ReplyUpstream::statusCode() const
{
    return m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
}

QMap<QString, QString> ReplyUpstream::headers() const
{
    QMap<QString, QString> out;
    for (const QByteArray& name : m_reply->rawHeaderList())
        out[QString::fromUtf8(name).toLower()] = QString::fromUtf8(m_reply->rawHeader(name));
    return out;
}

qint64 ReplyUpstream::bytesAvailable() const
{
    return m_reply->bytesAvailable();
}

QByteArray ReplyUpstream::read(qint64 maxSize)
{
    return m_reply->read(maxSize);
}

void ReplyUpstream::abort()
{
    if (m_aborted || m_finished)
        return;
    m_aborted = true;
    m_reply->abort();
}

void ReplyUpstream::emitMetaOnce()
{
    if (m_metaEmitted)
        return;
    m_metaEmitted = true;
    emit metaDataReady();
}

void ReplyUpstream::onMetaDataChanged()
{
    if (statusCode() > 0)
        emitMetaOnce();
}

void ReplyUpstream::onReadyRead()
{
    if (m_aborted)
        return;
    emitMetaOnce();
    emit readyRead();
}

void ReplyUpstream::onReplyFinished()
{
    if (m_aborted || m_failed || m_finished)
        return;
    emitMetaOnce();
    m_finished = true;
    emit finished();
}

void ReplyUpstream::onReplyError(QNetworkReply::NetworkError code)
{
    if (m_aborted)
        return;

    // HTTP-level errors still carry a body that is relayed as-is
    if (statusCode() > 0)
        return;

    DomainFailure failure;
    switch (code) {
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
        failure = DomainFailure::timeout(
            QStringLiteral("Upstream connection timed out: %1").arg(m_reply->errorString()));
        break;
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::SslHandshakeFailedError:
    case QNetworkReply::UnknownNetworkError:
        failure = DomainFailure::upstream(
            502, QByteArray(),
            QStringLiteral("Upstream unreachable: %1").arg(m_reply->errorString()));
        break;
    default:
        failure = DomainFailure::internal(
            QStringLiteral("Upstream network error (%1): %2")
                .arg(static_cast<int>(code))
                .arg(m_reply->errorString()));
        break;
    }

    LOG_ERROR(QStringLiteral("ReplyUpstream error [%1]: %2").arg(failure.code, failure.message));
    m_failed = true;
    emit failed(failure);
}

// ========================================================================
// QtExecutor
// ========================================================================

QtExecutor::QtExecutor(QNetworkAccessManager* nam)
    : m_nam(nam)
{
}

QNetworkRequest QtExecutor::buildQtRequest(const ProviderRequest& request)
{
    QNetworkRequest req{QUrl{request.url}};

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!request.body.isEmpty() && !req.hasRawHeader("content-type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    // Timeouts are driven by the stream session
    req.setTransferTimeout(0);
    return req;
}

UpstreamStream* QtExecutor::open(const ProviderRequest& request, QObject* parent)
{
    const QNetworkRequest req = buildQtRequest(request);
    const QString method = request.method.trimmed().toUpper();

    QNetworkReply* reply = nullptr;
    if (method == QStringLiteral("GET"))
        reply = m_nam->get(req);
    else if (method == QStringLiteral("POST"))
        reply = m_nam->post(req, request.body);
    else if (method == QStringLiteral("PUT"))
        reply = m_nam->put(req, request.body);
    else if (method == QStringLiteral("DELETE"))
        reply = m_nam->deleteResource(req);
    else
        reply = m_nam->sendCustomRequest(req, method.toUtf8(), request.body);

    LOG_DEBUG(QStringLiteral("QtExecutor: %1 %2").arg(method, request.url));
    return new ReplyUpstream(reply, parent);
}
