#pragma once
#include "ports.h"
#include <QObject>
#include <QMap>

// Body source of one upstream HTTP exchange. Reads are pull-based so the
// consumer decides when the next bytes are taken off the wire.
class UpstreamStream : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~UpstreamStream() override = default;

    virtual int statusCode() const = 0;
    virtual QMap<QString, QString> headers() const = 0;
    virtual qint64 bytesAvailable() const = 0;
    virtual QByteArray read(qint64 maxSize) = 0;
    virtual bool isFinished() const = 0;
    virtual void abort() = 0;

signals:
    void metaDataReady();
    void readyRead();
    void finished();
    void failed(const DomainFailure& failure);
};

class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual UpstreamStream* open(const ProviderRequest& request, QObject* parent) = 0;
};
