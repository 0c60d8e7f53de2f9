#pragma once
#include "semantic/ports.h"
#include <QJsonObject>
#include <QMap>
#include <QString>

namespace provider_common {

bool isIgnoredHeader(const QString& name);

// Inbound headers minus the hop-by-hop and gateway-private ones, with the
// provider's auth header replaced by the extracted upstream key.
QMap<QString, QString> forwardHeaders(const QMap<QString, QString>& inbound,
                                      const QString& authHeader,
                                      const QString& authValue);

QString joinUrl(const QString& baseUrl, const QString& path, const QString& query);

Result<QJsonObject> parseJsonObject(const QByteArray& body, const QString& what);

// Upstream sent a body the adapter cannot read
DomainFailure malformedUpstream(const QString& provider, const QString& detail,
                                const QByteArray& body);

QByteArray compactJson(const QJsonValue& value);

BinaryRef binaryFromUrl(const QString& url);

}
