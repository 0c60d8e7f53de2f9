#pragma once
#include <QByteArray>
#include <QMap>
#include <QString>
#include <QUrlQuery>

struct HttpRequest {
    QString method;
    QString path;         // without the query string
    QString query;        // raw, without '?'
    QString httpVersion;
    QMap<QString, QString> headers;   // names lower-cased
    QByteArray body;

    QString header(const QString& name) const { return headers.value(name.toLower()); }
    QString queryItem(const QString& name) const {
        return QUrlQuery(query).queryItemValue(name, QUrl::FullyDecoded);
    }
};
