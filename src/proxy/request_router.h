#pragma once
#include <QString>
#include <QStringList>
#include <QList>
#include <optional>

enum class RouteKind {
    Health,
    LlmProxy,
    McpSseOpen,
    McpSseMessage,
    McpStreamable
};

struct Route {
    RouteKind kind = RouteKind::LlmProxy;
    QString project;        // empty: proxy without tracing
    QString provider;
    QString upstreamPath;   // provider-native path, leading '/'
};

class RequestRouter {
public:
    static const QString kGatewayPrefix;

    void registerDefaults(const QStringList& providers);
    void addRoute(RouteKind kind, const QString& method, const QString& pathPattern);
    std::optional<Route> match(const QString& method, const QString& path) const;

private:
    struct InternalRoute {
        QString method = QStringLiteral("POST"); // "*" for any
        QString pathPrefix;
        bool wildcard = false; // true if pathPattern ends with "*"
        RouteKind kind = RouteKind::LlmProxy;
    };
    QList<InternalRoute> m_routes;
    QStringList m_providers;

    std::optional<Route> matchLlm(const QString& rest) const;
};
