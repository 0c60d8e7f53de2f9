#include "request_router.h"
#include "core/log_manager.h"

const QString RequestRouter::kGatewayPrefix = QStringLiteral("/api/v1/gateway/");

void RequestRouter::registerDefaults(const QStringList& providers)
{
    m_routes.clear();
    m_providers = providers;

    addRoute(RouteKind::Health, QStringLiteral("GET"), kGatewayPrefix + QStringLiteral("health"));

    // MCP endpoints come before the catch-all so "mcp" is never taken as a project
    addRoute(RouteKind::McpSseOpen, QStringLiteral("GET"), kGatewayPrefix + QStringLiteral("mcp/sse"));
    addRoute(RouteKind::McpSseMessage, QStringLiteral("POST"),
             kGatewayPrefix + QStringLiteral("mcp/sse/messages/"));
    addRoute(RouteKind::McpSseMessage, QStringLiteral("POST"),
             kGatewayPrefix + QStringLiteral("mcp/sse/messages"));
    addRoute(RouteKind::McpStreamable, QStringLiteral("*"),
             kGatewayPrefix + QStringLiteral("mcp/streamable"));

    // {project?}/{provider}/{upstream_path...}
    addRoute(RouteKind::LlmProxy, QStringLiteral("*"), kGatewayPrefix + QStringLiteral("*"));

    LOG_INFO(QStringLiteral("RequestRouter: registered %1 routes for providers %2")
                 .arg(m_routes.size()).arg(providers.join(QStringLiteral(", "))));
}

void RequestRouter::addRoute(RouteKind kind, const QString& method, const QString& pathPattern)
{
    InternalRoute entry;
    entry.kind = kind;
    entry.method = method.toUpper();

    if (pathPattern.endsWith(QLatin1Char('*'))) {
        entry.wildcard = true;
        entry.pathPrefix = pathPattern.left(pathPattern.size() - 1);
    } else {
        entry.wildcard = false;
        entry.pathPrefix = pathPattern;
    }

    m_routes.append(entry);
}

std::optional<Route> RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();

    for (const InternalRoute& entry : m_routes) {
        if (entry.method != QStringLiteral("*") && entry.method != normalizedMethod)
            continue;

        if (!entry.wildcard) {
            if (path != entry.pathPrefix)
                continue;
            Route route;
            route.kind = entry.kind;
            return route;
        }

        if (!path.startsWith(entry.pathPrefix))
            continue;
        if (auto route = matchLlm(path.mid(entry.pathPrefix.size())))
            return route;
    }

    return std::nullopt;
}

std::optional<Route> RequestRouter::matchLlm(const QString& rest) const
{
    const QStringList segments = rest.split(QLatin1Char('/'));
    if (segments.size() < 2)
        return std::nullopt;

    Route route;
    route.kind = RouteKind::LlmProxy;

    int providerAt = -1;
    if (m_providers.contains(segments.at(0)))
        providerAt = 0;
    else if (segments.size() >= 3 && m_providers.contains(segments.at(1)) && !segments.at(0).isEmpty())
        providerAt = 1;
    if (providerAt < 0)
        return std::nullopt;

    if (providerAt == 1)
        route.project = segments.at(0);
    route.provider = segments.at(providerAt);
    route.upstreamPath = QLatin1Char('/') + segments.mid(providerAt + 1).join(QLatin1Char('/'));
    if (route.upstreamPath == QStringLiteral("/"))
        return std::nullopt;
    return route;
}
