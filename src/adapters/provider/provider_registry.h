#pragma once
#include "semantic/ports.h"
#include <QMap>
#include <QStringList>
#include <functional>
#include <memory>

// Adapters keep per-call parse state, so the registry hands out a fresh
// instance for every session.
class ProviderRegistry {
public:
    using Factory = std::function<std::unique_ptr<IProviderAdapter>()>;

    void registerProvider(const QString& providerId, Factory factory);
    void registerDefaults(const QMap<QString, QString>& baseUrlOverrides = {});

    bool contains(const QString& providerId) const;
    QStringList providers() const;
    Result<std::unique_ptr<IProviderAdapter>> create(const QString& providerId) const;

private:
    QMap<QString, Factory> m_factories;
};
