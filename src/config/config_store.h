#pragma once
#include "config_types.h"
#include "semantic/result.h"
#include <QObject>
#include <QProcessEnvironment>

class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    void loadFromEnvironment(const QProcessEnvironment& env = QProcessEnvironment::systemEnvironment());
    VoidResult validate() const;

    const GatewayConfig& config() const { return m_config; }
    RuntimeOptions runtimeConfig() const { return m_config.runtime; }

    void setListenPort(int port);
    void setDevMode(bool enabled);

signals:
    void configChanged();

private:
    GatewayConfig m_config;
};
