#pragma once
#include <QObject>
#include <QFile>
#include <QVariantMap>
#include <QList>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    void initialize(const QString& logDir);

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    void setMinimumLevel(Level level) { m_minLevel = level; }
    Level minimumLevel() const { return m_minLevel; }
    // stdio mode keeps stdout for the protocol, so echo always goes to stderr
    void setConsoleEcho(bool enabled) { m_consoleEcho = enabled; }

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "gateway", msg); }
    void info(const QString& msg)    { log(Info, "gateway", msg); }
    void warning(const QString& msg) { log(Warning, "gateway", msg); }
    void error(const QString& msg)   { log(Error, "gateway", msg); }

    QVariantList recentLogs(int count = 200) const;
    void clearLogs();

signals:
    void logEntry(int level, const QString& timestamp,
                  const QString& category, const QString& message);

private:
    ~LogManager() override;
    LogManager() = default;
    QFile m_logFile;
    QList<QVariantMap> m_buffer;
    int m_maxBuffer = 2000;
    Level m_minLevel = Info;
    bool m_consoleEcho = false;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)
#define LOG_CAT(level, category, msg) LogManager::instance().log(LogManager::level, category, msg)
