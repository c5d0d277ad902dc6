#pragma once

#include <QObject>
#include <QString>
#include <QFile>
#include <QMutex>
#include <QDateTime>
#include <functional>

namespace datool {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Fatal
};

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger& instance();

    // Opens <logDir>/<timestamp>.log in addition to the console sink
    bool initialize(const QString& logDir);
    void shutdown();

    void setMinLevel(LogLevel level);
    LogLevel minLevel() const { return m_minLevel; }
    void setConsoleEnabled(bool enabled) { m_consoleEnabled = enabled; }
    void setSink(std::function<void(const QString&, LogLevel)> callback);

    void debug(const QString& msg, const QString& category = QString());
    void info(const QString& msg, const QString& category = QString());
    void warning(const QString& msg, const QString& category = QString());
    void error(const QString& msg, const QString& category = QString());
    void fatal(const QString& msg, const QString& category = QString());

    void log(LogLevel level, const QString& msg, const QString& category = QString());

    QString latestMessage() const { return m_latestMessage; }
    QString logFilePath() const { return m_logFilePath; }

    static QString levelToString(LogLevel level);

signals:
    void messageLogged(const QString& message, int level);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeToFile(const QString& formatted);

    QFile m_logFile;
    QString m_logFilePath;
    QString m_latestMessage;
    LogLevel m_minLevel = LogLevel::Warning;
    bool m_consoleEnabled = true;
    QMutex m_mutex;
    std::function<void(const QString&, LogLevel)> m_sink;
};

// Convenience macros
#define LOG_DEBUG(msg)   datool::Logger::instance().debug(msg)
#define LOG_INFO(msg)    datool::Logger::instance().info(msg)
#define LOG_WARNING(msg) datool::Logger::instance().warning(msg)
#define LOG_ERROR(msg)   datool::Logger::instance().error(msg)
#define LOG_FATAL(msg)   datool::Logger::instance().fatal(msg)

#define LOG_DEBUG_CAT(cat, msg)   datool::Logger::instance().debug(msg, cat)
#define LOG_INFO_CAT(cat, msg)    datool::Logger::instance().info(msg, cat)
#define LOG_WARNING_CAT(cat, msg) datool::Logger::instance().warning(msg, cat)
#define LOG_ERROR_CAT(cat, msg)   datool::Logger::instance().error(msg, cat)
#define LOG_FATAL_CAT(cat, msg)   datool::Logger::instance().fatal(msg, cat)

} // namespace datool
