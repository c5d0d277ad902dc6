#include "logger.h"
#include <QDir>
#include <QTextStream>
#include <iostream>

namespace datool {

Logger::Logger() {}

Logger::~Logger()
{
    if (m_logFile.isOpen())
        m_logFile.close();
}

Logger& Logger::instance()
{
    static Logger inst;
    return inst;
}

bool Logger::initialize(const QString& logDir)
{
    {
        QMutexLocker lock(&m_mutex);

        if (m_logFile.isOpen())
            m_logFile.close();

        if (!QDir().mkpath(logDir)) {
            m_logFilePath.clear();
            return false;
        }

        QString filename = QDateTime::currentDateTime().toString("yyyy-MM-dd_HH-mm-ss") + ".log";
        m_logFilePath = QDir(logDir).filePath(filename);

        m_logFile.setFileName(m_logFilePath);
        if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            m_logFilePath.clear();
            return false;
        }
    }

    debug("Logger initialized: " + m_logFilePath);
    return true;
}

void Logger::shutdown()
{
    QMutexLocker lock(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();
    m_logFilePath.clear();
}

void Logger::setMinLevel(LogLevel level)
{
    m_minLevel = level;
}

void Logger::setSink(std::function<void(const QString&, LogLevel)> callback)
{
    m_sink = std::move(callback);
}

void Logger::debug(const QString& msg, const QString& category)
{
    log(LogLevel::Debug, msg, category);
}

void Logger::info(const QString& msg, const QString& category)
{
    log(LogLevel::Info, msg, category);
}

void Logger::warning(const QString& msg, const QString& category)
{
    log(LogLevel::Warning, msg, category);
}

void Logger::error(const QString& msg, const QString& category)
{
    log(LogLevel::Error, msg, category);
}

void Logger::fatal(const QString& msg, const QString& category)
{
    log(LogLevel::Fatal, msg, category);
}

void Logger::log(LogLevel level, const QString& msg, const QString& category)
{
    if (level < m_minLevel)
        return;

    QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    QString levelStr = levelToString(level);
    QString catStr = category.isEmpty() ? "" : ("[" + category + "] ");
    QString formatted = QString("[%1] [%2] %3%4").arg(timestamp, levelStr, catStr, msg);

    {
        QMutexLocker lock(&m_mutex);
        m_latestMessage = formatted;
        writeToFile(formatted);
    }

    // Console output goes to stderr so it never mixes with tool output
    if (m_consoleEnabled)
        std::cerr << formatted.toStdString() << std::endl;

    if (m_sink)
        m_sink(formatted, level);

    emit messageLogged(formatted, static_cast<int>(level));
}

void Logger::writeToFile(const QString& formatted)
{
    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }
}

QString Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error:   return "ERROR";
    case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

} // namespace datool
