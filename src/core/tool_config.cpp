#include "tool_config.h"
#include "logger.h"

namespace datool {

bool ToolConfig::parseHeaderLength(const QString& text, qint64& value)
{
    const QString trimmed = text.trimmed();
    const bool hex = trimmed.startsWith("0x", Qt::CaseInsensitive);

    // Explicit bases only: base 0 would read a leading 0 as octal
    bool ok = false;
    const qint64 parsed = hex ? trimmed.mid(2).toLongLong(&ok, 16)
                              : trimmed.toLongLong(&ok, 10);
    if (!ok || parsed <= 0)
        return false;

    value = parsed;
    return true;
}

bool ToolConfig::applyToLogger() const
{
    Logger& logger = Logger::instance();
    logger.setMinLevel(verbose ? LogLevel::Debug : LogLevel::Warning);
    // Without --verbose diagnostics only reach the log file
    logger.setConsoleEnabled(verbose);

    if (logDir.isEmpty())
        return true;

    return logger.initialize(logDir);
}

} // namespace datool
