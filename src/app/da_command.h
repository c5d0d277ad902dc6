#pragma once

#include "core/tool_config.h"
#include "mediatek/image/da_image.h"

#include <QString>
#include <QStringList>

class QTextStream;

namespace datool {

// ─── Abstract command behind one DA tool executable ─────────────────────
class DaCommand {
public:
    virtual ~DaCommand() = default;

    // Default executable name, used when argv[0] is unavailable
    virtual QString name() const = 0;

    // Positional part of the usage line, e.g. "SOURCE_DA OUTPUT_BODY"
    virtual QString synopsis() const = 0;
    virtual QString summary() const = 0;
    virtual QString example() const = 0;
    virtual QString description(qint64 headerLength) const = 0;

    virtual int positionalCount() const = 0;

    // Run the operation on already-counted positional arguments.
    // Confirmation lines go to out unless config.quiet is set.
    virtual DaError execute(const QStringList& positional, const ToolConfig& config,
                            QTextStream& out) = 0;

    QString errorString() const { return m_error; }

protected:
    QString m_error;
};

} // namespace datool
