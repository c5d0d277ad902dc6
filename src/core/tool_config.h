#pragma once

#include "mediatek/image/da_image.h"

#include <QString>

namespace datool {

constexpr char TOOL_VERSION[] = "1.0.0";

// Settings for a single tool invocation, filled from the command line
struct ToolConfig {
    DaLayout layout;
    bool strict = false;
    bool quiet = false;
    bool verbose = false;
    QString logDir;

    // Accepts decimal or 0x-prefixed hex; rejects zero and negative values
    static bool parseHeaderLength(const QString& text, qint64& value);

    // Routes verbosity and the optional log directory into the logger.
    // Returns false if the log file could not be created.
    bool applyToLogger() const;
};

} // namespace datool
