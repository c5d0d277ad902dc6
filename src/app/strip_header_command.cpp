#include "strip_header_command.h"
#include "mediatek/image/da_splitter.h"
#include "core/logger.h"

#include <QTextStream>

namespace datool {

static constexpr char LOG_TAG[] = "STRIP";

QString StripHeaderCommand::summary() const
{
    return "Extract the body of SOURCE_DA by removing its header and save it as OUTPUT_BODY.";
}

QString StripHeaderCommand::description(qint64 headerLength) const
{
    return QString("Removes the first %1 bytes from SOURCE_DA and saves the remaining data "
                   "(body) into OUTPUT_BODY.").arg(headerLength);
}

DaError StripHeaderCommand::execute(const QStringList& positional, const ToolConfig& config,
                                    QTextStream& out)
{
    const QString& sourcePath = positional.at(0);
    const QString& outputPath = positional.at(1);

    DaSplitter splitter(config.layout);
    splitter.setStrict(config.strict);
    splitter.setProgressCallback([](qint64 current, qint64 total) {
        LOG_DEBUG_CAT(LOG_TAG, QString("Written %1/%2 bytes").arg(current).arg(total));
    });

    if (!splitter.extractBody(sourcePath, outputPath)) {
        m_error = splitter.errorString();
        return splitter.lastError();
    }

    if (!config.quiet) {
        out << QString("Header removed from '%1'.").arg(sourcePath) << Qt::endl;
        out << QString("Body saved to '%1'.").arg(outputPath) << Qt::endl;
    }
    return DaError::None;
}

} // namespace datool
