#include "merge_da_command.h"
#include "mediatek/image/da_splitter.h"
#include "core/logger.h"

#include <QTextStream>

namespace datool {

static constexpr char LOG_TAG[] = "MERGE";

QString MergeDaCommand::summary() const
{
    return "Extract header from SOURCE_DA and merge it with BODY_DA to create OUTPUT_DA.";
}

QString MergeDaCommand::description(qint64 headerLength) const
{
    return QString("Takes the first %1 bytes from SOURCE_DA as the header and concatenates "
                   "it with BODY_DA to produce OUTPUT_DA.").arg(headerLength);
}

DaError MergeDaCommand::execute(const QStringList& positional, const ToolConfig& config,
                                QTextStream& out)
{
    const QString& sourcePath = positional.at(0);
    const QString& bodyPath = positional.at(1);
    const QString& outputPath = positional.at(2);

    DaSplitter splitter(config.layout);
    splitter.setStrict(config.strict);
    splitter.setProgressCallback([](qint64 current, qint64 total) {
        LOG_DEBUG_CAT(LOG_TAG, QString("Written %1/%2 bytes").arg(current).arg(total));
    });

    if (!splitter.mergeHeader(sourcePath, bodyPath, outputPath)) {
        m_error = splitter.errorString();
        return splitter.lastError();
    }

    if (!config.quiet) {
        out << QString("Header extracted from '%1' and merged with body from '%2'.")
                   .arg(sourcePath, bodyPath) << Qt::endl;
        out << QString("Output saved to '%1'.").arg(outputPath) << Qt::endl;
    }
    return DaError::None;
}

} // namespace datool
