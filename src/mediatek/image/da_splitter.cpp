#include "da_splitter.h"
#include "core/logger.h"

#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace datool {

static constexpr char LOG_TAG[] = "DA-SPLIT";
static constexpr qint64 COPY_CHUNK_SIZE = 4 * 1024 * 1024;

DaSplitter::DaSplitter(const DaLayout& layout)
    : m_layout(layout)
{
}

// ── Operations ──────────────────────────────────────────────────────────────

bool DaSplitter::extractBody(const QString& sourcePath, const QString& outputPath)
{
    reset();

    if (!checkInput(sourcePath, "Source DA"))
        return false;

    QFile source(sourcePath);
    if (!source.open(QIODevice::ReadOnly))
        return fail(DaError::IOFailure, QString("Cannot open source DA file '%1': %2")
                                            .arg(sourcePath, source.errorString()));

    const qint64 sourceSize = source.size();
    if (!checkSourceLength(sourcePath, sourceSize))
        return false;

    const qint64 bodySize = m_layout.bodySize(sourceSize);
    LOG_DEBUG_CAT(LOG_TAG, QString("Extracting %1 body bytes from '%2' (header 0x%3)")
                               .arg(bodySize)
                               .arg(sourcePath)
                               .arg(m_layout.headerLength, 0, 16));

    QSaveFile output(outputPath);
    if (!output.open(QIODevice::WriteOnly))
        return fail(DaError::IOFailure, QString("Cannot create output file '%1': %2")
                                            .arg(outputPath, output.errorString()));

    if (bodySize > 0) {
        if (!source.seek(m_layout.headerLength))
            return fail(DaError::IOFailure, QString("Cannot seek past header in '%1': %2")
                                                .arg(sourcePath, source.errorString()));
        if (!copyRange(source, output, bodySize, bodySize))
            return false;
    }

    if (!output.commit())
        return fail(DaError::IOFailure, QString("Cannot finalize output file '%1': %2")
                                            .arg(outputPath, output.errorString()));

    LOG_INFO_CAT(LOG_TAG, QString("Body saved to '%1' (%2 bytes)").arg(outputPath).arg(m_bytesWritten));
    return true;
}

bool DaSplitter::mergeHeader(const QString& sourcePath, const QString& bodyPath,
                             const QString& outputPath)
{
    reset();

    if (!checkInput(sourcePath, "Source DA") || !checkInput(bodyPath, "Body DA"))
        return false;

    QFile source(sourcePath);
    if (!source.open(QIODevice::ReadOnly))
        return fail(DaError::IOFailure, QString("Cannot open source DA file '%1': %2")
                                            .arg(sourcePath, source.errorString()));

    QFile body(bodyPath);
    if (!body.open(QIODevice::ReadOnly))
        return fail(DaError::IOFailure, QString("Cannot open body DA file '%1': %2")
                                            .arg(bodyPath, body.errorString()));

    const qint64 sourceSize = source.size();
    if (!checkSourceLength(sourcePath, sourceSize))
        return false;

    const qint64 headerSize = m_layout.headerSize(sourceSize);
    const qint64 total = m_layout.mergedSize(sourceSize, body.size());
    LOG_DEBUG_CAT(LOG_TAG, QString("Merging %1 header bytes from '%2' with %3 body bytes from '%4'")
                               .arg(headerSize)
                               .arg(sourcePath)
                               .arg(body.size())
                               .arg(bodyPath));

    QSaveFile output(outputPath);
    if (!output.open(QIODevice::WriteOnly))
        return fail(DaError::IOFailure, QString("Cannot create output file '%1': %2")
                                            .arg(outputPath, output.errorString()));

    // Header goes straight into the output, no intermediate file
    if (!copyRange(source, output, headerSize, total))
        return false;
    if (!copyRange(body, output, body.size(), total))
        return false;

    if (!output.commit())
        return fail(DaError::IOFailure, QString("Cannot finalize output file '%1': %2")
                                            .arg(outputPath, output.errorString()));

    LOG_INFO_CAT(LOG_TAG, QString("Merged image saved to '%1' (%2 bytes)")
                              .arg(outputPath).arg(m_bytesWritten));
    return true;
}

QByteArray DaSplitter::readHeader(const QString& sourcePath)
{
    reset();

    if (!checkInput(sourcePath, "Source DA"))
        return {};

    QFile source(sourcePath);
    if (!source.open(QIODevice::ReadOnly)) {
        fail(DaError::IOFailure, QString("Cannot open source DA file '%1': %2")
                                     .arg(sourcePath, source.errorString()));
        return {};
    }

    if (!checkSourceLength(sourcePath, source.size()))
        return {};

    const qint64 expected = m_layout.headerSize(source.size());
    QByteArray header = source.read(expected);
    if (header.size() != expected) {
        fail(DaError::IOFailure, QString("Short read on '%1': %2")
                                     .arg(sourcePath, source.errorString()));
        return {};
    }
    return header;
}

// ── Helpers ─────────────────────────────────────────────────────────────────

void DaSplitter::reset()
{
    m_lastError = DaError::None;
    m_error.clear();
    m_bytesWritten = 0;
}

bool DaSplitter::fail(DaError error, const QString& message)
{
    m_lastError = error;
    m_error = message;
    LOG_ERROR_CAT(LOG_TAG, QString("%1: %2").arg(daErrorName(error), message));
    return false;
}

bool DaSplitter::checkInput(const QString& path, const QString& role)
{
    if (!QFileInfo(path).isFile())
        return fail(DaError::InputNotFound,
                    QString("%1 file '%2' does not exist.").arg(role, path));
    return true;
}

bool DaSplitter::checkSourceLength(const QString& sourcePath, qint64 sourceSize)
{
    if (m_layout.isComplete(sourceSize))
        return true;

    if (m_strict)
        return fail(DaError::SourceTooShort,
                    QString("Source DA file '%1' is %2 bytes, shorter than the %3-byte header.")
                        .arg(sourcePath).arg(sourceSize).arg(m_layout.headerLength));

    LOG_WARNING_CAT(LOG_TAG, QString("Source '%1' is %2 bytes, header truncated to that length")
                                 .arg(sourcePath).arg(sourceSize));
    return true;
}

bool DaSplitter::copyRange(QIODevice& in, QIODevice& out, qint64 count, qint64 total)
{
    qint64 remaining = count;
    while (remaining > 0) {
        QByteArray chunk = in.read(qMin(COPY_CHUNK_SIZE, remaining));
        if (chunk.isEmpty())
            return fail(DaError::IOFailure, QString("Unexpected end of input after %1 of %2 bytes: %3")
                                                .arg(count - remaining).arg(count)
                                                .arg(in.errorString()));

        if (out.write(chunk) != chunk.size())
            return fail(DaError::IOFailure, QString("Write failed: %1").arg(out.errorString()));

        remaining -= chunk.size();
        m_bytesWritten += chunk.size();
        if (m_progressCb) m_progressCb(m_bytesWritten, total);
    }
    return true;
}

} // namespace datool
