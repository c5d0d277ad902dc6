#pragma once

#include "da_image.h"

#include <QByteArray>
#include <QString>
#include <functional>

class QIODevice;

namespace datool {

// ── DA splitter: separates and recombines DA header and body ────────────────

class DaSplitter {
public:
    using ProgressCallback = std::function<void(qint64 current, qint64 total)>;

    explicit DaSplitter(const DaLayout& layout = DaLayout());

    // Write source[headerLength:] to outputPath
    bool extractBody(const QString& sourcePath, const QString& outputPath);

    // Write source[0:headerLength] followed by the whole body file to outputPath
    bool mergeHeader(const QString& sourcePath, const QString& bodyPath,
                     const QString& outputPath);

    // Header prefix of sourcePath, empty on failure
    QByteArray readHeader(const QString& sourcePath);

    void setStrict(bool strict) { m_strict = strict; }
    bool isStrict() const { return m_strict; }
    void setProgressCallback(ProgressCallback cb) { m_progressCb = std::move(cb); }

    const DaLayout& layout() const { return m_layout; }
    DaError lastError() const { return m_lastError; }
    QString errorString() const { return m_error; }
    qint64 bytesWritten() const { return m_bytesWritten; }

private:
    void reset();
    bool fail(DaError error, const QString& message);
    bool checkInput(const QString& path, const QString& role);
    bool checkSourceLength(const QString& sourcePath, qint64 sourceSize);
    bool copyRange(QIODevice& in, QIODevice& out, qint64 count, qint64 total);

    DaLayout m_layout;
    bool m_strict = false;
    ProgressCallback m_progressCb;

    DaError m_lastError = DaError::None;
    QString m_error;
    qint64 m_bytesWritten = 0;
};

} // namespace datool
