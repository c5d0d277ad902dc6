#pragma once

#include <QString>
#include <QtGlobal>
#include <cstdint>

namespace datool {

// ── DA (Download Agent) image layout ────────────────────────────────────────
//
// A DA image is treated as an opaque header prefix followed by an opaque body.
// Neither part is interpreted here.

constexpr qint64 DA_HEADER_LENGTH = 0x39DC;

enum class DaError : uint8_t {
    None = 0,
    InvalidArguments,
    InputNotFound,
    SourceTooShort,
    IOFailure
};

QString daErrorName(DaError error);

struct DaLayout {
    qint64 headerLength = DA_HEADER_LENGTH;

    // Bytes of the header actually present in an image of the given size
    qint64 headerSize(qint64 imageSize) const {
        return qBound<qint64>(0, imageSize, headerLength);
    }
    qint64 bodySize(qint64 imageSize) const {
        return qMax<qint64>(0, imageSize - headerLength);
    }
    qint64 mergedSize(qint64 sourceSize, qint64 bodyFileSize) const {
        return headerSize(sourceSize) + bodyFileSize;
    }
    bool isComplete(qint64 imageSize) const { return imageSize >= headerLength; }
};

} // namespace datool
