#include "da_image.h"

namespace datool {

QString daErrorName(DaError error)
{
    switch (error) {
    case DaError::None:             return "None";
    case DaError::InvalidArguments: return "InvalidArguments";
    case DaError::InputNotFound:    return "InputNotFound";
    case DaError::SourceTooShort:   return "SourceTooShort";
    case DaError::IOFailure:        return "IOFailure";
    }
    return "Unknown";
}

} // namespace datool
