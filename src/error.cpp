#include "error.hpp"

namespace gifpress {

const char* error_kind_name(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::INVALID_TARGET: return "InvalidTarget";
        case ErrorKind::EMPTY_ANIMATION: return "EmptyAnimation";
        case ErrorKind::INVALID_PARAMETER: return "InvalidParameter";
        case ErrorKind::DELAY_OVERFLOW: return "DelayOverflow";
        case ErrorKind::ENCODE_PROBE_FAILURE: return "EncodeProbeFailure";
    }
    return "Unknown";
}

std::string CompressionError::to_string() const
{
    if (message.empty()) {
        return error_kind_name(kind);
    }
    return std::string(error_kind_name(kind)) + ": " + message;
}

} // namespace gifpress
