#pragma once

#include <string>

namespace gifpress {

/**
 * Failure categories of the compression core
 */
enum class ErrorKind {
    NONE,
    INVALID_TARGET,         // target percent outside [1, 99]
    EMPTY_ANIMATION,        // animation has no frames
    INVALID_PARAMETER,      // stage parameter out of range
    DELAY_OVERFLOW,         // accumulated delay exceeds MAX_FRAME_DELAY
    ENCODE_PROBE_FAILURE    // external encoder failed
};

/**
 * Error reported by every fallible core operation
 */
struct CompressionError {
    ErrorKind kind;
    std::string message;

    CompressionError() : kind(ErrorKind::NONE) {}

    bool is_set() const { return kind != ErrorKind::NONE; }

    /// Record a failure; returns false so callers can `return error.set(...)`
    bool set(ErrorKind k, const std::string& msg) {
        kind = k;
        message = msg;
        return false;
    }

    void clear() {
        kind = ErrorKind::NONE;
        message.clear();
    }

    std::string to_string() const;
};

const char* error_kind_name(ErrorKind kind);

} // namespace gifpress
