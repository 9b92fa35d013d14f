#pragma once

#include <stdexcept>
#include <string>

namespace vesta {
namespace storage {

enum class ErrorCode {
    NOT_CONNECTED,        // operation before open() or after close()
    UNSUPPORTED_QUERY,    // filter, update or stage outside the supported grammar
    IO_FAILURE,           // collection file could not be read, parsed or written
    BACKEND_UNAVAILABLE,  // network backend unreachable at startup probe
    DRIVER_ERROR          // remote driver call failed on an established connection
};

inline const char* errorCodeName(ErrorCode code);

/// Structural storage failure. Lookup misses are never reported this way;
/// they come back as std::nullopt or empty results.
class StorageError : public std::runtime_error {
public:
    StorageError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(errorCodeName(code)) + ": " + message)
        , code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_CONNECTED: return "NotConnected";
        case ErrorCode::UNSUPPORTED_QUERY: return "UnsupportedQuery";
        case ErrorCode::IO_FAILURE: return "IOFailure";
        case ErrorCode::BACKEND_UNAVAILABLE: return "BackendUnavailable";
        case ErrorCode::DRIVER_ERROR: return "DriverError";
    }
    return "StorageError";
}

} // namespace storage
} // namespace vesta
