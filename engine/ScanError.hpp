#pragma once

#include <stdexcept>
#include <string>

namespace filesentry {

enum class ScanErrorCode {
    CONFIGURATION_DISABLED,
    SIZE_EXCEEDED,
    TIMEOUT,
    DECODE_FAILURE,
    INTERNAL
};

inline std::string ScanErrorCodeToString(ScanErrorCode code) {
    switch (code) {
        case ScanErrorCode::CONFIGURATION_DISABLED: return "CONFIGURATION_DISABLED";
        case ScanErrorCode::SIZE_EXCEEDED:          return "SIZE_EXCEEDED";
        case ScanErrorCode::TIMEOUT:                return "TIMEOUT";
        case ScanErrorCode::DECODE_FAILURE:         return "DECODE_FAILURE";
        case ScanErrorCode::INTERNAL:               return "INTERNAL";
        default:                                    return "INTERNAL";
    }
}

// Raised when a scan cannot produce a result. Only TIMEOUT is retryable, and
// only by the caller: the engine never retries on its own.
class ScanError : public std::runtime_error {
public:
    ScanError(ScanErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ScanErrorCode code() const { return code_; }
    bool retryable() const { return code_ == ScanErrorCode::TIMEOUT; }

private:
    ScanErrorCode code_;
};

} // namespace filesentry
