#include "errors.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:             return "Success";
        case ErrorCode::InvalidInput:        return "InvalidInput";
        case ErrorCode::IoError:             return "IoError";
        case ErrorCode::EncodingError:       return "EncodingError";
        case ErrorCode::DecodingError:       return "DecodingError";
        case ErrorCode::ConfigError:         return "ConfigError";
        case ErrorCode::OperationInProgress: return "OperationInProgress";
        case ErrorCode::InvalidHandle:       return "InvalidHandle";
        case ErrorCode::Interrupted:         return "Interrupted";
        case ErrorCode::IntegrityMismatch:   return "IntegrityMismatch";
        case ErrorCode::Unknown:             return "Unknown";
    }
    return "Unknown";
}

VaultError::VaultError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

IntegrityError::IntegrityError(const std::string& expected, const std::string& actual)
    : DecodingError("Data integrity error: checksum mismatch (expected: " + expected +
                    ", got: " + actual + ")"),
      expected_(expected), actual_(actual) {}
