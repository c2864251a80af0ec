#ifndef PIXVAULT_ERRORS_HPP
#define PIXVAULT_ERRORS_HPP

#include <stdexcept>
#include <string>

// Numeric values are part of the C ABI (pixvault_c.h), do not renumber.
enum class ErrorCode : int {
    Success = 0,
    InvalidInput = 1,
    IoError = 2,
    EncodingError = 3,
    DecodingError = 4,
    ConfigError = 5,
    OperationInProgress = 6,
    InvalidHandle = 7,
    Interrupted = 8,
    IntegrityMismatch = 9,
    Unknown = 255
};

const char* error_code_name(ErrorCode code);

class VaultError : public std::runtime_error {
public:
    VaultError(ErrorCode code, const std::string& message);
    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Bad path, unreadable file, malformed configuration value
class InvalidInputError : public VaultError {
public:
    explicit InvalidInputError(const std::string& message)
        : VaultError(ErrorCode::InvalidInput, message) {}
};

// Resolution and chunk size cannot be reconciled, even after clamping
class ConfigError : public VaultError {
public:
    explicit ConfigError(const std::string& message)
        : VaultError(ErrorCode::ConfigError, message) {}
};

class IoError : public VaultError {
public:
    explicit IoError(const std::string& message)
        : VaultError(ErrorCode::IoError, message) {}
};

class EncodingError : public VaultError {
public:
    explicit EncodingError(const std::string& message)
        : VaultError(ErrorCode::EncodingError, message) {}
};

class DecodingError : public VaultError {
public:
    explicit DecodingError(const std::string& message)
        : VaultError(ErrorCode::DecodingError, message) {}
};

// The reconstructed bytes do not hash to the digest recorded at encode time.
// Kept apart from DecodingError so callers can tell a corrupted artifact from
// a codec or I/O fault.
class IntegrityError : public DecodingError {
public:
    IntegrityError(const std::string& expected, const std::string& actual);

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

// Misuse of a job instance: OperationInProgress or InvalidHandle
class JobStateError : public VaultError {
public:
    JobStateError(ErrorCode code, const std::string& message)
        : VaultError(code, message) {}
};

class CancelledError : public VaultError {
public:
    explicit CancelledError(const std::string& message)
        : VaultError(ErrorCode::Interrupted, message) {}
};

#endif // PIXVAULT_ERRORS_HPP
