#pragma once

#include "trustpath/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>

namespace trustpath {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Unknown = 1,
    InvalidArgument,
    OutOfRange,

    // Cryptography errors
    CryptoInitFailed,
    CryptoSignatureFailed,
    CryptoKeyGenerationFailed,
    InvalidPublicKey,
    InvalidSecretKey,

    // Record admission errors
    InvalidSignature,
    UnknownSigner,

    // Domain errors
    CyclicDomainHierarchy,
    UnknownDomain,

    // Graph access errors
    PortUnavailable,

    // Configuration errors
    ConfigInvalid,

    // Serialization errors
    DeserializationFailed,
    InvalidFormat
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Only storage-layer outages are worth retrying; every other failure is terminal
bool is_retryable(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }
    bool retryable() const { return is_retryable(code_); }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling
template<typename T>
class Result {
public:
    // Success constructor
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    // Error constructor
    static Result Err(Error error) {
        return Result(std::move(error));
    }

    // Error constructor with code and message
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    // Check if result contains a value
    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    // Get value or default
    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }



    // Convert to optional
    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    static Result Ok() {
        return Result(true);
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }


private:
    explicit Result(bool) : error_(std::nullopt) {}
    explicit Result(Error error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

// Custom exception classes
class TrustPathException : public std::runtime_error {
public:
    TrustPathException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class CryptoException : public TrustPathException {
public:
    CryptoException(ErrorCode code, const std::string& message)
        : TrustPathException(code, "Crypto error: " + message) {}
};

// Thrown by Graph Access Port implementations when the backing store fails
class StorageException : public TrustPathException {
public:
    StorageException(ErrorCode code, const std::string& message)
        : TrustPathException(code, "Storage error: " + message) {}
};

class ConfigException : public TrustPathException {
public:
    ConfigException(ErrorCode code, const std::string& message)
        : TrustPathException(code, "Config error: " + message) {}
};

// Utility macros for error handling
#define TRUSTPATH_TRY(expr) \
    do { \
        auto __result = (expr); \
        if (__result.is_err()) { \
            return decltype(__result)::Err(__result.error()); \
        } \
    } while (0)

} // namespace trustpath
