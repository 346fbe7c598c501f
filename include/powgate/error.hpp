#pragma once

#include "powgate/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>

namespace powgate {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    
    // Transport errors
    NetworkConnectionFailed,
    NetworkTimeout,
    NetworkInvalidMessage,
    
    // Service errors
    ServerRejected,
    SessionRejected,
    
    // Client-side validation
    ValidationFailed,
    RequestInFlight,
    
    // PoW errors
    PoWInvalidSolution,
    PoWCancelled,
    
    // Storage errors
    StorageWriteFailed
};

/**
 * Coarse classification of an error, used at the protocol boundaries to
 * decide how a failure is surfaced.
 */
enum class ErrorKind {
    Network,       // transport failure, no server response
    Server,        // non-2xx or malformed server response
    Validation,    // rejected before any network call
    StaleSession,  // stored token rejected by the session service
    Cancelled,     // cooperative cancellation
    Internal
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Convert error kind to string
const char* error_kind_to_string(ErrorKind kind);

// Classify an error code
ErrorKind error_kind(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}
    
    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}
    
    ErrorCode code() const { return code_; }
    ErrorKind kind() const { return error_kind(code_); }
    const std::string& message() const { return message_; }
    
    // Server-supplied detail text, empty when the server sent none
    const std::string& details() const { return details_; }
    
    std::string to_string() const;
    
private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

/**
 * Message suitable for display: the server's detail when it sent one,
 * otherwise the fallback.
 */
std::string user_message(const Error& error, const std::string& fallback);

/**
 * Result<T> - value or Error
 *
 * Service calls return this instead of throwing. Accessing the wrong side
 * throws std::runtime_error.
 */
template<typename T>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::move(value));
    }
    
    static Result Err(Error error) {
        return Result(std::move(error));
    }
    
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }
    
    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return !is_ok(); }
    
    T& value() {
        check_ok();
        return std::get<T>(data_);
    }
    
    const T& value() const {
        check_ok();
        return std::get<T>(data_);
    }
    
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result holds a value, not an error");
        }
        return std::get<Error>(data_);
    }
    
    T value_or(T fallback) const {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }
    
private:
    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Error error) : data_(std::move(error)) {}
    
    void check_ok() const {
        if (is_err()) {
            throw std::runtime_error("Result holds an error: " + std::get<Error>(data_).to_string());
        }
    }
    
    std::variant<T, Error> data_;
};

// Outcome of an operation with nothing to return
template<>
class Result<void> {
public:
    static Result Ok() {
        return Result(std::nullopt);
    }
    
    static Result Err(Error error) {
        return Result(std::optional<Error>(std::move(error)));
    }
    
    static Result Err(ErrorCode code, const std::string& message) {
        return Err(Error(code, message));
    }
    
    bool is_ok() const { return !error_; }
    bool is_err() const { return error_.has_value(); }
    
    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Result holds a value, not an error");
        }
        return *error_;
    }
    
private:
    explicit Result(std::optional<Error> error) : error_(std::move(error)) {}
    
    std::optional<Error> error_;
};

// Thrown where a failure cannot be returned (constructors, config loading)
class PowgateException : public std::runtime_error {
public:
    PowgateException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    
    ErrorCode code() const { return code_; }
    
private:
    ErrorCode code_;
};

class StorageException : public PowgateException {
public:
    StorageException(ErrorCode code, const std::string& message)
        : PowgateException(code, "Storage error: " + message) {}
};

} // namespace powgate
