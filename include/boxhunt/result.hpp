#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace boxhunt {

// Error codes for the harvester
enum class ErrorCode {
    OK = 0,
    NOT_FOUND,
    IO_ERROR,
    CORRUPTION,
    INVALID_ARGUMENT,
    PERMISSION_DENIED,
    INTERNAL_ERROR,
    // Network
    RATE_LIMITED,       // HTTP 429
    TIMEOUT,            // Request timeout
    NETWORK_ERROR,      // Connection/transport failures
    AUTH_ERROR,         // HTTP 401/403 from a provider
    HTTP_ERROR,         // Any other non-success status
    PAYLOAD_TOO_LARGE,  // Declared or received body above the cap
    ROBOTS_DISALLOWED,  // Blocked by robots.txt
    // Content
    UNSUPPORTED_FORMAT, // Bytes are not a decodable image format
    DECODE_ERROR,       // Recognized format, broken data
    // Orchestration
    NO_SOURCES          // No source clients configured
};

// Error with code and message
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::CORRUPTION: return "CORRUPTION";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            case ErrorCode::RATE_LIMITED: return "RATE_LIMITED";
            case ErrorCode::TIMEOUT: return "TIMEOUT";
            case ErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
            case ErrorCode::AUTH_ERROR: return "AUTH_ERROR";
            case ErrorCode::HTTP_ERROR: return "HTTP_ERROR";
            case ErrorCode::PAYLOAD_TOO_LARGE: return "PAYLOAD_TOO_LARGE";
            case ErrorCode::ROBOTS_DISALLOWED: return "ROBOTS_DISALLOWED";
            case ErrorCode::UNSUPPORTED_FORMAT: return "UNSUPPORTED_FORMAT";
            case ErrorCode::DECODE_ERROR: return "DECODE_ERROR";
            case ErrorCode::NO_SOURCES: return "NO_SOURCES";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Result type for operations that can fail
template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}

    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::move(std::get<T>(data_));
    }

    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    // Access error (throws if success)
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw std::runtime_error(error_.to_string());
        }
    }

private:
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

inline Error Err(ErrorCode code, std::string message = "") {
    return Error(code, std::move(message));
}

}  // namespace boxhunt
