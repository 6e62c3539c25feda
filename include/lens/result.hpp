#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace lens {

// Error codes for script analysis
enum class ErrorCode {
    OK = 0,
    INVALID_INPUT,          // Null buffer or non-positive length
    INVALID_ENCODING,       // Bytes are not well-formed UTF-8
    UNBALANCED_QUOTES,
    UNBALANCED_BRACKETS,
    MALFORMED_SHEBANG,
    STRUCTURAL_MISMATCH,    // Type-specific keyword counts disagree
    UNSUPPORTED_SCRIPT_TYPE, // Unknown where a known type is required
    IO_ERROR,
    INTERNAL_ERROR
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
            case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
            case ErrorCode::INVALID_ENCODING: return "INVALID_ENCODING";
            case ErrorCode::UNBALANCED_QUOTES: return "UNBALANCED_QUOTES";
            case ErrorCode::UNBALANCED_BRACKETS: return "UNBALANCED_BRACKETS";
            case ErrorCode::MALFORMED_SHEBANG: return "MALFORMED_SHEBANG";
            case ErrorCode::STRUCTURAL_MISMATCH: return "STRUCTURAL_MISMATCH";
            case ErrorCode::UNSUPPORTED_SCRIPT_TYPE: return "UNSUPPORTED_SCRIPT_TYPE";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Result type for operations that can fail
// Similar to Rust's Result<T, E> or C++23's std::expected
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::move(value)) {}

    // Error constructors
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

}  // namespace lens
