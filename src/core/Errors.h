#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <utility>

namespace daily_dash {

enum class ErrorKind {
    Timeout,
    ConnectionError,
    RateLimited,
    HttpError,
    ParseError,
    StorageError,
    Unprivileged,
    ConfigError,
    Cancelled,
    Internal
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    int status = 0; // HTTP status for HttpError/RateLimited, 0 otherwise
    std::string message;

    std::string describe() const;
};

inline Error make_error(ErrorKind kind, std::string message, int status = 0){
    return Error{kind, status, std::move(message)};
}

// Value-or-error carrier used for per-source and per-target outcomes.
template<typename T>
class Result {
public:
    static Result success(T value){ Result r; r.value_ = std::move(value); return r; }
    static Result failure(Error err){ Result r; r.error_ = std::move(err); return r; }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { if(!value_) throw std::logic_error("Result has no value: " + error_->describe()); return *value_; }
    T& value() { if(!value_) throw std::logic_error("Result has no value: " + error_->describe()); return *value_; }
    const Error& error() const { if(!error_) throw std::logic_error("Result has no error"); return *error_; }

private:
    Result() = default;
    std::optional<T> value_;
    std::optional<Error> error_;
};

// Thrown by CacheStore and KnownHostsStore on durable-storage failures.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Thrown by ConfigLoader for malformed configuration files.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}
