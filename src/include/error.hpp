#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <crow.h>

namespace toolhost {

// Error categories for classification and wire code mapping
enum class ErrorCategory {
    Protocol,        // Malformed envelope, unknown method, bad params
    Validation,      // Tool arguments rejected by the schema
    NotFound,        // Tool not registered
    ToolExecution,   // The tool's own reported failure
    NotConfigured,   // Collaborator (resources, sampling) not available
    NotInitialized,  // Request arrived before initialize
    Transport,       // Writing a frame failed
    Cancelled,       // Connection closed or request cancelled
    Configuration,   // Config file/structure issues, schema compile failures
    Internal         // Internal/programming errors
};

// Single field-level schema violation
struct ValidationError {
    std::string fieldName;
    std::string errorMessage;
};

// Error details structure
struct Error {
    ErrorCategory category;
    std::string message;
    std::string details;
    int code;
    std::vector<ValidationError> violations;

    // Factory methods for common error types
    static Error Protocol(int rpc_code, const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Protocol, msg, details, rpc_code, {}};
    }

    static Error Validation(const std::string& msg, std::vector<ValidationError> violations = {},
                            const std::string& details = "");

    static Error NotFound(const std::string& msg, const std::string& details = "");

    static Error ToolExecution(const std::string& msg, const std::string& details = "");

    static Error NotConfigured(const std::string& msg, const std::string& details = "");

    static Error NotInitialized(const std::string& msg, const std::string& details = "");

    static Error Transport(const std::string& msg, const std::string& details = "");

    static Error Cancelled(const std::string& msg, const std::string& details = "");

    static Error Config(const std::string& msg, const std::string& details = "");

    static Error Internal(const std::string& msg, const std::string& details = "");

    // JSON-RPC error object: {code, message, data}
    crow::json::wvalue toJson() const;

    // The data member alone: {category, details?, violations?}
    crow::json::wvalue toData() const;

    // HTTP status used by the HTTP transport when the error is not wrapped in a JSON-RPC body
    int httpStatus() const;

    // Get category name as string
    std::string getCategoryName() const;

    // "message: details" or just "message"
    std::string describe() const;
};

// Expected<T, E> is a sum type that can hold either a success value or an error
// This is the Result type pattern for operations that can fail
template<typename T, typename E = Error>
class Expected {
public:
    // Constructor for value types (T && lvalue ref, excluding E type and Expected itself)
    template<typename U,
             typename std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>,
                                       int> = 0>
    Expected(U&& val) : has_value_(true) {
        new (&value_) T(std::forward<U>(val));
    }

    // Constructor for error types (E && references)
    // Only enabled when U decays to E
    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : has_value_(false) {
        new (&error_) E(std::forward<U>(err));
    }

    // Copy constructor deleted
    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;

    // Move constructor
    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    // Move assignment
    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    // Destructor
    ~Expected() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    // Check if contains value (success)
    bool has_value() const { return has_value_; }
    explicit operator bool() const { return has_value_; }

    // Get the value (only valid if has_value() is true)
    T& value() {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    // Get the error (only valid if has_value() is false)
    E& error() {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    const E& error() const {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    // Dereference operators for convenience
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

// Expected<void, E> carries only success or an error
template<typename E>
class Expected<void, E> {
public:
    Expected() = default;

    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : error_(std::forward<U>(err)) {}

    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;
    Expected(Expected&&) noexcept = default;
    Expected& operator=(Expected&&) noexcept = default;

    bool has_value() const { return !error_.has_value(); }
    explicit operator bool() const { return has_value(); }

    E& error() {
        if (!error_) throw std::runtime_error("Accessing error of success Expected");
        return *error_;
    }

    const E& error() const {
        if (!error_) throw std::runtime_error("Accessing error of success Expected");
        return *error_;
    }

private:
    std::optional<E> error_;
};

// Alias for common Result type: Result<T> means Result<T, Error>
template<typename T>
using Result = Expected<T, Error>;

using Status = Expected<void, Error>;

} // namespace toolhost
