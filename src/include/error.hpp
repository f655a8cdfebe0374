#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <crow/json.h>

namespace sqlscript {

// Error categories for classification and process exit code mapping
enum class ErrorCategory {
    Configuration,         // Config file/structure issues
    Connection,            // Database could not be opened
    Database,              // Statement execution errors
    UnsupportedStatement,  // Statement kind could not be determined
    Internal               // Internal/programming errors
};

// Error details structure
struct Error {
    ErrorCategory category;
    std::string message;
    std::string details;
    int exit_code;

    static Error Config(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Configuration, msg, details, 2};
    }

    static Error Connection(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Connection, msg, details, 3};
    }

    static Error Database(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Database, msg, details, 4};
    }

    static Error Unsupported(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::UnsupportedStatement, msg, details, 5};
    }

    static Error Internal(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Internal, msg, details, 1};
    }

    // Convert error to JSON representation
    crow::json::wvalue toJson() const;

    // Get category name as string
    std::string getCategoryName() const;
};

// Raised when the database cannot be opened or a statement fails.
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& message, bool connection_failure = false)
        : std::runtime_error(message), connection_failure_(connection_failure) {}

    bool isConnectionFailure() const { return connection_failure_; }

private:
    bool connection_failure_;
};

// Raised when a script contains a statement that is neither query, DML nor DDL.
class UnsupportedStatementError : public std::runtime_error {
public:
    explicit UnsupportedStatementError(const std::string& statement)
        : std::runtime_error("Unsupported statement: " + statement), statement_(statement) {}

    const std::string& statement() const { return statement_; }

private:
    std::string statement_;
};

// Expected<T, E> holds either a success value or an error.
template<typename T, typename E = Error>
class Expected {
public:
    template<typename U,
             typename std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>,
                                       int> = 0>
    Expected(U&& val) : has_value_(true) {
        new (&value_) T(std::forward<U>(val));
    }

    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : has_value_(false) {
        new (&error_) E(std::forward<U>(err));
    }

    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    ~Expected() {
        destroy();
    }

    bool has_value() const { return has_value_; }
    explicit operator bool() const { return has_value_; }

    T& value() {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    E& error() {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    const E& error() const {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    void destroy() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

template<typename T>
using Result = Expected<T, Error>;

} // namespace sqlscript
