#pragma once

#include <string>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <crow.h>

namespace switchyard {

// Failure kinds and their HTTP status mapping
enum class ErrorCategory {
    BadRequest,        // Malformed body or parameters
    Unauthorized,      // Missing or rejected credentials
    RouteNotFound,     // No route for the path under any method
    MethodNotAllowed,  // Path exists, but not under the requested method
    InternalFault,     // Fault intercepted by the recovery middleware
    Configuration      // Invalid server configuration
};

struct Error {
    ErrorCategory category;
    std::string message;
    std::string details;
    int http_status_code;

    static Error BadRequest(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::BadRequest, msg, details, 400};
    }

    static Error Unauthorized(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Unauthorized, msg, details, 401};
    }

    static Error RouteNotFound(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::RouteNotFound, msg, details, 404};
    }

    static Error MethodNotAllowed(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::MethodNotAllowed, msg, details, 405};
    }

    static Error InternalFault(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::InternalFault, msg, details, 500};
    }

    static Error Configuration(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Configuration, msg, details, 500};
    }

    // Convert error to JSON representation
    crow::json::wvalue toJson() const;

    std::string getCategoryName() const;
};

// Expected<T, E> holds either a success value or an error
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

    ~Expected() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
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
    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

template<typename T>
using Result = Expected<T, Error>;

} // namespace switchyard
