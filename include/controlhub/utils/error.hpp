#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

// C++20 compatibility - std::expected is C++23
#if __cplusplus >= 202302L
#include <expected>
#else
#include <source_location>
#endif

namespace scoreboard::controlhub {

enum class ErrorCode {
    SUCCESS = 0,

    // Configuration errors
    CONFIG_INVALID_FORMAT = 1000,
    CONFIG_MISSING_FIELD = 1001,
    CONFIG_INVALID_VALUE = 1002,
    CONFIG_FILE_NOT_FOUND = 1003,
    CONFIG_VALIDATION_ERROR = 1004,
    CONFIG_RESERVED_KEY = 1005,

    // Config store errors
    STORE_UNAVAILABLE = 2000,
    STAGE_FAILED = 2001,
    COMMIT_FAILED = 2002,
    STALE_STAGE = 2003,
    PUBLISH_FAILED = 2004,

    // Plugin errors
    PLUGIN_NOT_FOUND = 3000,
    PLUGIN_BAD_MANIFEST = 3001,
    PLUGIN_DUPLICATE_ID = 3002,
    PLUGIN_FILE_COLLISION = 3003,
    PLUGIN_INVALID_STATE = 3004,
    PACKAGE_NOT_FOUND = 3005,

    // Dependency errors
    DEPENDENCY_UNRESOLVED = 4000,
    CYCLIC_DEPENDENCY = 4001,
    VERSION_MISMATCH = 4002,
    HAS_DEPENDENTS = 4003,

    // Process control errors
    PROCESS_NOT_FOUND = 5000,
    SUPERVISOR_UNREACHABLE = 5001,
    SUPERVISOR_FAULT = 5002,
    RESTART_TIMEOUT = 5003,
    RESTART_FAILED = 5004,
    PROTOCOL_ERROR = 5005,

    // Transaction errors
    TRANSACTION_BUSY = 6000,
    HEALTH_CHECK_FAILED = 6001,
    UNRECOVERABLE = 6002,
    TRANSACTION_CANCELLED = 6003,

    // I/O errors
    IO_READ_FAILED = 7000,
    IO_WRITE_FAILED = 7001,
    LOCK_HELD = 7002,

    // Generic errors
    INVALID_PARAMETER = 8000,
    OPERATION_FAILED = 8002,
    TIMEOUT = 8003,
    INVALID_STATE = 8006,
    FILE_ERROR = 8010,
    ALREADY_INITIALIZED = 8011,
    NOT_INITIALIZED = 8014
};

// Coarse classes used by callers to decide how to react to a failure.
enum class ErrorCategory {
    NONE,
    INPUT,          // rejected before any state mutation
    DEPENDENCY,     // rejected at planning time
    OPERATIONAL,    // failed after staging, rollback attempted
    UNRECOVERABLE,  // rollback failed, operator must intervene
    CONCURRENCY,    // caller may retry
    SYSTEM
};

class Error {
public:
    explicit Error(ErrorCode code,
                   std::source_location location = std::source_location::current())
        : code_(code), message_(), location_(location) {}

    Error(ErrorCode code,
          const std::string& message,
          std::source_location location = std::source_location::current())
        : code_(code), message_(message), location_(location) {}

    Error(ErrorCode code,
          std::string&& message,
          std::source_location location = std::source_location::current())
        : code_(code), message_(std::move(message)), location_(location) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::source_location& location() const noexcept { return location_; }

    // Offending configuration key or manifest field, if any.
    const std::string& field() const noexcept { return field_; }
    // Plugin identifiers involved (dependents, cycle chain, missing dependency).
    const std::vector<std::string>& related() const noexcept { return related_; }
    const std::shared_ptr<Error>& cause() const noexcept { return cause_; }
    // Set on operational failures: whether the automatic rollback completed.
    std::optional<bool> rollback_succeeded() const noexcept { return rollback_succeeded_; }

    Error& with_field(std::string field) {
        field_ = std::move(field);
        return *this;
    }

    Error& with_related(std::vector<std::string> ids) {
        related_ = std::move(ids);
        return *this;
    }

    Error& with_cause(std::shared_ptr<Error> cause) {
        cause_ = std::move(cause);
        return *this;
    }

    Error& with_rollback(bool succeeded) {
        rollback_succeeded_ = succeeded;
        return *this;
    }

    ErrorCategory category() const noexcept;

    std::string to_string() const;

    bool operator==(const Error& other) const noexcept {
        return code_ == other.code_;
    }

    bool operator==(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
    std::string field_;
    std::vector<std::string> related_;
    std::shared_ptr<Error> cause_;
    std::optional<bool> rollback_succeeded_;
};

// C++20 compatible implementation of std::expected (must come before Result typedef)
#if __cplusplus < 202302L
template<typename T>
class unexpected {
private:
    T error_;

public:
    constexpr explicit unexpected(T&& error) : error_(std::move(error)) {}
    constexpr explicit unexpected(const T& error) : error_(error) {}

    constexpr const T& value() const& { return error_; }
    constexpr T& value() & { return error_; }
    constexpr T&& value() && { return std::move(error_); }
    constexpr const T&& value() const&& { return std::move(error_); }
};

template<typename T, typename E>
class expected {
private:
    std::variant<T, E> data_;

public:
    constexpr expected() = default;
    constexpr expected(const T& value) : data_(std::in_place_index<0>, value) {}
    constexpr expected(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    constexpr expected(const unexpected<E>& unexp) : data_(std::in_place_index<1>, unexp.value()) {}
    constexpr expected(unexpected<E>&& unexp)
        : data_(std::in_place_index<1>, std::move(unexp).value()) {}

    constexpr bool has_value() const { return data_.index() == 0; }
    constexpr explicit operator bool() const { return has_value(); }

    constexpr const T& value() const& { return std::get<0>(data_); }
    constexpr T& value() & { return std::get<0>(data_); }
    constexpr T&& value() && { return std::get<0>(std::move(data_)); }
    constexpr const T&& value() const&& { return std::get<0>(std::move(data_)); }

    template<typename U>
    constexpr T value_or(U&& fallback) const& {
        return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
    }

    constexpr const E& error() const& { return std::get<1>(data_); }
    constexpr E& error() & { return std::get<1>(data_); }
    constexpr E&& error() && { return std::get<1>(std::move(data_)); }
    constexpr const E&& error() const&& { return std::get<1>(std::move(data_)); }

    constexpr const T& operator*() const& { return value(); }
    constexpr T& operator*() & { return value(); }
    constexpr T&& operator*() && { return std::move(value()); }
    constexpr const T&& operator*() const&& { return std::move(value()); }

    constexpr const T* operator->() const { return &value(); }
    constexpr T* operator->() { return &value(); }
};

// Specialization for void
template<typename E>
class expected<void, E> {
private:
    std::optional<E> error_;

public:
    constexpr expected() = default;
    constexpr expected(const unexpected<E>& unexp) : error_(unexp.value()) {}
    constexpr expected(unexpected<E>&& unexp) : error_(std::move(unexp).value()) {}

    constexpr bool has_value() const { return !error_.has_value(); }
    constexpr explicit operator bool() const { return has_value(); }

    constexpr void value() const {
        if (error_.has_value()) {
            throw std::runtime_error("Expected contains error");
        }
    }

    constexpr const E& error() const& { return error_.value(); }
    constexpr E& error() & { return error_.value(); }
    constexpr E&& error() && { return std::move(error_.value()); }
    constexpr const E&& error() const&& { return std::move(error_.value()); }
};
#endif // __cplusplus < 202302L

#if __cplusplus >= 202302L
template<typename T>
using Result = std::expected<T, Error>;
using std::unexpected;
#else
template<typename T>
using Result = expected<T, Error>;
#endif

using VoidResult = Result<void>;

#define CONTROLHUB_CONCAT_INNER(a, b) a##b
#define CONTROLHUB_CONCAT(a, b) CONTROLHUB_CONCAT_INNER(a, b)

#define RETURN_IF_ERROR(expr) \
    do { \
        auto result_ = (expr); \
        if (!result_) { \
            return ::scoreboard::controlhub::unexpected(std::move(result_).error()); \
        } \
    } while (0)

#define ASSIGN_OR_RETURN_IMPL(tmp, var, expr) \
    auto tmp = (expr); \
    if (!tmp) { \
        return ::scoreboard::controlhub::unexpected(std::move(tmp).error()); \
    } \
    var = std::move(tmp).value()

#define ASSIGN_OR_RETURN(var, expr) \
    ASSIGN_OR_RETURN_IMPL(CONTROLHUB_CONCAT(result_, __LINE__), var, expr)

#define MAKE_ERROR(code, message) \
    ::scoreboard::controlhub::Error(::scoreboard::controlhub::ErrorCode::code, message)

#define MAKE_SIMPLE_ERROR(code) \
    ::scoreboard::controlhub::Error(::scoreboard::controlhub::ErrorCode::code)

// Helper function for making errors
inline Error make_error(ErrorCode code, const std::string& message,
                        std::source_location location = std::source_location::current()) {
    return Error(code, message, location);
}

const char* error_code_to_string(ErrorCode code) noexcept;
ErrorCategory get_error_category(ErrorCode code) noexcept;

}  // namespace scoreboard::controlhub
