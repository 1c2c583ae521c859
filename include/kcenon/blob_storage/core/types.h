/**
 * @file types.h
 * @brief Core type definitions for blob_storage_system
 */

#ifndef KCENON_BLOB_STORAGE_CORE_TYPES_H
#define KCENON_BLOB_STORAGE_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::blob_storage {

/**
 * @brief Error codes for blob storage operations
 */
enum class error_code {
    success = 0,

    // Credential errors (-100 to -119)
    invalid_key = -100,

    // Argument errors (-120 to -139)
    invalid_argument = -120,
    invalid_url = -121,

    // Transport errors (-160 to -179)
    transport_error = -160,
    try_timeout = -161,
    operation_timeout = -162,
    operation_cancelled = -163,
    transport_unavailable = -164,

    // HTTP errors (-180 to -199)
    terminal_http_error = -180,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_key:
            return "invalid account key";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_url:
            return "invalid url";
        case error_code::transport_error:
            return "transport error";
        case error_code::try_timeout:
            return "try timed out";
        case error_code::operation_timeout:
            return "operation timed out";
        case error_code::operation_cancelled:
            return "operation cancelled";
        case error_code::transport_unavailable:
            return "transport unavailable";
        case error_code::terminal_http_error:
            return "http error";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether an error code describes a condition a retry can fix
 *
 * Only network-level failures and per-try timeouts qualify. Retryable HTTP
 * statuses (500, 503) arrive as responses and are classified separately.
 */
[[nodiscard]] constexpr auto is_transient(error_code code) -> bool {
    return code == error_code::transport_error ||
           code == error_code::try_timeout;
}

/**
 * @brief Error type with code, message and optional HTTP status
 */
struct error {
    error_code code;
    std::string message;
    int http_status = 0;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, int status)
        : code(c), message(std::move(msg)), http_status(status) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_CORE_TYPES_H
