/**
 * @file types.h
 * @brief Core type definitions for resumable_upload
 */

#ifndef KCENON_RESUMABLE_UPLOAD_CORE_TYPES_H
#define KCENON_RESUMABLE_UPLOAD_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::resumable_upload {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // Validation errors (-100 to -119)
    file_not_found = -100,
    file_empty = -101,
    file_unreadable = -102,
    file_too_large = -103,
    invalid_chunk_size = -104,
    invalid_url = -105,
    invalid_configuration = -106,
    invalid_chunk_range = -107,

    // Service state errors (-120 to -139)
    service_disposed = -120,
    upload_in_progress = -121,
    not_initialized = -122,
    invalid_state_transition = -123,

    // Transfer errors (-140 to -159)
    http_status_error = -140,
    transfer_cancelled = -141,
    connection_failed = -142,
    connection_timeout = -143,
    transport_unavailable = -144,
    retry_exhausted = -145,
    file_read_error = -146,

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
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_empty:
            return "file empty";
        case error_code::file_unreadable:
            return "file unreadable";
        case error_code::file_too_large:
            return "file too large";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_url:
            return "invalid url";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_chunk_range:
            return "invalid chunk range";
        case error_code::service_disposed:
            return "service disposed";
        case error_code::upload_in_progress:
            return "upload in progress";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::http_status_error:
            return "http status error";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::transport_unavailable:
            return "transport unavailable";
        case error_code::retry_exhausted:
            return "retry exhausted";
        case error_code::file_read_error:
            return "file read error";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether an error code belongs to the validation range
 */
[[nodiscard]] constexpr auto is_validation_error(error_code code) -> bool {
    const auto value = static_cast<int>(code);
    return value <= -100 && value >= -119;
}

/**
 * @brief Check whether an error code belongs to the service state range
 */
[[nodiscard]] constexpr auto is_service_state_error(error_code code) -> bool {
    const auto value = static_cast<int>(code);
    return value <= -120 && value >= -139;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

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

    [[nodiscard]] auto operator*() & -> T& { return *value_; }
    [[nodiscard]] auto operator*() const& -> const T& { return *value_; }
    [[nodiscard]] auto operator->() -> T* { return &*value_; }
    [[nodiscard]] auto operator->() const -> const T* { return &*value_; }

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

/**
 * @brief Half-open byte range [start, end) of the upload payload
 */
struct byte_range {
    uint64_t start = 0;
    uint64_t end = 0;

    [[nodiscard]] auto size() const noexcept -> uint64_t {
        return end > start ? end - start : 0;
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return end <= start; }

    [[nodiscard]] auto operator==(const byte_range& other) const -> bool = default;
};

/**
 * @brief Owned bytes of one chunk read from a chunk source
 */
using chunk_bytes = std::vector<std::byte>;

}  // namespace kcenon::resumable_upload

#endif  // KCENON_RESUMABLE_UPLOAD_CORE_TYPES_H
