/**
 * @file types.h
 * @brief Core type definitions for fetchd
 */

#ifndef FETCHD_CORE_TYPES_H
#define FETCHD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace fetchd {

/**
 * @brief Error codes for download dispatch operations
 *
 * Error code ranges:
 * - -100 to -119: Hosting / URL resolution errors
 * - -120 to -139: Filesystem errors
 * - -140 to -159: Process / downloader errors
 * - -160 to -179: Network errors
 * - -180 to -199: Dispatch errors
 * - -200 to -219: Coordinator errors
 * - -220 to -239: Configuration and internal errors
 */
enum class error_code {
    success = 0,

    // Hosting errors (-100 to -119)
    url_resolution_failed = -100,
    file_not_found_on_host = -101,

    // Filesystem errors (-120 to -139)
    directory_create_failed = -120,
    file_stat_failed = -121,
    file_remove_failed = -122,
    invalid_target_path = -123,

    // Process errors (-140 to -159)
    process_spawn_failed = -140,
    downloader_failed = -141,
    downloader_not_found = -142,

    // Network errors (-160 to -179)
    connection_reset = -160,
    connection_refused = -161,
    io_timeout = -162,

    // Dispatch errors (-180 to -199)
    download_cancelled = -180,
    retries_exhausted = -181,
    file_already_active = -182,
    queue_closed = -183,
    pool_not_running = -184,
    pool_already_running = -185,

    // Coordinator errors (-200 to -219)
    transfer_not_found = -200,
    transfer_not_active = -201,
    total_size_fixed = -202,

    // Configuration / internal errors (-220 to -239)
    invalid_configuration = -220,
    internal_error = -221,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::url_resolution_failed:
            return "failed to get download URL";
        case error_code::file_not_found_on_host:
            return "file not found on host";
        case error_code::directory_create_failed:
            return "failed to create directory";
        case error_code::file_stat_failed:
            return "failed to verify downloaded file";
        case error_code::file_remove_failed:
            return "failed to remove file";
        case error_code::invalid_target_path:
            return "target path outside download directory";
        case error_code::process_spawn_failed:
            return "failed to start downloader";
        case error_code::downloader_failed:
            return "downloader failed";
        case error_code::downloader_not_found:
            return "downloader executable not found";
        case error_code::connection_reset:
            return "connection reset";
        case error_code::connection_refused:
            return "connection refused";
        case error_code::io_timeout:
            return "i/o timeout";
        case error_code::download_cancelled:
            return "download cancelled";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::file_already_active:
            return "file already active";
        case error_code::queue_closed:
            return "job queue closed";
        case error_code::pool_not_running:
            return "worker pool not running";
        case error_code::pool_already_running:
            return "worker pool already running";
        case error_code::transfer_not_found:
            return "transfer not found";
        case error_code::transfer_not_active:
            return "transfer not active";
        case error_code::total_size_fixed:
            return "total size already fixed";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
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

/**
 * @brief Identifier of a file on the hosting service
 */
using file_id = int64_t;

/**
 * @brief Identifier of a logical transfer (a group of files)
 */
using transfer_id = int64_t;

}  // namespace fetchd

#endif  // FETCHD_CORE_TYPES_H
