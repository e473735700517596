/**
 * @file logging.h
 * @brief Process-wide structured logger and FD_LOG_* macros
 *
 * Messages go to stderr as text or JSON lines. When built with
 * BUILD_WITH_LOGGER_SYSTEM and BUILD_WITH_COMMON_SYSTEM they are handed to a
 * kcenon logger_system logger instead. A callback sees every enabled message
 * whatever the backend.
 */

#ifndef FETCHD_CORE_LOGGING_H
#define FETCHD_CORE_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define FETCHD_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace fetchd {

/**
 * @brief Category names, one per component
 */
struct log_category {
    static constexpr std::string_view executor = "fetchd.executor";
    static constexpr std::string_view monitor = "fetchd.monitor";
    static constexpr std::string_view pool = "fetchd.pool";
    static constexpr std::string_view coordinator = "fetchd.coordinator";
    static constexpr std::string_view retry = "fetchd.retry";
    static constexpr std::string_view process = "fetchd.process";
    static constexpr std::string_view manager = "fetchd.manager";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

[[nodiscard]] constexpr auto to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
    }
    return "UNKNOWN";
}

namespace detail {

inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Fields attached to a download log line
 *
 * Only the fields that are set appear in the output.
 */
struct transfer_log_context {
    std::optional<int64_t> transfer_id;
    std::optional<int64_t> file_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> transfer_downloaded;
    std::optional<uint64_t> transfer_total;
    std::optional<double> progress_percent;
    std::optional<double> rate_mbps;
    std::optional<std::string> eta;
    std::optional<std::size_t> attempt;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> target_path;
    std::optional<std::string> error_message;
    std::optional<std::string> downloader_output;

    /**
     * @brief Render as a JSON object, numbers with two decimals
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << "{";

        const char* sep = "";
        auto key = [&](const char* name) -> std::ostringstream& {
            oss << sep << "\"" << name << "\":";
            sep = ",";
            return oss;
        };
        auto text = [&](const char* name, std::string_view value) {
            key(name) << "\"" << detail::escape_json_string(value) << "\"";
        };

        if (transfer_id) key("transfer_id") << *transfer_id;
        if (file_id) key("file_id") << *file_id;
        if (!filename.empty()) text("file_name", filename);
        if (file_size) key("file_size") << *file_size;
        if (transfer_downloaded) key("transfer_downloaded") << *transfer_downloaded;
        if (transfer_total) key("transfer_total") << *transfer_total;
        if (progress_percent) key("progress_percent") << *progress_percent;
        if (rate_mbps) key("speed_mbps") << *rate_mbps;
        if (eta) text("eta", *eta);
        if (attempt) key("attempt") << *attempt;
        if (duration_ms) key("duration_ms") << *duration_ms;
        if (target_path) text("target_path", *target_path);
        if (error_message) text("error", *error_message);
        if (downloader_output) text("downloader_output", *downloader_output);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Process-wide logger used by all fetchd components
 */
class fetchd_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    fetchd_logger() = default;

    fetchd_logger(const fetchd_logger&) = delete;
    fetchd_logger& operator=(const fetchd_logger&) = delete;

    /**
     * @brief Create the logger_system backend, if built with it
     *
     * Called by download_manager; later calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef FETCHD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        } else {
            std::cerr << "fetchd: logger_system unavailable, logging to stderr\n";
        }
#endif
    }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef FETCHD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    /**
     * @brief Write JSON lines instead of text
     */
    void enable_json_output(bool enable) { json_output_.store(enable); }

    [[nodiscard]] auto is_json_output_enabled() const -> bool { return json_output_.load(); }

    /**
     * @brief Suppress the backend output (the callback still fires)
     */
    void set_console_output(bool enabled) { console_output_.store(enabled); }

    /**
     * @brief Observe every enabled message; pass nullptr to remove
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (!console_output_.load()) {
            return;
        }

        auto formatted = format(level, category, message, context);

#ifdef FETCHD_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), formatted, file, line, function);
            } else {
                logger_->log(to_logger_level(level), formatted);
            }
            return;
        }
#endif
        if (!json_output_.load()) {
            formatted = timestamp() + " [" + std::string(to_string(level)) + "] " + formatted;
        }
        write_stderr(formatted);
    }

    /**
     * @brief Render one message the way the active output mode writes it
     */
    [[nodiscard]] auto format(log_level level,
                              std::string_view category,
                              std::string_view message,
                              const transfer_log_context* context = nullptr) const -> std::string {
        return json_output_.load() ? format_json(level, category, message, context)
                                   : format_text(category, message, context);
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::string line = "[" + std::string(category) + "] " + std::string(message);
        if (context) {
            line += " " + context->to_json();
        }
        return line;
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::string line = "{\"timestamp\":\"" + timestamp() + "\",\"level\":\"" +
                           std::string(to_string(level)) + "\",\"category\":\"" +
                           std::string(category) + "\",\"message\":\"" +
                           detail::escape_json_string(message) + "\"";
        if (context) {
            auto fields = context->to_json();
            if (fields.size() > 2) {
                line += "," + fields.substr(1, fields.size() - 2);
            }
        }
        return line + "}";
    }

    static void write_stderr(const std::string& line) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line << "\n";
    }

    // UTC, millisecond precision
    static auto timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&seconds, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
            << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

#ifdef FETCHD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
        }
        return kcenon::logger::log_level::info;
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    std::atomic<bool> json_output_{false};
    std::mutex callback_mutex_;
    log_callback callback_;
};

inline fetchd_logger& get_logger() {
    static fetchd_logger instance;
    return instance;
}

#define FD_LOG(level, category, message) \
    fetchd::get_logger().log(level, category, message, nullptr, __FILE__, __LINE__, __func__)

#define FD_LOG_CTX(level, category, message, context) \
    fetchd::get_logger().log(level, category, message, &context, __FILE__, __LINE__, __func__)

#define FD_LOG_TRACE(category, message) FD_LOG(fetchd::log_level::trace, category, message)
#define FD_LOG_DEBUG(category, message) FD_LOG(fetchd::log_level::debug, category, message)
#define FD_LOG_INFO(category, message) FD_LOG(fetchd::log_level::info, category, message)
#define FD_LOG_WARN(category, message) FD_LOG(fetchd::log_level::warn, category, message)
#define FD_LOG_ERROR(category, message) FD_LOG(fetchd::log_level::error, category, message)
#define FD_LOG_FATAL(category, message) FD_LOG(fetchd::log_level::fatal, category, message)

#define FD_LOG_TRACE_CTX(category, message, ctx) \
    FD_LOG_CTX(fetchd::log_level::trace, category, message, ctx)
#define FD_LOG_DEBUG_CTX(category, message, ctx) \
    FD_LOG_CTX(fetchd::log_level::debug, category, message, ctx)
#define FD_LOG_INFO_CTX(category, message, ctx) \
    FD_LOG_CTX(fetchd::log_level::info, category, message, ctx)
#define FD_LOG_WARN_CTX(category, message, ctx) \
    FD_LOG_CTX(fetchd::log_level::warn, category, message, ctx)
#define FD_LOG_ERROR_CTX(category, message, ctx) \
    FD_LOG_CTX(fetchd::log_level::error, category, message, ctx)
#define FD_LOG_FATAL_CTX(category, message, ctx) \
    FD_LOG_CTX(fetchd::log_level::fatal, category, message, ctx)

}  // namespace fetchd

#endif  // FETCHD_CORE_LOGGING_H
