/**
 * @file progress_monitor.h
 * @brief Consumes downloader output and updates the job's download_state
 */

#ifndef FETCHD_MONITOR_PROGRESS_MONITOR_H
#define FETCHD_MONITOR_PROGRESS_MONITOR_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "fetchd/core/cancellation.h"
#include "download_state.h"
#include "progress_parser.h"

namespace fetchd {

/**
 * @brief Progress monitor configuration
 */
struct progress_monitor_config {
    /// Minimum time between two progress log entries
    std::chrono::milliseconds log_interval{5000};
    /// Read timeout used while waiting for output
    std::chrono::milliseconds poll_timeout{100};
};

/**
 * @brief Reads a line-oriented progress stream for one job
 *
 * Lines are split on both '\\n' and '\\r' since aria2c redraws its summary
 * with carriage returns. Every parsed progress line updates the
 * download_state. A progress log entry is emitted only when log_interval has
 * elapsed since the previous one AND the percentage changed.
 *
 * @code
 * download_state state(job);
 * progress_monitor monitor(state);
 * std::thread reader([&] { monitor.run(process->output_fd(), done, token); });
 * @endcode
 */
class progress_monitor {
public:
    progress_monitor(download_state& state,
                     progress_monitor_config config = {},
                     std::chrono::steady_clock::time_point start =
                         std::chrono::steady_clock::now());

    progress_monitor(const progress_monitor&) = delete;
    auto operator=(const progress_monitor&) -> progress_monitor& = delete;

    /**
     * @brief Handle one complete output line
     * @return true if the line was a progress line
     */
    auto process_line(std::string_view line,
                      std::chrono::steady_clock::time_point now) -> bool;

    /**
     * @brief Append raw output, handling every completed line
     *
     * A trailing partial line is buffered until the next call or flush().
     *
     * @return Number of lines handled
     */
    auto feed(std::string_view chunk,
              std::chrono::steady_clock::time_point now) -> std::size_t;

    /**
     * @brief Handle the buffered partial line, if any
     */
    void flush(std::chrono::steady_clock::time_point now);

    /**
     * @brief Read from a file descriptor until EOF, done or cancellation
     *
     * Once @p done is set the remaining readable output is still drained;
     * the loop stops at the first idle poll.
     */
    void run(int fd, const std::atomic<bool>& done, const cancellation_token& token);

    [[nodiscard]] auto progress_logs() const noexcept -> std::size_t {
        return progress_logs_;
    }

    [[nodiscard]] auto failure_lines() const noexcept -> std::size_t {
        return failure_lines_;
    }

    [[nodiscard]] auto last_sample() const -> const std::optional<progress_sample>& {
        return last_sample_;
    }

private:
    void log_progress(const progress_sample& sample);
    void log_failure_line(std::string_view line);

    download_state& state_;
    progress_monitor_config config_;
    std::chrono::steady_clock::time_point last_log_time_;
    double last_logged_percent_ = 0.0;
    std::size_t progress_logs_ = 0;
    std::size_t failure_lines_ = 0;
    std::optional<progress_sample> last_sample_;
    std::string pending_;
};

}  // namespace fetchd

#endif  // FETCHD_MONITOR_PROGRESS_MONITOR_H
