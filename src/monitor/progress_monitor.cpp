/**
 * @file progress_monitor.cpp
 * @brief Downloader output monitoring
 */

#include "fetchd/monitor/progress_monitor.h"

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

#include "fetchd/core/logging.h"

namespace fetchd {

namespace {

constexpr std::size_t read_buffer_size = 4096;

}  // namespace

progress_monitor::progress_monitor(download_state& state,
                                   progress_monitor_config config,
                                   std::chrono::steady_clock::time_point start)
    : state_(state), config_(config), last_log_time_(start) {}

auto progress_monitor::process_line(std::string_view line,
                                    std::chrono::steady_clock::time_point now) -> bool {
    if (line.empty()) {
        return false;
    }

    auto sample = parse_progress_line(line);
    if (!sample) {
        if (contains_failure_marker(line)) {
            ++failure_lines_;
            log_failure_line(line);
        }
        return false;
    }

    uint64_t downloaded = sample->downloaded_bytes.value_or(state_.snapshot().downloaded_bytes);
    state_.update_progress(sample->percent, downloaded, now);
    last_sample_ = sample;

    if (now - last_log_time_ >= config_.log_interval &&
        sample->percent != last_logged_percent_) {
        log_progress(*sample);
        last_logged_percent_ = sample->percent;
        last_log_time_ = now;
        ++progress_logs_;
    }

    return true;
}

auto progress_monitor::feed(std::string_view chunk,
                            std::chrono::steady_clock::time_point now) -> std::size_t {
    std::size_t handled = 0;
    for (char c : chunk) {
        if (c == '\n' || c == '\r') {
            if (!pending_.empty()) {
                process_line(pending_, now);
                pending_.clear();
                ++handled;
            }
        } else {
            pending_ += c;
        }
    }
    return handled;
}

void progress_monitor::flush(std::chrono::steady_clock::time_point now) {
    if (!pending_.empty()) {
        process_line(pending_, now);
        pending_.clear();
    }
}

void progress_monitor::run(int fd, const std::atomic<bool>& done,
                           const cancellation_token& token) {
    std::array<char, read_buffer_size> buffer{};

    while (!token.is_cancelled()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, static_cast<int>(config_.poll_timeout.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            FD_LOG_WARN(log_category::monitor,
                        std::string("poll on downloader output failed: ") + std::strerror(errno));
            break;
        }

        if (ready == 0) {
            if (done.load(std::memory_order_acquire)) {
                break;
            }
            continue;
        }

        auto n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            FD_LOG_WARN(log_category::monitor,
                        std::string("read from downloader output failed: ") + std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;  // EOF
        }

        feed(std::string_view(buffer.data(), static_cast<std::size_t>(n)),
             std::chrono::steady_clock::now());
    }

    flush(std::chrono::steady_clock::now());
}

void progress_monitor::log_progress(const progress_sample& sample) {
    auto snapshot = state_.snapshot();

    transfer_log_context ctx;
    ctx.transfer_id = snapshot.transfer;
    ctx.file_id = snapshot.id;
    ctx.filename = snapshot.name;
    ctx.progress_percent = sample.percent;
    ctx.rate_mbps = sample.speed_mbps;
    if (!sample.eta.empty()) {
        ctx.eta = sample.eta;
    }
    FD_LOG_INFO_CTX(log_category::monitor, "Download progress", ctx);
}

void progress_monitor::log_failure_line(std::string_view line) {
    auto snapshot = state_.snapshot();

    transfer_log_context ctx;
    ctx.transfer_id = snapshot.transfer;
    ctx.file_id = snapshot.id;
    ctx.filename = snapshot.name;
    ctx.downloader_output = std::string(line);
    FD_LOG_ERROR_CTX(log_category::monitor, "Downloader error output", ctx);
}

}  // namespace fetchd
