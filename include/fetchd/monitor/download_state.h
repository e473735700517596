/**
 * @file download_state.h
 * @brief Mutable progress state of one in-flight download job
 */

#ifndef FETCHD_MONITOR_DOWNLOAD_STATE_H
#define FETCHD_MONITOR_DOWNLOAD_STATE_H

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "fetchd/core/transfer_types.h"

namespace fetchd {

/**
 * @brief Point-in-time copy of a download_state
 */
struct download_state_snapshot {
    file_id id = 0;
    std::string name;
    transfer_id transfer = 0;
    std::chrono::steady_clock::time_point start_time;
    double progress_percent = 0.0;
    uint64_t downloaded_bytes = 0;
    std::chrono::steady_clock::time_point last_progress;
};

/**
 * @brief Per-job progress record
 *
 * Owned by the executor for the lifetime of the job and updated by the
 * progress monitor. Every access goes through the internal mutex, which is
 * held only for the field update.
 */
class download_state {
public:
    explicit download_state(const download_job& job,
                            std::chrono::steady_clock::time_point start =
                                std::chrono::steady_clock::now());

    download_state(const download_state&) = delete;
    auto operator=(const download_state&) -> download_state& = delete;

    /**
     * @brief Record a parsed progress sample
     * @param percent Progress percentage reported by the downloader
     * @param downloaded_bytes Approximate bytes written so far
     * @param now Time the sample was read
     */
    void update_progress(double percent,
                         uint64_t downloaded_bytes,
                         std::chrono::steady_clock::time_point now);

    /**
     * @brief Reset progress for a new attempt
     */
    void restart(std::chrono::steady_clock::time_point now);

    [[nodiscard]] auto snapshot() const -> download_state_snapshot;

    [[nodiscard]] auto progress_percent() const -> double;

private:
    mutable std::mutex mutex_;
    download_state_snapshot state_;
};

}  // namespace fetchd

#endif  // FETCHD_MONITOR_DOWNLOAD_STATE_H
