/**
 * @file download_state.cpp
 * @brief Per-job progress record
 */

#include "fetchd/monitor/download_state.h"

namespace fetchd {

download_state::download_state(const download_job& job,
                               std::chrono::steady_clock::time_point start) {
    state_.id = job.id;
    state_.name = job.name;
    state_.transfer = job.transfer;
    state_.start_time = start;
    state_.last_progress = start;
}

void download_state::update_progress(double percent,
                                     uint64_t downloaded_bytes,
                                     std::chrono::steady_clock::time_point now) {
    std::lock_guard lock(mutex_);
    state_.progress_percent = percent;
    state_.downloaded_bytes = downloaded_bytes;
    state_.last_progress = now;
}

void download_state::restart(std::chrono::steady_clock::time_point now) {
    std::lock_guard lock(mutex_);
    state_.progress_percent = 0.0;
    state_.downloaded_bytes = 0;
    state_.start_time = now;
    state_.last_progress = now;
}

auto download_state::snapshot() const -> download_state_snapshot {
    std::lock_guard lock(mutex_);
    return state_;
}

auto download_state::progress_percent() const -> double {
    std::lock_guard lock(mutex_);
    return state_.progress_percent;
}

}  // namespace fetchd
