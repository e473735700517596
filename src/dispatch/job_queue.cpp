/**
 * @file job_queue.cpp
 * @brief Closable job queue
 */

#include "fetchd/dispatch/job_queue.h"

#include <iterator>

namespace fetchd {

auto job_queue::push(download_job job) -> result<void> {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return unexpected(error(error_code::queue_closed));
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return {};
}

auto job_queue::pop(const cancellation_token& token) -> std::optional<download_job> {
    // Registered before taking the lock: an already cancelled token runs it inline
    auto wake_id = token.on_cancel([this] {
        { std::lock_guard lock(mutex_); }
        cv_.notify_all();
    });

    std::optional<download_job> job;
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [&] { return closed_ || !jobs_.empty() || token.is_cancelled(); });

        if (!closed_ && !token.is_cancelled()) {
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
    }

    token.unregister_callback(wake_id);
    return job;
}

auto job_queue::close() -> std::vector<download_job> {
    std::vector<download_job> remaining;
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        remaining.assign(std::make_move_iterator(jobs_.begin()),
                         std::make_move_iterator(jobs_.end()));
        jobs_.clear();
    }
    cv_.notify_all();
    return remaining;
}

void job_queue::reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
}

auto job_queue::is_closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

auto job_queue::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

}  // namespace fetchd
