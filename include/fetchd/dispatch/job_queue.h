/**
 * @file job_queue.h
 * @brief Closable FIFO of download jobs shared by the workers
 */

#ifndef FETCHD_DISPATCH_JOB_QUEUE_H
#define FETCHD_DISPATCH_JOB_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "fetchd/core/cancellation.h"
#include "fetchd/core/transfer_types.h"
#include "fetchd/core/types.h"

namespace fetchd {

/**
 * @brief Multi-producer multi-consumer job queue
 *
 * pop() blocks until a job is available, the queue is closed or the given
 * token is cancelled. Closing wakes every waiter; jobs still queued at that
 * point are handed back by close() so the caller can release them.
 * Cancellation leaves queued jobs in place.
 */
class job_queue {
public:
    job_queue() = default;

    job_queue(const job_queue&) = delete;
    auto operator=(const job_queue&) -> job_queue& = delete;

    /**
     * @brief Append a job
     * @return queue_closed error once the queue is closed
     */
    auto push(download_job job) -> result<void>;

    /**
     * @brief Wait for the next job
     * @return The job, or nullopt once the queue is closed or @p token fires
     */
    auto pop(const cancellation_token& token = {}) -> std::optional<download_job>;

    /**
     * @brief Close the queue and drain it
     * @return Jobs that were still queued
     */
    auto close() -> std::vector<download_job>;

    /**
     * @brief Reopen a closed queue for a new run
     */
    void reopen();

    [[nodiscard]] auto is_closed() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<download_job> jobs_;
    bool closed_ = false;
};

}  // namespace fetchd

#endif  // FETCHD_DISPATCH_JOB_QUEUE_H
