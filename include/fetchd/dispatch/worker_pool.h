/**
 * @file worker_pool.h
 * @brief Fixed-size pool of download workers
 */

#ifndef FETCHD_DISPATCH_WORKER_POOL_H
#define FETCHD_DISPATCH_WORKER_POOL_H

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>

#include "fetchd/core/cancellation.h"
#include "fetchd/core/transfer_types.h"
#include "fetchd/core/types.h"
#include "active_file_set.h"
#include "job_queue.h"

namespace fetchd {

class job_executor;
class transfer_coordinator;

/**
 * @brief Worker pool configuration
 */
struct worker_pool_config {
    std::size_t worker_count = 4;
};

/**
 * @brief Worker pool counters
 */
struct worker_pool_statistics {
    uint64_t jobs_succeeded = 0;
    uint64_t jobs_failed = 0;
    uint64_t jobs_cancelled = 0;
    uint64_t jobs_skipped = 0;     ///< transfer missing or no longer active
    uint64_t jobs_discarded = 0;   ///< still queued at shutdown
};

/**
 * @brief Runs queued download jobs on a fixed set of threads
 *
 * Per job a worker marks the file started on the coordinator, runs the
 * executor and reports the outcome:
 * - success: handle_file_completion, then release the file id
 * - failure: release the file id, then handle_file_failure
 * - cancelled: release the file id only
 *
 * A failing job never stops its worker.
 *
 * Workers run on kcenon thread_system when built with
 * BUILD_WITH_THREAD_SYSTEM and on std::thread otherwise.
 *
 * @code
 * worker_pool pool(worker_pool_config{4}, executor, coordinator);
 * pool.start();
 * pool.submit(download_job{7, "show/e01.mkv", 42});
 * ...
 * pool.stop();  // cancels in-flight downloads and discards queued jobs
 * @endcode
 */
class worker_pool {
public:
    worker_pool(worker_pool_config config,
                std::shared_ptr<job_executor> executor,
                transfer_coordinator& coordinator);

    ~worker_pool();

    worker_pool(const worker_pool&) = delete;
    auto operator=(const worker_pool&) -> worker_pool& = delete;

    /**
     * @brief Spawn the workers
     *
     * A stopped pool may be started again with a fresh cancellation source.
     */
    auto start() -> result<void>;

    /**
     * @brief Cancel in-flight jobs, discard queued ones and join the workers
     *
     * Idempotent.
     */
    void stop();

    /**
     * @brief Queue a job
     *
     * Jobs may be queued before start(). Fails with file_already_active if
     * the file id is queued or running, and with queue_closed after stop().
     */
    auto submit(download_job job) -> result<void>;

    [[nodiscard]] auto is_running() const noexcept -> bool { return running_.load(); }
    [[nodiscard]] auto worker_count() const noexcept -> std::size_t { return config_.worker_count; }
    [[nodiscard]] auto active_count() const -> std::size_t { return active_.size(); }
    [[nodiscard]] auto pending_jobs() const -> std::size_t { return queue_.size(); }
    [[nodiscard]] auto is_active(file_id id) const -> bool { return active_.contains(id); }
    [[nodiscard]] auto get_statistics() const -> worker_pool_statistics;

    /**
     * @brief Token observed by the running workers
     */
    [[nodiscard]] auto token() const -> cancellation_token;

private:
    struct worker_threads;

    void worker_loop(std::size_t index, cancellation_token token);
    void process_job(const download_job& job, const cancellation_token& token);

    worker_pool_config config_;
    std::shared_ptr<job_executor> executor_;
    transfer_coordinator& coordinator_;

    job_queue queue_;
    active_file_set active_;

    mutable std::mutex lifecycle_mutex_;
    std::unique_ptr<cancellation_source> cancellation_;
    std::unique_ptr<worker_threads> threads_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> discarded_{0};
};

}  // namespace fetchd

#endif  // FETCHD_DISPATCH_WORKER_POOL_H
