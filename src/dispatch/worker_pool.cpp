/**
 * @file worker_pool.cpp
 * @brief Download worker pool implementation
 */

#include "fetchd/dispatch/worker_pool.h"

#include <exception>
#include <functional>
#include <thread>
#include <vector>

#include "fetchd/coordinator/transfer_coordinator.h"
#include "fetchd/core/logging.h"
#include "fetchd/execution/download_executor.h"

#if defined(BUILD_WITH_THREAD_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define FETCHD_USE_THREAD_SYSTEM 1
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace fetchd {

#ifdef FETCHD_USE_THREAD_SYSTEM

namespace {

/**
 * @brief thread_system job running one worker loop until the queue closes
 */
class worker_loop_job : public kcenon::thread::job {
public:
    explicit worker_loop_job(std::function<void()> body)
        : job("fetchd_download_worker"), body_(std::move(body)) {}

    [[nodiscard]] auto do_work() -> kcenon::common::VoidResult override {
        body_();
        return kcenon::common::ok();
    }

private:
    std::function<void()> body_;
};

}  // namespace

// One thread_worker per download worker, each occupied by a worker_loop_job
struct worker_pool::worker_threads {
    std::shared_ptr<kcenon::thread::thread_pool> pool;

    auto launch(std::size_t count, const std::function<void(std::size_t)>& body)
        -> result<void> {
        pool = std::make_shared<kcenon::thread::thread_pool>("fetchd_download_pool");
        for (std::size_t i = 0; i < count; ++i) {
            auto worker = std::make_unique<kcenon::thread::thread_worker>();
            worker->set_job_queue(pool->get_job_queue());
            pool->enqueue(std::move(worker));
        }

        auto started = pool->start();
        if (started.is_err()) {
            pool.reset();
            return unexpected(error(error_code::internal_error,
                                    "failed to start thread pool: " + started.error().message));
        }

        for (std::size_t i = 0; i < count; ++i) {
            auto queued = pool->enqueue(
                std::make_unique<worker_loop_job>([body, i] { body(i); }));
            if (queued.is_err()) {
                return unexpected(error(error_code::internal_error,
                                        "failed to queue worker: " + queued.error().message));
            }
        }
        return {};
    }

    // Caller closes the job queue first so every worker loop returns
    void join() {
        if (pool) {
            auto stopped = pool->stop(false);
            if (stopped.is_err()) {
                FD_LOG_WARN(log_category::pool,
                            "Thread pool stop reported: " + stopped.error().message);
            }
            pool.reset();
        }
    }
};

#else

struct worker_pool::worker_threads {
    std::vector<std::thread> threads;

    auto launch(std::size_t count, const std::function<void(std::size_t)>& body)
        -> result<void> {
        threads.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            threads.emplace_back([body, i] { body(i); });
        }
        return {};
    }

    void join() {
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads.clear();
    }
};

#endif

worker_pool::worker_pool(worker_pool_config config,
                         std::shared_ptr<job_executor> executor,
                         transfer_coordinator& coordinator)
    : config_(config),
      executor_(std::move(executor)),
      coordinator_(coordinator),
      cancellation_(std::make_unique<cancellation_source>()),
      threads_(std::make_unique<worker_threads>()) {}

worker_pool::~worker_pool() {
    stop();
}

auto worker_pool::start() -> result<void> {
    std::lock_guard lock(lifecycle_mutex_);
    if (running_.load()) {
        return unexpected(error(error_code::pool_already_running));
    }
    if (config_.worker_count == 0 || !executor_) {
        return unexpected(error(error_code::invalid_configuration,
                                "worker pool needs an executor and at least one worker"));
    }

    if (cancellation_->is_cancelled()) {
        cancellation_ = std::make_unique<cancellation_source>();
    }
    queue_.reopen();

    auto token = cancellation_->token();
    auto launched = threads_->launch(config_.worker_count,
                                     [this, token](std::size_t i) { worker_loop(i, token); });
    if (!launched) {
        // Workers already running leave through the token; queued jobs stay
        cancellation_->cancel();
        threads_->join();
        return launched;
    }
    running_ = true;

    FD_LOG_INFO(log_category::pool,
                "Started " + std::to_string(config_.worker_count) + " download workers");
    return {};
}

void worker_pool::stop() {
    std::lock_guard lock(lifecycle_mutex_);

    cancellation_->cancel();

    auto remaining = queue_.close();
    for (const auto& job : remaining) {
        active_.release(job.id);
    }
    discarded_ += remaining.size();

    threads_->join();

    bool was_running = running_.exchange(false);

    if (was_running) {
        FD_LOG_INFO(log_category::pool,
                    "Stopped download workers, discarded " +
                        std::to_string(remaining.size()) + " queued jobs");
    }
}

auto worker_pool::submit(download_job job) -> result<void> {
    auto id = job.id;
    if (!active_.try_acquire(id)) {
        transfer_log_context ctx;
        ctx.transfer_id = job.transfer;
        ctx.file_id = id;
        ctx.filename = job.name;
        FD_LOG_DEBUG_CTX(log_category::pool, "File already active, skipping", ctx);
        return unexpected(error(error_code::file_already_active,
                                "file " + std::to_string(id) + " is already active"));
    }

    auto pushed = queue_.push(std::move(job));
    if (!pushed) {
        active_.release(id);
        return pushed;
    }
    return {};
}

auto worker_pool::get_statistics() const -> worker_pool_statistics {
    worker_pool_statistics stats;
    stats.jobs_succeeded = succeeded_.load();
    stats.jobs_failed = failed_.load();
    stats.jobs_cancelled = cancelled_.load();
    stats.jobs_skipped = skipped_.load();
    stats.jobs_discarded = discarded_.load();
    return stats;
}

auto worker_pool::token() const -> cancellation_token {
    std::lock_guard lock(lifecycle_mutex_);
    return cancellation_->token();
}

void worker_pool::worker_loop(std::size_t index, cancellation_token token) {
    FD_LOG_DEBUG(log_category::pool, "Worker " + std::to_string(index) + " started");

    while (auto job = queue_.pop(token)) {
        if (token.is_cancelled()) {
            active_.release(job->id);
            ++discarded_;
            break;
        }
        process_job(*job, token);
    }

    FD_LOG_DEBUG(log_category::pool, "Worker " + std::to_string(index) + " stopped");
}

void worker_pool::process_job(const download_job& job, const cancellation_token& token) {
    transfer_log_context ctx;
    ctx.transfer_id = job.transfer;
    ctx.file_id = job.id;
    ctx.filename = job.name;

    auto started = coordinator_.mark_file_started(job.transfer, job.id);
    if (!started) {
        ctx.error_message = started.error().message;
        FD_LOG_WARN_CTX(log_category::pool, "Skipping job", ctx);
        active_.release(job.id);
        ++skipped_;
        return;
    }

    download_result res;
    try {
        res = executor_->run(job, token);
    } catch (const std::exception& e) {
        res.outcome = download_outcome::failed;
        res.error = error(error_code::internal_error,
                          std::string("executor threw: ") + e.what());
    }

    switch (res.outcome) {
        case download_outcome::success: {
            auto handled = coordinator_.handle_file_completion(job.transfer, job.id);
            if (!handled) {
                ctx.error_message = handled.error().message;
                FD_LOG_WARN_CTX(log_category::pool, "Completion not recorded", ctx);
            }
            active_.release(job.id);
            ++succeeded_;
            break;
        }
        case download_outcome::failed: {
            active_.release(job.id);
            auto handled = coordinator_.handle_file_failure(job.transfer, job.id,
                                                            res.error.message);
            if (!handled) {
                ctx.error_message = handled.error().message;
                FD_LOG_WARN_CTX(log_category::pool, "Failure not recorded", ctx);
            }
            ++failed_;
            break;
        }
        case download_outcome::cancelled:
            active_.release(job.id);
            ++cancelled_;
            break;
    }
}

}  // namespace fetchd
