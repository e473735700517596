/**
 * @file cancellation.h
 * @brief Cooperative cancellation source and token
 *
 * One cancellation_source is owned by the worker pool; every blocking wait in
 * the library (queue pop, subprocess supervision, retry backoff) observes a
 * cancellation_token obtained from it.
 */

#ifndef FETCHD_CORE_CANCELLATION_H
#define FETCHD_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace fetchd {

namespace detail {

/**
 * @brief Shared state between a source and its tokens
 */
struct cancellation_state {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    uint64_t next_callback_id = 1;
};

}  // namespace detail

/**
 * @brief Read-only view of a cancellation source
 *
 * Tokens are cheap to copy. A default-constructed token is never cancelled.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

    /**
     * @brief Block for at most @p timeout, returning early on cancellation
     * @return true if the token was cancelled (before or during the wait)
     */
    auto wait_for(std::chrono::milliseconds timeout) const -> bool;

    /**
     * @brief Register a callback invoked once when cancellation fires
     *
     * If the token is already cancelled the callback runs immediately on the
     * calling thread.
     *
     * @return Registration id usable with unregister_callback (0 if the
     *         callback already ran or the token has no source)
     */
    auto on_cancel(std::function<void()> callback) const -> uint64_t;

    void unregister_callback(uint64_t id) const;

private:
    friend class cancellation_source;

    explicit cancellation_token(std::shared_ptr<detail::cancellation_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancellation_state> state_;
};

/**
 * @brief Owner side of cancellation
 *
 * @code
 * cancellation_source source;
 * auto token = source.token();
 *
 * std::thread worker([token] {
 *     while (!token.wait_for(std::chrono::milliseconds(100))) {
 *         // periodic work
 *     }
 * });
 *
 * source.cancel();  // idempotent
 * worker.join();
 * @endcode
 */
class cancellation_source {
public:
    cancellation_source();

    cancellation_source(const cancellation_source&) = delete;
    auto operator=(const cancellation_source&) -> cancellation_source& = delete;

    [[nodiscard]] auto token() const -> cancellation_token;

    /**
     * @brief Fire cancellation, waking every waiter and running callbacks
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

private:
    std::shared_ptr<detail::cancellation_state> state_;
};

}  // namespace fetchd

#endif  // FETCHD_CORE_CANCELLATION_H
