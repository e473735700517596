/**
 * @file retry_policy.h
 * @brief Bounded retry with linear backoff and injected error classifier
 */

#ifndef FETCHD_CORE_RETRY_POLICY_H
#define FETCHD_CORE_RETRY_POLICY_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>

#include "cancellation.h"
#include "logging.h"
#include "transient_classifier.h"
#include "types.h"

namespace fetchd {

/**
 * @brief Retry configuration
 *
 * The delay after attempt N is N * backoff_unit.
 */
struct retry_config {
    std::size_t max_attempts = 3;
    std::chrono::milliseconds backoff_unit{1000};
};

/**
 * @brief Runs an operation up to max_attempts times
 *
 * Each attempt returns result<T>. A successful attempt ends the loop. A
 * failed attempt is passed to the classifier: permanent errors are returned
 * immediately, transient ones are retried after a backoff that is
 * interrupted by cancellation.
 *
 * @code
 * retry_policy policy(retry_config{3, std::chrono::seconds(1)});
 * auto res = policy.execute(
 *     [&](std::size_t attempt) -> result<uint64_t> { return try_download(attempt); },
 *     token);
 * @endcode
 */
class retry_policy {
public:
    using classifier_fn = std::function<bool(const error&)>;
    using backoff_fn = std::function<std::chrono::milliseconds(std::size_t)>;

    explicit retry_policy(retry_config config = {},
                          classifier_fn classifier = is_transient)
        : config_(config), classifier_(std::move(classifier)) {}

    /**
     * @brief Replace the linear backoff schedule
     */
    auto with_backoff(backoff_fn backoff) -> retry_policy& {
        backoff_ = std::move(backoff);
        return *this;
    }

    [[nodiscard]] auto config() const -> const retry_config& { return config_; }

    /**
     * @brief Delay to wait after the given (1-based) failed attempt
     */
    [[nodiscard]] auto delay_for(std::size_t attempt) const -> std::chrono::milliseconds {
        if (backoff_) {
            return backoff_(attempt);
        }
        return config_.backoff_unit * static_cast<int64_t>(attempt);
    }

    /**
     * @brief Execute op(attempt) with retries
     *
     * @param op Callable taking the 1-based attempt number, returning result<T>
     * @param token Cancellation checked before each attempt and during backoff
     * @return The first successful result, a cancellation error, a permanent
     *         error tagged with its attempt, or retries_exhausted
     */
    template <typename Op>
    auto execute(Op&& op, const cancellation_token& token) const
        -> decltype(op(std::size_t{})) {
        using result_type = decltype(op(std::size_t{}));

        error last_error;
        for (std::size_t attempt = 1; attempt <= config_.max_attempts; ++attempt) {
            if (token.is_cancelled()) {
                return result_type(unexpected(error(error_code::download_cancelled)));
            }

            auto res = op(attempt);
            if (res.has_value()) {
                return res;
            }

            last_error = res.error();
            if (last_error.code == error_code::download_cancelled) {
                return res;
            }

            if (!classifier_ || !classifier_(last_error)) {
                return result_type(unexpected(error(
                    last_error.code,
                    "permanent error on attempt " + std::to_string(attempt) +
                        ": " + last_error.message)));
            }

            if (attempt == config_.max_attempts) {
                break;
            }

            auto delay = delay_for(attempt);
            FD_LOG_WARN(log_category::retry,
                        "Transient error on attempt " + std::to_string(attempt) +
                            ", retrying in " + std::to_string(delay.count()) +
                            "ms: " + last_error.message);

            if (token.wait_for(delay)) {
                return result_type(unexpected(error(error_code::download_cancelled)));
            }
        }

        return result_type(unexpected(error(
            error_code::retries_exhausted,
            "failed after " + std::to_string(config_.max_attempts) +
                " attempts, last error: " + last_error.message)));
    }

private:
    retry_config config_;
    classifier_fn classifier_;
    backoff_fn backoff_;
};

}  // namespace fetchd

#endif  // FETCHD_CORE_RETRY_POLICY_H
