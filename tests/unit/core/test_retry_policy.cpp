/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for retry_policy
 */

#include <gtest/gtest.h>

#include <fetchd/core/retry_policy.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace fetchd::test {

using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
    }

    void TearDown() override {
        get_logger().set_console_output(true);
    }

    static auto fast_config(std::size_t attempts = 3) -> retry_config {
        return retry_config{attempts, 1ms};
    }

    cancellation_source source_;
};

TEST_F(RetryPolicyTest, LinearBackoffSchedule) {
    retry_policy policy(retry_config{3, 1000ms});

    EXPECT_EQ(policy.delay_for(1), 1000ms);
    EXPECT_EQ(policy.delay_for(2), 2000ms);
    EXPECT_EQ(policy.delay_for(3), 3000ms);
}

TEST_F(RetryPolicyTest, CustomBackoff) {
    retry_policy policy(fast_config());
    policy.with_backoff([](std::size_t attempt) {
        return std::chrono::milliseconds(attempt * attempt);
    });

    EXPECT_EQ(policy.delay_for(3), 9ms);
}

TEST_F(RetryPolicyTest, SucceedsFirstAttempt) {
    retry_policy policy(fast_config());
    int calls = 0;

    auto res = policy.execute(
        [&](std::size_t) -> result<int> {
            ++calls;
            return 42;
        },
        source_.token());

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 42);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, TwoTransientFailuresThenSuccess) {
    retry_policy policy(fast_config());
    std::vector<std::size_t> attempts;

    auto res = policy.execute(
        [&](std::size_t attempt) -> result<int> {
            attempts.push_back(attempt);
            if (attempt < 3) {
                return unexpected(error(error_code::io_timeout));
            }
            return 7;
        },
        source_.token());

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 7);
    EXPECT_EQ(attempts, (std::vector<std::size_t>{1, 2, 3}));
}

TEST_F(RetryPolicyTest, ThreeTransientFailuresExhaust) {
    retry_policy policy(fast_config());
    int calls = 0;

    auto res = policy.execute(
        [&](std::size_t) -> result<int> {
            ++calls;
            return unexpected(error(error_code::downloader_failed, "unexpected status 503"));
        },
        source_.token());

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(res.error().code, error_code::retries_exhausted);
    EXPECT_EQ(res.error().message,
              "failed after 3 attempts, last error: unexpected status 503");
}

TEST_F(RetryPolicyTest, PermanentErrorStopsImmediately) {
    retry_policy policy(fast_config());
    int calls = 0;

    auto res = policy.execute(
        [&](std::size_t) -> result<int> {
            ++calls;
            return unexpected(error(error_code::downloader_failed, "resource not found"));
        },
        source_.token());

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(res.error().code, error_code::downloader_failed);
    EXPECT_EQ(res.error().message, "permanent error on attempt 1: resource not found");
}

TEST_F(RetryPolicyTest, PermanentErrorOnLaterAttemptCarriesAttemptNumber) {
    retry_policy policy(fast_config());

    auto res = policy.execute(
        [&](std::size_t attempt) -> result<int> {
            if (attempt == 1) {
                return unexpected(error(error_code::connection_reset));
            }
            return unexpected(error(error_code::file_stat_failed, "missing"));
        },
        source_.token());

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().message, "permanent error on attempt 2: missing");
}

TEST_F(RetryPolicyTest, CancelledBeforeFirstAttempt) {
    retry_policy policy(fast_config());
    source_.cancel();
    int calls = 0;

    auto res = policy.execute(
        [&](std::size_t) -> result<int> {
            ++calls;
            return 1;
        },
        source_.token());

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::download_cancelled);
    EXPECT_EQ(calls, 0);
}

TEST_F(RetryPolicyTest, CancelledErrorBypassesRetry) {
    retry_policy policy(fast_config(), [](const error&) { return true; });
    int calls = 0;

    auto res = policy.execute(
        [&](std::size_t) -> result<int> {
            ++calls;
            return unexpected(error(error_code::download_cancelled, "download stopped"));
        },
        source_.token());

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::download_cancelled);
    EXPECT_EQ(res.error().message, "download stopped");
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, CancellationInterruptsBackoff) {
    retry_policy policy(retry_config{3, 10s});

    std::thread canceller([this] {
        std::this_thread::sleep_for(50ms);
        source_.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto res = policy.execute(
        [&](std::size_t) -> result<int> {
            return unexpected(error(error_code::connection_refused));
        },
        source_.token());
    auto elapsed = std::chrono::steady_clock::now() - start;

    canceller.join();

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error_code::download_cancelled);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(RetryPolicyTest, InjectedClassifier) {
    // Treat everything as permanent
    retry_policy policy(fast_config(), [](const error&) { return false; });
    int calls = 0;

    auto res = policy.execute(
        [&](std::size_t) -> result<int> {
            ++calls;
            return unexpected(error(error_code::io_timeout));
        },
        source_.token());

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, VoidOperation) {
    retry_policy policy(fast_config());
    int calls = 0;

    auto res = policy.execute(
        [&](std::size_t attempt) -> result<void> {
            ++calls;
            if (attempt == 1) {
                return unexpected(error(error_code::io_timeout));
            }
            return {};
        },
        source_.token());

    EXPECT_TRUE(res.has_value());
    EXPECT_EQ(calls, 2);
}

}  // namespace fetchd::test
