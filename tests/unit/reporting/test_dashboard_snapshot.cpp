/**
 * @file test_dashboard_snapshot.cpp
 * @brief Unit tests for dashboard summaries
 */

#include <gtest/gtest.h>

#include <fetchd/coordinator/transfer_coordinator.h>
#include <fetchd/core/logging.h>
#include <fetchd/reporting/dashboard_snapshot.h>

#include <chrono>

namespace fetchd::test {

using namespace std::chrono_literals;

namespace {

constexpr uint64_t mib = 1024 * 1024;

auto make_view(uint64_t downloaded, uint64_t total) -> transfer_view {
    transfer_view v;
    v.id = 1;
    v.name = "season-1";
    v.state = transfer_lifecycle::downloading;
    v.downloaded_size = downloaded;
    v.total_size = total;
    return v;
}

}  // namespace

class DashboardSnapshotTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        now_ = std::chrono::steady_clock::now();
    }

    void TearDown() override {
        get_logger().set_console_output(true);
    }

    std::chrono::steady_clock::time_point now_;
};

TEST_F(DashboardSnapshotTest, SpeedAndEta) {
    auto view = make_view(50 * mib, 100 * mib);
    view.start_time = now_ - 10s;

    auto info = summarize_transfer(view, now_);

    EXPECT_EQ(info.name, "season-1");
    EXPECT_DOUBLE_EQ(info.progress_percent, 50.0);
    EXPECT_DOUBLE_EQ(info.downloaded_mb, 50.0);
    EXPECT_DOUBLE_EQ(info.total_mb, 100.0);
    EXPECT_NEAR(info.speed_mbps, 5.0, 1e-9);
    EXPECT_EQ(info.eta, "10s");
}

TEST_F(DashboardSnapshotTest, LongEtaUsesMinutes) {
    auto view = make_view(10 * mib, 1000 * mib);
    view.start_time = now_ - 10s;

    auto info = summarize_transfer(view, now_);

    // 1 MB/s with 990 MB to go
    EXPECT_EQ(info.eta, "16m30s");
}

TEST_F(DashboardSnapshotTest, NothingDownloadedYet) {
    auto view = make_view(0, 100 * mib);
    view.start_time = now_ - 10s;

    auto info = summarize_transfer(view, now_);

    EXPECT_DOUBLE_EQ(info.speed_mbps, 0.0);
    EXPECT_EQ(info.eta, "calculating...");
}

TEST_F(DashboardSnapshotTest, NotStarted) {
    auto info = summarize_transfer(make_view(10 * mib, 100 * mib), now_);

    EXPECT_DOUBLE_EQ(info.speed_mbps, 0.0);
    EXPECT_EQ(info.eta, "calculating...");
}

TEST_F(DashboardSnapshotTest, CollectsOnlyDownloadingWithKnownTotal) {
    transfer_coordinator coordinator;
    coordinator.register_transfer(1, "downloading", 100, {1, 2});
    coordinator.register_transfer(2, "no total", 0, {1});
    coordinator.register_transfer(3, "pending", 100, {1});
    coordinator.register_transfer(4, "done", 100, {1});

    coordinator.mark_file_started(1, 1);
    coordinator.mark_file_started(2, 1);
    coordinator.mark_file_started(4, 1);
    coordinator.record_file_bytes(4, 1, 100);
    coordinator.handle_file_completion(4, 1);

    auto downloads = collect_active_downloads(coordinator);

    ASSERT_EQ(downloads.size(), 1u);
    EXPECT_EQ(downloads[0].name, "downloading");
}

TEST_F(DashboardSnapshotTest, JsonRendering) {
    download_info info;
    info.name = "a \"quoted\" name";
    info.progress_percent = 12.346;
    info.downloaded_mb = 1.5;
    info.total_mb = 12;
    info.speed_mbps = 0.25;
    info.eta = "42s";

    auto json = to_json({info});

    EXPECT_EQ(json,
              "[{\"name\":\"a \\\"quoted\\\" name\",\"progress_percent\":12.35,"
              "\"downloaded_mb\":1.50,\"total_mb\":12.00,\"speed_mbps\":0.25,"
              "\"eta\":\"42s\"}]");
    EXPECT_EQ(to_json({}), "[]");
}

}  // namespace fetchd::test
