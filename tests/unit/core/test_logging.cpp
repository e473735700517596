/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging
 */

#include <gtest/gtest.h>

#include <fetchd/core/logging.h>

#include <optional>
#include <regex>
#include <string>
#include <tuple>
#include <vector>

namespace fetchd::test {

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TransferLogContextTest, EmptyContextToJson) {
    transfer_log_context ctx;
    auto json = ctx.to_json();

    EXPECT_EQ(json, "{}");
}

TEST_F(TransferLogContextTest, BasicFieldsToJson) {
    transfer_log_context ctx;
    ctx.transfer_id = 42;
    ctx.file_id = 7;
    ctx.filename = "show/e01.mkv";
    ctx.file_size = 1024;

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"transfer_id\":42"), std::string::npos);
    EXPECT_NE(json.find("\"file_id\":7"), std::string::npos);
    EXPECT_NE(json.find("\"file_name\":\"show/e01.mkv\""), std::string::npos);
    EXPECT_NE(json.find("\"file_size\":1024"), std::string::npos);
}

TEST_F(TransferLogContextTest, AllFieldsToJson) {
    transfer_log_context ctx;
    ctx.transfer_id = 1;
    ctx.file_id = 2;
    ctx.filename = "data.bin";
    ctx.file_size = 1048576;
    ctx.transfer_downloaded = 524288;
    ctx.transfer_total = 2097152;
    ctx.progress_percent = 50.0;
    ctx.rate_mbps = 2.5;
    ctx.eta = "4m51s";
    ctx.attempt = 2;
    ctx.duration_ms = 1000;
    ctx.target_path = "/data/data.bin";
    ctx.error_message = "Test error";
    ctx.downloader_output = "Exception caught";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"transfer_downloaded\":524288"), std::string::npos);
    EXPECT_NE(json.find("\"transfer_total\":2097152"), std::string::npos);
    EXPECT_NE(json.find("\"progress_percent\":50.00"), std::string::npos);
    EXPECT_NE(json.find("\"speed_mbps\":2.50"), std::string::npos);
    EXPECT_NE(json.find("\"eta\":\"4m51s\""), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":1000"), std::string::npos);
    EXPECT_NE(json.find("\"target_path\":\"/data/data.bin\""), std::string::npos);
    EXPECT_NE(json.find("\"error\":\"Test error\""), std::string::npos);
    EXPECT_NE(json.find("\"downloader_output\":\"Exception caught\""), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonEscaping) {
    transfer_log_context ctx;
    ctx.filename = "quote\"and\\slash\n";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("quote\\\"and\\\\slash\\n"), std::string::npos);
}

// =============================================================================
// Log Level Tests
// =============================================================================

TEST(LogLevelTest, LogLevelToString) {
    EXPECT_EQ(to_string(log_level::trace), "TRACE");
    EXPECT_EQ(to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(to_string(log_level::info), "INFO");
    EXPECT_EQ(to_string(log_level::warn), "WARN");
    EXPECT_EQ(to_string(log_level::error), "ERROR");
    EXPECT_EQ(to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Logger Integration Tests
// =============================================================================

class FetchdLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().enable_json_output(false);
        get_logger().set_console_output(false);
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().enable_json_output(false);
        get_logger().set_level(log_level::info);
        get_logger().set_console_output(true);
    }
};

TEST_F(FetchdLoggerTest, JsonOutputToggle) {
    get_logger().enable_json_output(true);
    EXPECT_TRUE(get_logger().is_json_output_enabled());

    get_logger().enable_json_output(false);
    EXPECT_FALSE(get_logger().is_json_output_enabled());
}

TEST_F(FetchdLoggerTest, TextFormatAppendsContext) {
    transfer_log_context ctx;
    ctx.transfer_id = 3;

    auto line = get_logger().format(log_level::info, log_category::pool, "Worker started", &ctx);

    EXPECT_EQ(line, "[fetchd.pool] Worker started {\"transfer_id\":3}");
}

TEST_F(FetchdLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const transfer_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    FD_LOG_INFO(log_category::pool, "Test message");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::pool);
    EXPECT_EQ(std::get<2>(captured[0]), "Test message");
}

TEST_F(FetchdLoggerTest, CallbackReceivesContext) {
    std::optional<int64_t> seen_transfer;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const transfer_log_context* ctx) {
        if (ctx) seen_transfer = ctx->transfer_id;
    });

    transfer_log_context ctx;
    ctx.transfer_id = 77;
    FD_LOG_WARN_CTX(log_category::coordinator, "With context", ctx);

    EXPECT_EQ(seen_transfer, 77);
}

TEST_F(FetchdLoggerTest, JsonFormatMergesContextFields) {
    get_logger().enable_json_output(true);

    transfer_log_context ctx;
    ctx.transfer_id = 5;
    ctx.error_message = "said \"no\"";

    auto line = get_logger().format(log_level::warn, log_category::retry, "Retrying", &ctx);

    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find("\"level\":\"WARN\""), std::string::npos);
    EXPECT_NE(line.find("\"category\":\"fetchd.retry\""), std::string::npos);
    EXPECT_NE(line.find("\"message\":\"Retrying\""), std::string::npos);
    EXPECT_NE(line.find(",\"transfer_id\":5"), std::string::npos);
    EXPECT_NE(line.find("\"error\":\"said \\\"no\\\"\""), std::string::npos);

    // ISO 8601 format: YYYY-MM-DDTHH:MM:SS.mmmZ
    std::regex timestamp_regex(R"(\{"timestamp":"\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z",)");
    EXPECT_TRUE(std::regex_search(line, timestamp_regex));
}

TEST_F(FetchdLoggerTest, JsonFormatWithoutContext) {
    get_logger().enable_json_output(true);

    auto line = get_logger().format(log_level::info, log_category::manager, "JSON test");

    EXPECT_NE(line.find("\"message\":\"JSON test\"}"), std::string::npos);
}

TEST_F(FetchdLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view,
                                  std::string_view message, const transfer_log_context*) {
        captured.push_back(std::string(message));
    });

    get_logger().set_level(log_level::warn);

    FD_LOG_DEBUG(log_category::executor, "Debug message");
    FD_LOG_INFO(log_category::executor, "Info message");
    FD_LOG_WARN(log_category::executor, "Warn message");
    FD_LOG_ERROR(log_category::executor, "Error message");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "Warn message");
    EXPECT_EQ(captured[1], "Error message");
}

}  // namespace fetchd::test
