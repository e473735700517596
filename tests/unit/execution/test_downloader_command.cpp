/**
 * @file test_downloader_command.cpp
 * @brief Unit tests for aria2c command construction and exit codes
 */

#include <gtest/gtest.h>

#include <fetchd/core/transient_classifier.h>
#include <fetchd/execution/downloader_command.h>

#include <algorithm>
#include <string>
#include <vector>

namespace fetchd::test {

class DownloaderCommandTest : public ::testing::Test {};

TEST_F(DownloaderCommandTest, DefaultCommandLine) {
    downloader_options options;
    auto argv = build_downloader_command(options, "/data/show/e01.mkv",
                                         "https://cdn.example.com/e01");

    std::vector<std::string> expected = {
        "aria2c",
        "-x", "16",
        "-s", "16",
        "-k", "1M",
        "--max-tries=5",
        "--retry-wait=3",
        "--connect-timeout=30",
        "--timeout=60",
        "--allow-overwrite=true",
        "--auto-file-renaming=false",
        "--continue=true",
        "--summary-interval=0",
        "--console-log-level=notice",
        "-d", "/data/show",
        "-o", "e01.mkv",
        "https://cdn.example.com/e01",
    };
    EXPECT_EQ(argv, expected);
}

TEST_F(DownloaderCommandTest, CustomExecutableAndConnections) {
    downloader_options options;
    options.executable = "/usr/local/bin/aria2c";
    options.connections_per_server = 4;
    options.split = 8;

    auto argv = build_downloader_command(options, "out.bin", "http://x/y");

    EXPECT_EQ(argv.front(), "/usr/local/bin/aria2c");
    EXPECT_EQ(argv[2], "4");
    EXPECT_EQ(argv[4], "8");

    auto dir = std::find(argv.begin(), argv.end(), "-d");
    ASSERT_NE(dir, argv.end());
    EXPECT_EQ(*(dir + 1), ".");
    EXPECT_EQ(argv.back(), "http://x/y");
}

TEST_F(DownloaderCommandTest, ExitDescriptions) {
    EXPECT_EQ(describe_downloader_exit(2), "i/o timeout");
    EXPECT_EQ(describe_downloader_exit(3), "resource not found");
    EXPECT_EQ(describe_downloader_exit(6), "network problem");
    EXPECT_EQ(describe_downloader_exit(9), "not enough disk space");
    EXPECT_EQ(describe_downloader_exit(24), "HTTP authorization failed");
    EXPECT_EQ(describe_downloader_exit(127), "executable not found");
    EXPECT_EQ(describe_downloader_exit(143), "terminated by signal");
}

TEST_F(DownloaderCommandTest, TimeoutExitIsTransient) {
    auto err = make_downloader_error("aria2c", 2);

    EXPECT_EQ(err.code, error_code::io_timeout);
    EXPECT_EQ(err.message, "aria2c failed: exit status 2 (i/o timeout)");
    EXPECT_TRUE(is_transient(err));
}

TEST_F(DownloaderCommandTest, OverloadedServerExitIsTransient) {
    EXPECT_TRUE(is_transient(make_downloader_error("aria2c", 29)));
}

TEST_F(DownloaderCommandTest, NotFoundExitIsPermanent) {
    auto err = make_downloader_error("aria2c", 3);

    EXPECT_EQ(err.code, error_code::downloader_failed);
    EXPECT_FALSE(is_transient(err));
}

TEST_F(DownloaderCommandTest, MissingExecutable) {
    auto err = make_downloader_error("aria2c", 127);

    EXPECT_EQ(err.code, error_code::downloader_not_found);
    EXPECT_FALSE(is_transient(err));
}

}  // namespace fetchd::test
