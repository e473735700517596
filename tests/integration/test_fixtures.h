/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef FETCHD_TESTS_INTEGRATION_TEST_FIXTURES_H
#define FETCHD_TESTS_INTEGRATION_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <fetchd/fetchd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace fetchd::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);

        test_dir_ = std::filesystem::temp_directory_path() /
                    ("fetchd_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        download_dir_ = test_dir_ / "downloads";
        std::filesystem::create_directories(download_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        get_logger().set_console_output(true);
    }

    /**
     * @brief Write an executable shell script into the test directory
     */
    auto create_script(const std::string& name, const std::string& body)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        {
            std::ofstream file(path);
            file << "#!/bin/sh\n" << body;
        }
        std::filesystem::permissions(path,
                                     std::filesystem::perms::owner_all |
                                         std::filesystem::perms::group_read |
                                         std::filesystem::perms::group_exec,
                                     std::filesystem::perm_options::replace);
        return path;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path download_dir_;
};

/**
 * @brief Hosting client mapping file ids to "https://files.test/<id>"
 */
class static_hosting_client : public file_hosting_client {
public:
    auto get_download_url(file_id id) -> result<std::string> override {
        return "https://files.test/" + std::to_string(id);
    }
};

/**
 * @brief Fixture running a download_manager against a fake downloader script
 *
 * The script understands the -d/-o arguments and the URL. A URL containing
 * "missing" exits 3, one containing "slow" sleeps, anything else writes
 * 4 KiB to the target after printing two progress lines.
 */
class ManagerFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        downloader_ = create_script("fake-aria2c", R"(dir=.
out=
url=
while [ $# -gt 0 ]; do
    case "$1" in
        -d) dir="$2"; shift 2 ;;
        -o) out="$2"; shift 2 ;;
        -x|-s|-k) shift 2 ;;
        --*) shift ;;
        *) url="$1"; shift ;;
    esac
done
case "$url" in
    *missing*) echo "Exception: errorCode=3 Resource not found"; exit 3 ;;
    *slow*) exec sleep 30 ;;
esac
printf '[#2089b0 SIZE:0B/4KiB(0%%) CN:16 DL:0B ETA:1s]\r'
printf '[#2089b0 SIZE:4KiB/4KiB(100%%) CN:16 DL:4KiB]\n'
head -c 4096 /dev/zero > "$dir/$out"
echo "[NOTICE] Download complete"
exit 0
)");
    }

    void TearDown() override {
        if (manager_) {
            manager_->stop();
        }
        manager_.reset();
        TempDirectoryFixture::TearDown();
    }

    void build_manager(std::shared_ptr<file_hosting_client> hosting,
                       std::size_t workers = 2) {
        auto built = download_manager::builder()
                         .with_target_directory(download_dir_)
                         .with_worker_count(workers)
                         .with_downloader_path(downloader_.string())
                         .with_retry(retry_config{3, std::chrono::milliseconds(1)})
                         .with_exit_poll_interval(std::chrono::milliseconds(10))
                         .with_hosting_client(std::move(hosting))
                         .build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        manager_ = std::make_unique<download_manager>(std::move(built.value()));
        ASSERT_TRUE(manager_->start());
    }

    auto wait_for_state(transfer_id id,
                        transfer_lifecycle state,
                        std::chrono::milliseconds timeout = std::chrono::seconds(10))
        -> bool {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto context = manager_->coordinator().get_transfer_context(id);
            if (context && context->state() == state) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

    std::filesystem::path downloader_;
    std::unique_ptr<download_manager> manager_;
};

}  // namespace fetchd::test

#endif  // FETCHD_TESTS_INTEGRATION_TEST_FIXTURES_H
