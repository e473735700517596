/**
 * @file test_doubles.h
 * @brief Scripted hosting client, process launcher and executor for unit tests
 */

#ifndef FETCHD_TESTS_UNIT_TEST_DOUBLES_H
#define FETCHD_TESTS_UNIT_TEST_DOUBLES_H

#include <fetchd/execution/download_executor.h>
#include <fetchd/execution/file_hosting_client.h>
#include <fetchd/execution/process_launcher.h>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fetchd::test {

/**
 * @brief Hosting client returning queued responses per file id
 *
 * When no response is queued it answers "https://files.test/<id>".
 */
class fake_hosting_client : public file_hosting_client {
public:
    void push_response(file_id id, result<std::string> response) {
        std::lock_guard lock(mutex_);
        responses_[id].push_back(std::move(response));
    }

    auto get_download_url(file_id id) -> result<std::string> override {
        std::lock_guard lock(mutex_);
        ++calls_;
        auto& queue = responses_[id];
        if (queue.empty()) {
            return "https://files.test/" + std::to_string(id);
        }
        auto response = std::move(queue.front());
        queue.pop_front();
        return response;
    }

    [[nodiscard]] auto calls() const -> int {
        std::lock_guard lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::map<file_id, std::deque<result<std::string>>> responses_;
    int calls_ = 0;
};

/**
 * @brief Behaviour of one scripted process
 */
struct process_script {
    std::string output;
    int exit_status = 0;
    /// Bytes written to the -d/-o target before the process "exits"
    std::optional<std::size_t> file_bytes;
    /// Never exits on its own; only terminate() ends it
    bool hang = false;
    /// Delay before the process reports its exit
    std::chrono::milliseconds run_time{0};
};

/**
 * @brief Process handle driven by a process_script
 */
class scripted_process : public process_handle {
public:
    scripted_process(int read_fd, process_script script, std::atomic<int>& terminations)
        : read_fd_(read_fd),
          script_(std::move(script)),
          started_(std::chrono::steady_clock::now()),
          terminations_(terminations) {}

    ~scripted_process() override {
        ::close(read_fd_);
    }

    [[nodiscard]] auto output_fd() const -> int override { return read_fd_; }

    auto try_wait() -> std::optional<int> override {
        if (status_) {
            return status_;
        }
        if (script_.hang) {
            return std::nullopt;
        }
        if (std::chrono::steady_clock::now() - started_ < script_.run_time) {
            return std::nullopt;
        }
        status_ = script_.exit_status;
        return status_;
    }

    void terminate() override {
        if (!status_) {
            status_ = 143;
            ++terminations_;
        }
    }

private:
    int read_fd_;
    process_script script_;
    std::chrono::steady_clock::time_point started_;
    std::atomic<int>& terminations_;
    std::optional<int> status_;
};

/**
 * @brief Launcher replaying scripts in order
 *
 * The last script repeats once the queue is exhausted.
 */
class scripted_launcher : public process_launcher {
public:
    void push(process_script script) {
        std::lock_guard lock(mutex_);
        scripts_.push_back(std::move(script));
    }

    void fail_next_launch(error err) {
        std::lock_guard lock(mutex_);
        launch_error_ = std::move(err);
    }

    auto launch(const std::vector<std::string>& argv)
        -> result<std::unique_ptr<process_handle>> override {
        process_script script;
        {
            std::lock_guard lock(mutex_);
            launches_.push_back(argv);
            target_existed_.push_back(std::filesystem::exists(target_of(argv)));

            if (launch_error_) {
                auto err = *launch_error_;
                launch_error_.reset();
                return unexpected(err);
            }

            if (!scripts_.empty()) {
                script = scripts_.front();
                if (scripts_.size() > 1) {
                    scripts_.pop_front();
                }
            }
        }

        if (script.file_bytes) {
            std::ofstream out(target_of(argv), std::ios::binary | std::ios::trunc);
            std::string data(*script.file_bytes, 'x');
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
        }

        int fds[2];
        if (::pipe(fds) != 0) {
            return unexpected(error(error_code::process_spawn_failed, "pipe failed"));
        }
        if (!script.output.empty()) {
            auto written = ::write(fds[1], script.output.data(), script.output.size());
            (void)written;
        }
        if (!script.hang) {
            ::close(fds[1]);
        } else {
            std::lock_guard lock(mutex_);
            open_write_ends_.push_back(fds[1]);
        }

        return std::unique_ptr<process_handle>(
            std::make_unique<scripted_process>(fds[0], std::move(script), terminations_));
    }

    ~scripted_launcher() override {
        for (int fd : open_write_ends_) {
            ::close(fd);
        }
    }

    [[nodiscard]] auto launch_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return launches_.size();
    }

    [[nodiscard]] auto launches() const -> std::vector<std::vector<std::string>> {
        std::lock_guard lock(mutex_);
        return launches_;
    }

    [[nodiscard]] auto target_existed_at_launch(std::size_t index) const -> bool {
        std::lock_guard lock(mutex_);
        return target_existed_.at(index);
    }

    [[nodiscard]] auto terminations() const -> int { return terminations_.load(); }

    static auto target_of(const std::vector<std::string>& argv) -> std::filesystem::path {
        std::filesystem::path dir;
        std::filesystem::path name;
        for (std::size_t i = 0; i + 1 < argv.size(); ++i) {
            if (argv[i] == "-d") dir = argv[i + 1];
            if (argv[i] == "-o") name = argv[i + 1];
        }
        return dir / name;
    }

private:
    mutable std::mutex mutex_;
    std::deque<process_script> scripts_;
    std::optional<error> launch_error_;
    std::vector<std::vector<std::string>> launches_;
    std::vector<bool> target_existed_;
    std::vector<int> open_write_ends_;
    std::atomic<int> terminations_{0};
};

/**
 * @brief Executor returning outcomes from a callable
 */
class fake_executor : public job_executor {
public:
    using handler = std::function<download_result(const download_job&, const cancellation_token&)>;

    explicit fake_executor(handler h) : handler_(std::move(h)) {}

    auto run(const download_job& job, const cancellation_token& token)
        -> download_result override {
        ++runs_;
        return handler_(job, token);
    }

    [[nodiscard]] auto runs() const -> int { return runs_.load(); }

    static auto success(uint64_t bytes = 0) -> download_result {
        download_result r;
        r.outcome = download_outcome::success;
        r.bytes = bytes;
        return r;
    }

    static auto failure(const std::string& message) -> download_result {
        download_result r;
        r.outcome = download_outcome::failed;
        r.error = error(error_code::downloader_failed, message);
        return r;
    }

    static auto cancelled() -> download_result {
        download_result r;
        r.outcome = download_outcome::cancelled;
        r.error = error(error_code::download_cancelled);
        return r;
    }

private:
    handler handler_;
    std::atomic<int> runs_{0};
};

}  // namespace fetchd::test

#endif  // FETCHD_TESTS_UNIT_TEST_DOUBLES_H
