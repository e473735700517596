/**
 * @file download_executor.cpp
 * @brief Download execution with the external downloader
 */

#include "fetchd/execution/download_executor.h"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

#include "fetchd/coordinator/transfer_coordinator.h"
#include "fetchd/core/logging.h"

namespace fs = std::filesystem;

namespace fetchd {

namespace {

constexpr auto minimum_elapsed = std::chrono::milliseconds(1);

auto job_context(const download_job& job) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.transfer_id = job.transfer;
    ctx.file_id = job.id;
    ctx.filename = job.name;
    return ctx;
}

}  // namespace

download_executor::download_executor(executor_config config,
                                     std::shared_ptr<file_hosting_client> hosting,
                                     std::shared_ptr<process_launcher> launcher,
                                     transfer_coordinator& coordinator)
    : config_(std::move(config)),
      hosting_(std::move(hosting)),
      launcher_(std::move(launcher)),
      coordinator_(coordinator),
      retry_(config_.retry) {}

auto download_executor::target_path_for(const download_job& job) const
    -> result<fs::path> {
    auto relative = fs::path(job.name).relative_path().lexically_normal();
    if (relative.empty() || relative == "." || !relative.has_filename() ||
        *relative.begin() == "..") {
        return unexpected(error(error_code::invalid_target_path,
                                "file name '" + job.name + "' does not stay under " +
                                    config_.target_directory.string()));
    }
    return config_.target_directory / relative;
}

auto download_executor::run(const download_job& job, const cancellation_token& token)
    -> download_result {
    auto start = std::chrono::steady_clock::now();
    download_state state(job, start);

    auto ctx = job_context(job);
    FD_LOG_INFO_CTX(log_category::executor, "Starting download", ctx);

    std::size_t attempts = 0;
    auto res = retry_.execute(
        [&](std::size_t attempt_number) -> result<uint64_t> {
            attempts = attempt_number;
            return attempt(job, state, attempt_number, token);
        },
        token);

    download_result outcome;
    outcome.attempts = attempts;
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    ctx.attempt = attempts;
    ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed.count());

    if (res) {
        outcome.outcome = download_outcome::success;
        outcome.bytes = res.value();

        auto recorded = coordinator_.record_file_bytes(job.transfer, job.id, outcome.bytes);
        if (!recorded) {
            ctx.error_message = recorded.error().message;
            FD_LOG_WARN_CTX(log_category::executor,
                            "Could not record file size on transfer", ctx);
            ctx.error_message.reset();
        }

        // Advisory only, used for logging
        auto elapsed = std::max(outcome.elapsed, minimum_elapsed);
        double seconds = std::chrono::duration<double>(elapsed).count();
        ctx.file_size = outcome.bytes;
        ctx.rate_mbps = (static_cast<double>(outcome.bytes) / 1024.0 / 1024.0) / seconds;
        if (auto target = target_path_for(job)) {
            ctx.target_path = target.value().string();
        }
        FD_LOG_INFO_CTX(log_category::executor, "Download completed", ctx);
        return outcome;
    }

    outcome.error = res.error();
    ctx.error_message = outcome.error.message;

    if (outcome.error.code == error_code::download_cancelled) {
        outcome.outcome = download_outcome::cancelled;
        FD_LOG_INFO_CTX(log_category::executor, "Download cancelled", ctx);
        return outcome;
    }

    outcome.outcome = download_outcome::failed;
    FD_LOG_ERROR_CTX(log_category::executor, "Download failed", ctx);
    return outcome;
}

auto download_executor::attempt(const download_job& job,
                                download_state& state,
                                std::size_t attempt_number,
                                const cancellation_token& token) -> result<uint64_t> {
    if (attempt_number > 1) {
        state.restart(std::chrono::steady_clock::now());
    }

    auto target_path = target_path_for(job);
    if (!target_path) {
        return unexpected(target_path.error());
    }

    auto url = hosting_->get_download_url(job.id);
    if (!url) {
        auto code = url.error().code == error_code::success ? error_code::url_resolution_failed
                                                            : url.error().code;
        return unexpected(error(code, "failed to get download URL: " + url.error().message));
    }

    auto target = prepare_target(target_path.value(), job);
    if (!target) {
        return unexpected(target.error());
    }

    auto argv = build_downloader_command(config_.downloader, target.value(), url.value());

    auto ctx = job_context(job);
    ctx.target_path = target.value().string();
    ctx.attempt = attempt_number;
    FD_LOG_INFO_CTX(log_category::executor,
                    "Starting download with " + config_.downloader.executable + " (" +
                        std::to_string(config_.downloader.connections_per_server) +
                        " connections)",
                    ctx);

    auto process = launcher_->launch(argv);
    if (!process) {
        return unexpected(process.error());
    }

    auto status = supervise(*process.value(), state, token);
    if (!status) {
        return unexpected(status.error());
    }

    if (status.value() != 0) {
        return unexpected(make_downloader_error(config_.downloader.executable, status.value()));
    }

    std::error_code ec;
    auto size = fs::file_size(target.value(), ec);
    if (ec) {
        return unexpected(error(error_code::file_stat_failed,
                                "failed to verify downloaded file: " + ec.message()));
    }

    return static_cast<uint64_t>(size);
}

auto download_executor::prepare_target(const fs::path& target, const download_job& job)
    -> result<fs::path> {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return unexpected(error(error_code::directory_create_failed,
                                "failed to create directory " +
                                    target.parent_path().string() + ": " + ec.message()));
    }

    // A file without an aria2 control file is a leftover from another tool
    auto control_file = fs::path(target.string() + ".aria2");
    if (fs::exists(target, ec) && !fs::exists(control_file, ec)) {
        auto ctx = job_context(job);
        ctx.target_path = target.string();
        FD_LOG_INFO_CTX(log_category::executor,
                        "Removing existing partial download from previous session", ctx);

        fs::remove(target, ec);
        if (ec) {
            ctx.error_message = ec.message();
            FD_LOG_WARN_CTX(log_category::executor,
                            "Failed to remove existing file, continuing anyway", ctx);
        }
    }

    return target;
}

auto download_executor::supervise(process_handle& process,
                                  download_state& state,
                                  const cancellation_token& token) -> result<int> {
    std::atomic<bool> done{false};
    progress_monitor monitor(state, config_.monitor);
    std::thread reader([&] { monitor.run(process.output_fd(), done, token); });

    std::optional<int> status;
    bool cancelled = false;
    while (true) {
        if (token.is_cancelled()) {
            process.terminate();
            cancelled = true;
            break;
        }

        status = process.try_wait();
        if (status) {
            break;
        }

        token.wait_for(config_.exit_poll_interval);
    }

    done.store(true, std::memory_order_release);
    reader.join();

    if (cancelled) {
        return unexpected(error(error_code::download_cancelled, "download stopped"));
    }
    return *status;
}

}  // namespace fetchd
