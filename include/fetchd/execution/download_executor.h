/**
 * @file download_executor.h
 * @brief Runs one download job through the external downloader
 */

#ifndef FETCHD_EXECUTION_DOWNLOAD_EXECUTOR_H
#define FETCHD_EXECUTION_DOWNLOAD_EXECUTOR_H

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "fetchd/core/cancellation.h"
#include "fetchd/core/retry_policy.h"
#include "fetchd/core/transfer_types.h"
#include "fetchd/core/types.h"
#include "fetchd/monitor/download_state.h"
#include "fetchd/monitor/progress_monitor.h"
#include "downloader_command.h"
#include "file_hosting_client.h"
#include "process_launcher.h"

namespace fetchd {

class transfer_coordinator;

/**
 * @brief Anything that can run a download job to an outcome
 *
 * Implementations report failures through download_result and never throw
 * for expected download errors.
 */
class job_executor {
public:
    virtual ~job_executor() = default;

    virtual auto run(const download_job& job, const cancellation_token& token)
        -> download_result = 0;
};

/**
 * @brief Download executor configuration
 */
struct executor_config {
    std::filesystem::path target_directory;
    downloader_options downloader;
    retry_config retry;
    progress_monitor_config monitor;
    /// Interval between subprocess exit checks
    std::chrono::milliseconds exit_poll_interval{100};
};

/**
 * @brief Downloads a hosted file with aria2c, with retries
 *
 * Each attempt resolves a fresh URL, prepares the target path, launches the
 * downloader and supervises it while a progress_monitor consumes its output
 * on a separate thread. Cancellation terminates the subprocess and bypasses
 * retry. On success the file size is reported to the coordinator once.
 *
 * @code
 * executor_config config;
 * config.target_directory = "/data/downloads";
 *
 * auto executor = std::make_shared<download_executor>(
 *     config, hosting_client, std::make_shared<posix_process_launcher>(), coordinator);
 *
 * auto result = executor->run(download_job{7, "show/e01.mkv", 42}, token);
 * @endcode
 */
class download_executor : public job_executor {
public:
    download_executor(executor_config config,
                      std::shared_ptr<file_hosting_client> hosting,
                      std::shared_ptr<process_launcher> launcher,
                      transfer_coordinator& coordinator);

    auto run(const download_job& job, const cancellation_token& token)
        -> download_result override;

    [[nodiscard]] auto config() const -> const executor_config& { return config_; }

    /**
     * @brief Target path of a job inside the target directory
     *
     * A leading root in the job name is dropped and the name is normalised.
     * Names that still leave the target directory, or that name no file,
     * fail with invalid_target_path.
     */
    [[nodiscard]] auto target_path_for(const download_job& job) const
        -> result<std::filesystem::path>;

private:
    auto attempt(const download_job& job,
                 download_state& state,
                 std::size_t attempt_number,
                 const cancellation_token& token) -> result<uint64_t>;

    auto prepare_target(const std::filesystem::path& target, const download_job& job)
        -> result<std::filesystem::path>;

    auto supervise(process_handle& process,
                   download_state& state,
                   const cancellation_token& token) -> result<int>;

    executor_config config_;
    std::shared_ptr<file_hosting_client> hosting_;
    std::shared_ptr<process_launcher> launcher_;
    transfer_coordinator& coordinator_;
    retry_policy retry_;
};

}  // namespace fetchd

#endif  // FETCHD_EXECUTION_DOWNLOAD_EXECUTOR_H
