/**
 * @file download_manager.h
 * @brief Facade owning the coordinator, executor and worker pool
 */

#ifndef FETCHD_DOWNLOAD_MANAGER_H
#define FETCHD_DOWNLOAD_MANAGER_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "core/retry_policy.h"
#include "core/transfer_types.h"
#include "core/types.h"
#include "execution/downloader_command.h"
#include "reporting/dashboard_snapshot.h"

namespace fetchd {

class file_hosting_client;
class process_launcher;
class transfer_coordinator;

/**
 * @brief Download manager configuration
 */
struct manager_config {
    std::filesystem::path target_directory;
    std::size_t worker_count = 4;
    std::chrono::milliseconds progress_interval{5000};
    downloader_options downloader;
    retry_config retry;
    std::chrono::milliseconds exit_poll_interval{100};
};

/**
 * @brief One file of a transfer, as passed to queue_transfer()
 */
struct transfer_file {
    file_id id = 0;
    std::string name;
};

/**
 * @brief Entry point for dispatching transfers
 *
 * @code
 * auto manager = download_manager::builder()
 *     .with_target_directory("/data/downloads")
 *     .with_worker_count(4)
 *     .with_hosting_client(hosting)
 *     .build();
 *
 * if (manager) {
 *     manager->start();
 *     manager->queue_transfer(42, "season-1", total_bytes,
 *                             {{1, "season-1/e01.mkv"}, {2, "season-1/e02.mkv"}});
 * }
 * @endcode
 */
class download_manager {
public:
    class builder {
    public:
        builder();

        /**
         * @brief Set the directory downloads are written into (required)
         */
        auto with_target_directory(std::filesystem::path dir) -> builder&;

        /**
         * @brief Set the number of concurrent downloads (default: 4, max 64)
         */
        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Set the minimum interval between progress log entries
         */
        auto with_progress_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Override the downloader executable (default: aria2c)
         */
        auto with_downloader_path(std::string executable) -> builder&;

        auto with_downloader_options(downloader_options options) -> builder&;

        auto with_retry(retry_config retry) -> builder&;

        /**
         * @brief Set the interval between subprocess exit checks
         */
        auto with_exit_poll_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Set the client resolving file ids to URLs (required)
         */
        auto with_hosting_client(std::shared_ptr<file_hosting_client> client) -> builder&;

        /**
         * @brief Replace the POSIX process launcher
         */
        auto with_process_launcher(std::shared_ptr<process_launcher> launcher) -> builder&;

        /**
         * @brief Validate the configuration and build the manager
         * @return The manager, or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<download_manager>;

    private:
        manager_config config_;
        std::shared_ptr<file_hosting_client> hosting_;
        std::shared_ptr<process_launcher> launcher_;
    };

    download_manager(download_manager&&) noexcept;
    auto operator=(download_manager&&) noexcept -> download_manager&;
    ~download_manager();

    download_manager(const download_manager&) = delete;
    auto operator=(const download_manager&) -> download_manager& = delete;

    auto start() -> result<void>;

    /**
     * @brief Cancel running downloads, drop queued jobs and join the workers
     */
    void stop();

    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Register a transfer and queue one job per file
     *
     * Files that are already queued or running are skipped.
     *
     * @return Number of jobs queued
     */
    auto queue_transfer(transfer_id id,
                        const std::string& name,
                        uint64_t total_size,
                        const std::vector<transfer_file>& files) -> result<std::size_t>;

    /**
     * @brief Queue a single job for an already registered transfer
     */
    auto enqueue(download_job job) -> result<void>;

    [[nodiscard]] auto coordinator() -> transfer_coordinator&;
    [[nodiscard]] auto coordinator() const -> const transfer_coordinator&;

    /**
     * @brief Snapshot of active transfers for status displays
     */
    [[nodiscard]] auto active_downloads() const -> std::vector<download_info>;

    [[nodiscard]] auto config() const -> const manager_config&;

private:
    download_manager(manager_config config,
                     std::shared_ptr<file_hosting_client> hosting,
                     std::shared_ptr<process_launcher> launcher);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace fetchd

#endif  // FETCHD_DOWNLOAD_MANAGER_H
