/**
 * @file download_manager.cpp
 * @brief Download manager facade implementation
 */

#include "fetchd/download_manager.h"

#include "fetchd/coordinator/transfer_coordinator.h"
#include "fetchd/core/logging.h"
#include "fetchd/dispatch/worker_pool.h"
#include "fetchd/execution/download_executor.h"
#include "fetchd/execution/file_hosting_client.h"
#include "fetchd/execution/process_launcher.h"

namespace fetchd {

namespace {

constexpr std::size_t max_workers = 64;

}  // namespace

struct download_manager::impl {
    manager_config config;
    transfer_coordinator coordinator;
    std::shared_ptr<download_executor> executor;
    std::unique_ptr<worker_pool> pool;

    impl(manager_config cfg,
         std::shared_ptr<file_hosting_client> hosting,
         std::shared_ptr<process_launcher> launcher)
        : config(std::move(cfg)) {
        executor_config exec;
        exec.target_directory = config.target_directory;
        exec.downloader = config.downloader;
        exec.retry = config.retry;
        exec.monitor.log_interval = config.progress_interval;
        exec.exit_poll_interval = config.exit_poll_interval;

        executor = std::make_shared<download_executor>(
            std::move(exec), std::move(hosting), std::move(launcher), coordinator);
        pool = std::make_unique<worker_pool>(
            worker_pool_config{config.worker_count}, executor, coordinator);
    }
};

// builder implementation
download_manager::builder::builder() = default;

auto download_manager::builder::with_target_directory(std::filesystem::path dir) -> builder& {
    config_.target_directory = std::move(dir);
    return *this;
}

auto download_manager::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto download_manager::builder::with_progress_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.progress_interval = interval;
    return *this;
}

auto download_manager::builder::with_downloader_path(std::string executable) -> builder& {
    config_.downloader.executable = std::move(executable);
    return *this;
}

auto download_manager::builder::with_downloader_options(downloader_options options)
    -> builder& {
    config_.downloader = std::move(options);
    return *this;
}

auto download_manager::builder::with_retry(retry_config retry) -> builder& {
    config_.retry = retry;
    return *this;
}

auto download_manager::builder::with_exit_poll_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.exit_poll_interval = interval;
    return *this;
}

auto download_manager::builder::with_hosting_client(std::shared_ptr<file_hosting_client> client)
    -> builder& {
    hosting_ = std::move(client);
    return *this;
}

auto download_manager::builder::with_process_launcher(std::shared_ptr<process_launcher> launcher)
    -> builder& {
    launcher_ = std::move(launcher);
    return *this;
}

auto download_manager::builder::build() -> result<download_manager> {
    if (config_.target_directory.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "Target directory must be set"}};
    }
    if (config_.worker_count < 1 || config_.worker_count > max_workers) {
        return unexpected{error{error_code::invalid_configuration,
                                "Worker count must be between 1 and 64"}};
    }
    if (config_.progress_interval.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Progress interval must be positive"}};
    }
    if (config_.retry.max_attempts < 1) {
        return unexpected{error{error_code::invalid_configuration,
                                "Retry policy needs at least one attempt"}};
    }
    if (config_.downloader.executable.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "Downloader executable must be set"}};
    }
    if (config_.exit_poll_interval.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Exit poll interval must be positive"}};
    }
    if (!hosting_) {
        return unexpected{error{error_code::invalid_configuration,
                                "Hosting client must be set"}};
    }

    auto launcher = launcher_ ? launcher_ : std::make_shared<posix_process_launcher>();
    return download_manager{std::move(config_), hosting_, std::move(launcher)};
}

// download_manager implementation
download_manager::download_manager(manager_config config,
                                   std::shared_ptr<file_hosting_client> hosting,
                                   std::shared_ptr<process_launcher> launcher)
    : impl_(std::make_unique<impl>(std::move(config), std::move(hosting), std::move(launcher))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

download_manager::download_manager(download_manager&&) noexcept = default;
auto download_manager::operator=(download_manager&&) noexcept -> download_manager& = default;

download_manager::~download_manager() {
    if (impl_) {
        impl_->pool->stop();
    }
}

auto download_manager::start() -> result<void> {
    auto res = impl_->pool->start();
    if (res) {
        FD_LOG_INFO(log_category::manager,
                    "Download manager started, writing to " +
                        impl_->config.target_directory.string());
    }
    return res;
}

void download_manager::stop() {
    impl_->pool->stop();
    FD_LOG_INFO(log_category::manager, "Download manager stopped");
}

auto download_manager::is_running() const -> bool {
    return impl_->pool->is_running();
}

auto download_manager::queue_transfer(transfer_id id,
                                      const std::string& name,
                                      uint64_t total_size,
                                      const std::vector<transfer_file>& files)
    -> result<std::size_t> {
    std::vector<file_id> ids;
    ids.reserve(files.size());
    for (const auto& file : files) {
        ids.push_back(file.id);
    }
    auto context = impl_->coordinator.register_transfer(id, name, total_size, ids);
    if (is_terminal(context->state())) {
        return unexpected(error(error_code::transfer_not_active,
                                "transfer " + std::to_string(id) + " is " +
                                    std::string(to_string(context->state()))));
    }

    std::size_t queued = 0;
    for (const auto& file : files) {
        auto res = impl_->pool->submit(download_job{file.id, file.name, id});
        if (res) {
            ++queued;
        } else if (res.error().code != error_code::file_already_active) {
            return unexpected(res.error());
        }
    }

    transfer_log_context ctx;
    ctx.transfer_id = id;
    ctx.filename = name;
    ctx.transfer_total = total_size;
    FD_LOG_INFO_CTX(log_category::manager,
                    "Queued " + std::to_string(queued) + " of " +
                        std::to_string(files.size()) + " files",
                    ctx);
    return queued;
}

auto download_manager::enqueue(download_job job) -> result<void> {
    if (!impl_->coordinator.get_transfer_context(job.transfer)) {
        return unexpected(error(error_code::transfer_not_found,
                                "transfer " + std::to_string(job.transfer) + " not found"));
    }
    auto res = impl_->coordinator.add_files(job.transfer, {job.id});
    if (!res) {
        return res;
    }
    return impl_->pool->submit(std::move(job));
}

auto download_manager::coordinator() -> transfer_coordinator& {
    return impl_->coordinator;
}

auto download_manager::coordinator() const -> const transfer_coordinator& {
    return impl_->coordinator;
}

auto download_manager::active_downloads() const -> std::vector<download_info> {
    return collect_active_downloads(impl_->coordinator);
}

auto download_manager::config() const -> const manager_config& {
    return impl_->config;
}

}  // namespace fetchd
