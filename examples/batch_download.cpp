/**
 * @file batch_download.cpp
 * @brief Download a batch of URLs as one transfer with a status display
 *
 * This example demonstrates:
 * - Building a download_manager with a callback hosting client
 * - Queuing several files as a single transfer
 * - Polling the dashboard snapshot while workers run
 * - Stopping cleanly on Ctrl+C
 */

#include <fetchd/fetchd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace fetchd;

namespace {

std::atomic<bool> interrupted{false};

void on_signal(int) {
    interrupted = true;
}

/**
 * @brief Last path segment of a URL, used as the local file name
 */
auto file_name_from_url(const std::string& url, std::size_t index) -> std::string {
    auto query = url.find_first_of("?#");
    auto path = url.substr(0, query);
    auto slash = path.find_last_of('/');
    auto name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.empty() || path.find("://") + 2 == slash) {
        return "file-" + std::to_string(index);
    }
    return name;
}

void print_dashboard(const std::vector<download_info>& downloads) {
    for (const auto& d : downloads) {
        std::cout << std::fixed << std::setprecision(1)
                  << "  " << d.name << ": " << d.progress_percent << "% ("
                  << d.downloaded_mb << "/" << d.total_mb << " MB, "
                  << d.speed_mbps << " MB/s, ETA " << d.eta << ")" << std::endl;
    }
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Batch Download Example - fetchd" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <url> [url...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -d, --dir <path>        Target directory (default: ./downloads)" << std::endl;
    std::cout << "  -n, --name <name>       Transfer name (default: batch)" << std::endl;
    std::cout << "  -t, --total <bytes>     Total size of the batch, enables the dashboard" << std::endl;
    std::cout << "  -w, --workers <count>   Concurrent downloads (default: 4)" << std::endl;
    std::cout << "  --downloader <path>     aria2c executable (default: aria2c)" << std::endl;
    std::cout << "  --json                  Log as JSON lines" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string target_dir = "./downloads";
    std::string name = "batch";
    uint64_t total_size = 0;
    std::size_t workers = 4;
    std::string downloader = "aria2c";
    std::vector<std::string> urls;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&](const char* option) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << option << " requires an argument" << std::endl;
                std::exit(1);
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-d" || arg == "--dir") {
            target_dir = next("--dir");
        } else if (arg == "-n" || arg == "--name") {
            name = next("--name");
        } else if (arg == "-t" || arg == "--total") {
            total_size = std::stoull(next("--total"));
        } else if (arg == "-w" || arg == "--workers") {
            workers = static_cast<std::size_t>(std::stoul(next("--workers")));
        } else if (arg == "--downloader") {
            downloader = next("--downloader");
        } else if (arg == "--json") {
            get_logger().enable_json_output(true);
        } else if (arg[0] != '-') {
            urls.push_back(arg);
        }
    }

    if (urls.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    // File ids are indexes into the URL list
    std::map<file_id, std::string> url_by_id;
    std::vector<transfer_file> files;
    for (std::size_t i = 0; i < urls.size(); ++i) {
        auto id = static_cast<file_id>(i + 1);
        url_by_id[id] = urls[i];
        files.push_back(transfer_file{id, file_name_from_url(urls[i], i + 1)});
    }

    auto hosting = std::make_shared<callback_hosting_client>(
        [url_by_id](file_id id) -> result<std::string> {
            auto it = url_by_id.find(id);
            if (it == url_by_id.end()) {
                return unexpected(error(error_code::file_not_found_on_host,
                                        "no URL for file " + std::to_string(id)));
            }
            return it->second;
        });

    auto manager_result = download_manager::builder()
        .with_target_directory(target_dir)
        .with_worker_count(workers)
        .with_downloader_path(downloader)
        .with_hosting_client(hosting)
        .build();

    if (!manager_result.has_value()) {
        std::cerr << "Failed to create download manager: "
                  << manager_result.error().message << std::endl;
        return 1;
    }

    auto& manager = manager_result.value();

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto start_result = manager.start();
    if (!start_result) {
        std::cerr << "Failed to start: " << start_result.error().message << std::endl;
        return 1;
    }

    constexpr transfer_id batch_id = 1;
    auto queued = manager.queue_transfer(batch_id, name, total_size, files);
    if (!queued) {
        std::cerr << "Failed to queue transfer: " << queued.error().message << std::endl;
        return 1;
    }
    std::cout << "Queued " << queued.value() << " files into " << target_dir << std::endl;

    auto context = manager.coordinator().get_transfer_context(batch_id);
    auto last_report = std::chrono::steady_clock::now();

    while (!interrupted) {
        auto view = context->view();
        if (is_terminal(view.state) || view.pending_files() == 0) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_report >= std::chrono::seconds(5)) {
            print_dashboard(manager.active_downloads());
            last_report = now;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    manager.stop();

    auto view = context->view();
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Transfer: " << view.name << std::endl;
    std::cout << "State:    " << to_string(view.state) << std::endl;
    std::cout << "Files:    " << view.completed_files << " completed, "
              << view.failed_files << " failed, " << view.pending_files() << " pending"
              << std::endl;
    std::cout << "Bytes:    " << view.downloaded_size << std::endl;
    for (const auto& [id, reason] : view.failures) {
        std::cout << "  " << url_by_id[id] << ": " << reason << std::endl;
    }
    std::cout << "========================================" << std::endl;

    return view.failed_files == 0 && !interrupted ? 0 : 1;
}
