/**
 * @file downloader_command.cpp
 * @brief aria2c command line construction
 */

#include "fetchd/execution/downloader_command.h"

namespace fetchd {

auto build_downloader_command(const downloader_options& options,
                              const std::filesystem::path& target_path,
                              const std::string& url)
    -> std::vector<std::string> {
    auto directory = target_path.parent_path();
    if (directory.empty()) {
        directory = ".";
    }

    return {
        options.executable,
        "-x", std::to_string(options.connections_per_server),
        "-s", std::to_string(options.split),
        "-k", options.min_split_size,
        "--max-tries=" + std::to_string(options.max_tries),
        "--retry-wait=" + std::to_string(options.retry_wait.count()),
        "--connect-timeout=" + std::to_string(options.connect_timeout.count()),
        "--timeout=" + std::to_string(options.timeout.count()),
        "--allow-overwrite=true",
        "--auto-file-renaming=false",
        "--continue=true",
        "--summary-interval=0",
        "--console-log-level=notice",
        "-d", directory.string(),
        "-o", target_path.filename().string(),
        url,
    };
}

auto describe_downloader_exit(int status) -> std::string_view {
    switch (status) {
        case 0: return "success";
        case 1: return "unknown error";
        case 2: return "i/o timeout";
        case 3: return "resource not found";
        case 4: return "too many resources not found";
        case 5: return "download speed too slow";
        case 6: return "network problem";
        case 7: return "unfinished downloads";
        case 8: return "remote server does not support resume";
        case 9: return "not enough disk space";
        case 13: return "file already exists";
        case 16: return "could not create file";
        case 17: return "file i/o error";
        case 18: return "could not create directory";
        case 19: return "name resolution failed";
        case 22: return "bad HTTP response header";
        case 23: return "too many redirects";
        case 24: return "HTTP authorization failed";
        case 28: return "bad option";
        case 29: return "server temporarily overloaded (503)";
        case 32: return "checksum validation failed";
        case 127: return "executable not found";
        default:
            if (status > 128) {
                return "terminated by signal";
            }
            return "unrecognised exit status";
    }
}

auto make_downloader_error(std::string_view executable, int status) -> error {
    error_code code = error_code::downloader_failed;
    if (status == 127) {
        code = error_code::downloader_not_found;
    } else if (status == 2) {
        code = error_code::io_timeout;
    }

    return error(code,
                 std::string(executable) + " failed: exit status " +
                     std::to_string(status) + " (" +
                     std::string(describe_downloader_exit(status)) + ")");
}

}  // namespace fetchd
