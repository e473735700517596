/**
 * @file downloader_command.h
 * @brief aria2c command line construction and exit status translation
 */

#ifndef FETCHD_EXECUTION_DOWNLOADER_COMMAND_H
#define FETCHD_EXECUTION_DOWNLOADER_COMMAND_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "fetchd/core/types.h"

namespace fetchd {

/**
 * @brief Fixed downloader settings
 *
 * Defaults give 16 connections per server split into 1 MiB segments, with
 * resume enabled and the periodic summary disabled.
 */
struct downloader_options {
    std::string executable = "aria2c";
    std::size_t connections_per_server = 16;
    std::size_t split = 16;
    std::string min_split_size = "1M";
    std::size_t max_tries = 5;
    std::chrono::seconds retry_wait{3};
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds timeout{60};
};

/**
 * @brief Build the argument vector for one download
 *
 * @param options Downloader settings
 * @param target_path Absolute or relative path of the output file
 * @param url Resolved download URL
 * @return argv, executable first
 */
[[nodiscard]] auto build_downloader_command(const downloader_options& options,
                                            const std::filesystem::path& target_path,
                                            const std::string& url)
    -> std::vector<std::string>;

/**
 * @brief Human readable description of an aria2c exit status
 */
[[nodiscard]] auto describe_downloader_exit(int status) -> std::string_view;

/**
 * @brief Error for a non-zero downloader exit status
 *
 * Status 127 maps to downloader_not_found and status 2 to io_timeout; every
 * other status maps to downloader_failed. The message embeds the status and
 * its description.
 */
[[nodiscard]] auto make_downloader_error(std::string_view executable, int status) -> error;

}  // namespace fetchd

#endif  // FETCHD_EXECUTION_DOWNLOADER_COMMAND_H
