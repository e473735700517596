/**
 * @file progress_parser.h
 * @brief Parser for aria2c console progress lines
 *
 * aria2c prints one progress summary per interval, for example:
 *
 * @code
 * [#2089b0 SIZE:400.0KiB/33.2MiB(1%) CN:16 DL:115.7KiB ETA:4m51s]
 * [#2089b0 400.0KiB/33.2MiB(1%) CN:16 DL:115.7KiB ETA:4m51s]
 * [#2089b0 33.2MiB/33.2MiB(100%) CN:1 DL:1.2MiB]
 * @endcode
 *
 * Grammar accepted (whitespace separated, inside one pair of brackets):
 * - "#<gid>" where gid is hexadecimal
 * - optional "SIZE:" then "<done><unit>/<total><unit>(<P>%)"
 * - "CN:<connections>" (ignored)
 * - "DL:<speed><unit>"
 * - optional "ETA:<text>"
 *
 * Units are B, KiB, MiB and GiB. Percent and DL are required; a line missing
 * either is not a progress line.
 */

#ifndef FETCHD_MONITOR_PROGRESS_PARSER_H
#define FETCHD_MONITOR_PROGRESS_PARSER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fetchd {

/**
 * @brief Size unit used by aria2c
 */
enum class size_unit {
    bytes,
    kib,
    mib,
    gib,
};

/**
 * @brief Parse a unit suffix ("B", "KiB", "MiB", "GiB")
 */
[[nodiscard]] auto parse_size_unit(std::string_view text) -> std::optional<size_unit>;

/**
 * @brief Convert a value in the given unit to bytes
 */
[[nodiscard]] auto to_bytes(double value, size_unit unit) -> uint64_t;

/**
 * @brief Convert a rate in the given unit per second to MB/s (MiB based)
 */
[[nodiscard]] auto to_megabytes_per_second(double value, size_unit unit) -> double;

/**
 * @brief Values extracted from one progress line
 */
struct progress_sample {
    double percent = 0.0;
    double speed_mbps = 0.0;
    std::string eta;
    std::optional<uint64_t> downloaded_bytes;
    std::optional<uint64_t> total_bytes;
};

/**
 * @brief Parse one line of downloader output
 * @return The sample, or nullopt if the line is not a progress line
 */
[[nodiscard]] auto parse_progress_line(std::string_view line) -> std::optional<progress_sample>;

/**
 * @brief Check whether a non-progress line reports a problem
 *
 * True for lines containing "Exception", "error", "ERROR" or "failed".
 */
[[nodiscard]] auto contains_failure_marker(std::string_view line) -> bool;

}  // namespace fetchd

#endif  // FETCHD_MONITOR_PROGRESS_PARSER_H
