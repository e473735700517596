/**
 * @file transfer_types.h
 * @brief Download job, transfer lifecycle and result structures
 *
 * This file defines the work items handed to the worker pool, the lifecycle
 * of a logical transfer, and the outcome reported by the executor.
 */

#ifndef FETCHD_CORE_TRANSFER_TYPES_H
#define FETCHD_CORE_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "types.h"

namespace fetchd {

/**
 * @brief One file to download, belonging to a transfer
 */
struct download_job {
    file_id id = 0;
    std::string name;
    transfer_id transfer = 0;
};

/**
 * @brief Transfer lifecycle
 *
 * pending -> downloading -> {completed | failed | cancelled}
 */
enum class transfer_lifecycle {
    pending,      // Registered, no file started yet
    downloading,  // At least one file started
    completed,    // Every expected file succeeded
    failed,       // Nothing left that could still succeed
    cancelled,    // Cancelled by the caller
};

[[nodiscard]] constexpr auto to_string(transfer_lifecycle state) noexcept
    -> std::string_view {
    switch (state) {
        case transfer_lifecycle::pending:
            return "pending";
        case transfer_lifecycle::downloading:
            return "downloading";
        case transfer_lifecycle::completed:
            return "completed";
        case transfer_lifecycle::failed:
            return "failed";
        case transfer_lifecycle::cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

/**
 * @brief Check if a lifecycle state is terminal
 */
[[nodiscard]] constexpr auto is_terminal(transfer_lifecycle state) noexcept -> bool {
    return state == transfer_lifecycle::completed ||
           state == transfer_lifecycle::failed ||
           state == transfer_lifecycle::cancelled;
}

/**
 * @brief Outcome of running one download job
 */
enum class download_outcome {
    success,
    failed,
    cancelled,
};

[[nodiscard]] constexpr auto to_string(download_outcome outcome) noexcept
    -> std::string_view {
    switch (outcome) {
        case download_outcome::success:
            return "success";
        case download_outcome::failed:
            return "failed";
        case download_outcome::cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

/**
 * @brief Result of running one download job
 */
struct download_result {
    download_outcome outcome = download_outcome::failed;
    struct error error;
    uint64_t bytes = 0;
    std::chrono::milliseconds elapsed{0};
    std::size_t attempts = 0;

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return outcome == download_outcome::success;
    }
};

/**
 * @brief Format a duration in seconds for display
 *
 * Negative values yield "unknown". Otherwise "<h>h<m>m" when hours are
 * present, "<m>m<s>s" when minutes are present, else "<s>s".
 */
[[nodiscard]] auto format_duration(int64_t seconds) -> std::string;

}  // namespace fetchd

#endif  // FETCHD_CORE_TRANSFER_TYPES_H
