/**
 * @file dashboard_snapshot.h
 * @brief Read-only summary of active transfers for status displays
 */

#ifndef FETCHD_REPORTING_DASHBOARD_SNAPSHOT_H
#define FETCHD_REPORTING_DASHBOARD_SNAPSHOT_H

#include <chrono>
#include <string>
#include <vector>

#include "fetchd/coordinator/transfer_context.h"

namespace fetchd {

class transfer_coordinator;

/**
 * @brief One active transfer as shown on a dashboard
 */
struct download_info {
    std::string name;
    double progress_percent = 0.0;
    double downloaded_mb = 0.0;
    double total_mb = 0.0;
    double speed_mbps = 0.0;
    std::string eta = "calculating...";
};

/**
 * @brief Summarise a single transfer
 *
 * Speed is downloaded MB over time since the transfer started. The ETA stays
 * "calculating..." until some bytes have been recorded.
 */
[[nodiscard]] auto summarize_transfer(const transfer_view& transfer,
                                      std::chrono::steady_clock::time_point now)
    -> download_info;

/**
 * @brief Collect every downloading transfer with a known total size
 */
[[nodiscard]] auto collect_active_downloads(const transfer_coordinator& coordinator,
                                            std::chrono::steady_clock::time_point now =
                                                std::chrono::steady_clock::now())
    -> std::vector<download_info>;

/**
 * @brief Render downloads as a JSON array
 *
 * Fields: name, progress_percent, downloaded_mb, total_mb, speed_mbps, eta.
 */
[[nodiscard]] auto to_json(const std::vector<download_info>& downloads) -> std::string;

}  // namespace fetchd

#endif  // FETCHD_REPORTING_DASHBOARD_SNAPSHOT_H
