/**
 * @file dashboard_snapshot.cpp
 * @brief Active transfer summaries
 */

#include "fetchd/reporting/dashboard_snapshot.h"

#include <iomanip>
#include <sstream>

#include "fetchd/coordinator/transfer_coordinator.h"
#include "fetchd/core/logging.h"
#include "fetchd/core/transfer_types.h"

namespace fetchd {

namespace {

constexpr double bytes_per_mb = 1024.0 * 1024.0;

}  // namespace

auto summarize_transfer(const transfer_view& transfer,
                        std::chrono::steady_clock::time_point now) -> download_info {
    download_info info;
    info.name = transfer.name;
    info.downloaded_mb = static_cast<double>(transfer.downloaded_size) / bytes_per_mb;
    info.total_mb = static_cast<double>(transfer.total_size) / bytes_per_mb;
    info.progress_percent = transfer.progress_percent();

    if (transfer.start_time && transfer.downloaded_size > 0) {
        double elapsed = std::chrono::duration<double>(now - *transfer.start_time).count();
        if (elapsed > 0.0) {
            info.speed_mbps = info.downloaded_mb / elapsed;
            double remaining_mb = info.total_mb - info.downloaded_mb;
            if (info.speed_mbps > 0.0) {
                info.eta = format_duration(static_cast<int64_t>(remaining_mb / info.speed_mbps));
            }
        }
    }

    return info;
}

auto collect_active_downloads(const transfer_coordinator& coordinator,
                              std::chrono::steady_clock::time_point now)
    -> std::vector<download_info> {
    std::vector<download_info> downloads;
    coordinator.get_all_transfers([&](const transfer_view& transfer) {
        if (transfer.state == transfer_lifecycle::downloading && transfer.total_size > 0) {
            downloads.push_back(summarize_transfer(transfer, now));
        }
    });
    return downloads;
}

auto to_json(const std::vector<download_info>& downloads) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "[";

    bool first = true;
    for (const auto& d : downloads) {
        if (!first) oss << ",";
        first = false;

        oss << "{";
        oss << "\"name\":\"" << detail::escape_json_string(d.name) << "\"";
        oss << ",\"progress_percent\":" << d.progress_percent;
        oss << ",\"downloaded_mb\":" << d.downloaded_mb;
        oss << ",\"total_mb\":" << d.total_mb;
        oss << ",\"speed_mbps\":" << d.speed_mbps;
        oss << ",\"eta\":\"" << detail::escape_json_string(d.eta) << "\"";
        oss << "}";
    }

    oss << "]";
    return oss.str();
}

}  // namespace fetchd
