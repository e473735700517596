/**
 * @file fetchd.h
 * @brief Main header for the fetchd library
 * @version 0.1.0
 *
 * Include this header to access the download dispatch functionality.
 *
 * @code
 * #include <fetchd/fetchd.h>
 *
 * using namespace fetchd;
 *
 * auto manager = download_manager::builder()
 *     .with_target_directory("/data/downloads")
 *     .with_hosting_client(std::make_shared<my_hosting_client>())
 *     .build();
 *
 * manager->start();
 * manager->queue_transfer(42, "season-1", total_bytes, files);
 * @endcode
 */

#ifndef FETCHD_FETCHD_H
#define FETCHD_FETCHD_H

#include <cstdint>
#include <string>

// Core types
#include "fetchd/core/types.h"
#include "fetchd/core/transfer_types.h"
#include "fetchd/core/cancellation.h"
#include "fetchd/core/retry_policy.h"
#include "fetchd/core/logging.h"

// Coordinator
#include "fetchd/coordinator/transfer_coordinator.h"

// Execution
#include "fetchd/execution/download_executor.h"
#include "fetchd/execution/file_hosting_client.h"
#include "fetchd/execution/process_launcher.h"

// Dispatch
#include "fetchd/dispatch/worker_pool.h"

// Reporting
#include "fetchd/reporting/dashboard_snapshot.h"

// Facade
#include "fetchd/download_manager.h"

namespace fetchd {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace fetchd

#endif  // FETCHD_FETCHD_H
