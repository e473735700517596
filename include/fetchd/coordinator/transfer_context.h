/**
 * @file transfer_context.h
 * @brief Aggregate state of one logical transfer
 *
 * A transfer groups several hosted files. Its state is mutated only through
 * transfer_coordinator; everyone else reads it through transfer_view
 * snapshots.
 */

#ifndef FETCHD_COORDINATOR_TRANSFER_CONTEXT_H
#define FETCHD_COORDINATOR_TRANSFER_CONTEXT_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "fetchd/core/transfer_types.h"
#include "fetchd/core/types.h"

namespace fetchd {

class transfer_coordinator;

/**
 * @brief Consistent copy of a transfer's state
 */
struct transfer_view {
    transfer_id id = 0;
    std::string name;
    transfer_lifecycle state = transfer_lifecycle::pending;
    uint64_t total_size = 0;
    uint64_t downloaded_size = 0;
    std::chrono::steady_clock::time_point registered_at;
    std::optional<std::chrono::steady_clock::time_point> start_time;
    std::size_t expected_files = 0;
    std::size_t completed_files = 0;
    std::size_t failed_files = 0;
    std::map<file_id, std::string> failures;

    [[nodiscard]] auto pending_files() const noexcept -> std::size_t {
        auto done = completed_files + failed_files;
        return expected_files > done ? expected_files - done : 0;
    }

    [[nodiscard]] auto progress_percent() const noexcept -> double {
        if (total_size == 0) {
            return 0.0;
        }
        return static_cast<double>(downloaded_size) * 100.0 /
               static_cast<double>(total_size);
    }
};

/**
 * @brief Result of recording a file's byte count
 */
struct byte_record {
    bool accepted = false;   ///< false if the file was already counted
    bool clamped = false;    ///< true if the sum had to be capped at total_size
    uint64_t downloaded_size = 0;
    uint64_t total_size = 0;
};

/**
 * @brief Per-transfer state guarded by a reader/writer lock
 *
 * Invariants:
 * - 0 <= downloaded_size <= total_size once total_size is known
 * - total_size never changes once non-zero
 * - each file contributes its bytes at most once
 * - completed, failed and cancelled are final
 * - completed requires every expected file done and, when total_size is
 *   known, downloaded_size == total_size
 */
class transfer_context {
public:
    transfer_context(transfer_id id,
                     std::string name,
                     uint64_t total_size,
                     std::chrono::steady_clock::time_point registered_at =
                         std::chrono::steady_clock::now());

    transfer_context(const transfer_context&) = delete;
    auto operator=(const transfer_context&) -> transfer_context& = delete;

    [[nodiscard]] auto id() const noexcept -> transfer_id { return id_; }
    [[nodiscard]] auto name() const -> const std::string& { return name_; }

    [[nodiscard]] auto view() const -> transfer_view;
    [[nodiscard]] auto state() const -> transfer_lifecycle;
    [[nodiscard]] auto total_size() const -> uint64_t;
    [[nodiscard]] auto downloaded_size() const -> uint64_t;
    [[nodiscard]] auto is_expected(file_id file) const -> bool;

private:
    friend class transfer_coordinator;

    auto add_files(const std::vector<file_id>& files) -> result<std::size_t>;
    auto set_total_size(uint64_t size) -> result<void>;
    auto mark_file_started(file_id file, std::chrono::steady_clock::time_point now) -> bool;
    auto record_file_bytes(file_id file, uint64_t bytes) -> byte_record;
    auto complete_file(file_id file) -> transfer_lifecycle;
    auto fail_file(file_id file, const std::string& reason) -> transfer_lifecycle;
    auto cancel() -> bool;

    // Caller holds the unique lock
    void evaluate_state_locked();

    const transfer_id id_;
    const std::string name_;

    mutable std::shared_mutex mutex_;
    transfer_lifecycle state_ = transfer_lifecycle::pending;
    uint64_t total_size_;
    uint64_t downloaded_size_ = 0;
    std::chrono::steady_clock::time_point registered_at_;
    std::optional<std::chrono::steady_clock::time_point> start_time_;
    std::set<file_id> expected_;
    std::set<file_id> completed_;
    std::map<file_id, std::string> failed_;
    std::map<file_id, uint64_t> file_bytes_;
};

}  // namespace fetchd

#endif  // FETCHD_COORDINATOR_TRANSFER_CONTEXT_H
