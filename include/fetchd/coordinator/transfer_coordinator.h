/**
 * @file transfer_coordinator.h
 * @brief Registry of transfers and the only writer of their state
 */

#ifndef FETCHD_COORDINATOR_TRANSFER_COORDINATOR_H
#define FETCHD_COORDINATOR_TRANSFER_COORDINATOR_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "fetchd/core/types.h"
#include "transfer_context.h"

namespace fetchd {

/**
 * @brief Owns every transfer_context and applies per-file outcomes
 *
 * Lock order: the registry lock is released before any context lock is
 * taken, so the two are never held together. Visitors passed to
 * get_all_transfers() run with no lock held.
 *
 * @code
 * transfer_coordinator coordinator;
 * coordinator.register_transfer(42, "season-1", 3 * 1024 * 1024, {1, 2, 3});
 *
 * coordinator.mark_file_started(42, 1);
 * coordinator.record_file_bytes(42, 1, 1024 * 1024);
 * coordinator.handle_file_completion(42, 1);
 *
 * coordinator.get_all_transfers([](const transfer_view& t) {
 *     std::cout << t.name << ": " << t.progress_percent() << "%\n";
 * });
 * @endcode
 */
class transfer_coordinator {
public:
    using visitor = std::function<void(const transfer_view&)>;

    transfer_coordinator() = default;

    transfer_coordinator(const transfer_coordinator&) = delete;
    auto operator=(const transfer_coordinator&) -> transfer_coordinator& = delete;

    /**
     * @brief Register a transfer
     *
     * Registering an id that already exists keeps its state; new file ids are
     * merged into its expected set and a previously unknown total is set.
     */
    auto register_transfer(transfer_id id,
                           const std::string& name,
                           uint64_t total_size,
                           const std::vector<file_id>& files = {})
        -> std::shared_ptr<const transfer_context>;

    /**
     * @brief Look up a transfer
     * @return The context, or nullptr if not registered
     */
    [[nodiscard]] auto get_transfer_context(transfer_id id) const
        -> std::shared_ptr<const transfer_context>;

    /**
     * @brief Visit a snapshot of every transfer, ordered by id
     */
    void get_all_transfers(const visitor& visit) const;

    /**
     * @brief Add files to a transfer that is not yet terminal
     *
     * Fails with transfer_not_active once the transfer is completed, failed
     * or cancelled.
     */
    auto add_files(transfer_id id, const std::vector<file_id>& files) -> result<void>;

    /**
     * @brief Fix the total size of a transfer
     *
     * Fails with total_size_fixed if a different non-zero total is already set.
     */
    auto set_total_size(transfer_id id, uint64_t total_size) -> result<void>;

    /**
     * @brief Note that a worker picked up a file of this transfer
     *
     * Moves the transfer from pending to downloading and stamps its start time.
     */
    auto mark_file_started(transfer_id id, file_id file) -> result<void>;

    /**
     * @brief Add a completed file's size to the transfer total
     *
     * Reporting the same file again has no effect. A sum exceeding the known
     * total is clamped and logged.
     */
    auto record_file_bytes(transfer_id id, file_id file, uint64_t bytes) -> result<void>;

    auto handle_file_completion(transfer_id id, file_id file) -> result<void>;

    /**
     * @brief Record a permanent failure of one file
     *
     * The transfer fails only when no file is left pending and none has
     * succeeded; otherwise it keeps downloading so the file can be re-queued.
     */
    auto handle_file_failure(transfer_id id, file_id file, const std::string& reason)
        -> result<void>;

    auto cancel_transfer(transfer_id id) -> result<void>;

    auto remove_transfer(transfer_id id) -> bool;

    /**
     * @brief Drop every transfer in a terminal state
     * @return Number of transfers removed
     */
    auto evict_terminal_transfers() -> std::size_t;

    [[nodiscard]] auto transfer_count() const -> std::size_t;

private:
    auto find(transfer_id id) const -> std::shared_ptr<transfer_context>;
    static auto not_found(transfer_id id) -> error;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<transfer_id, std::shared_ptr<transfer_context>> transfers_;
};

}  // namespace fetchd

#endif  // FETCHD_COORDINATOR_TRANSFER_COORDINATOR_H
