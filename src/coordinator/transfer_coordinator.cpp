/**
 * @file transfer_coordinator.cpp
 * @brief Transfer registry and outcome aggregation
 */

#include "fetchd/coordinator/transfer_coordinator.h"

#include <algorithm>
#include <mutex>

#include "fetchd/core/logging.h"

namespace fetchd {

auto transfer_coordinator::register_transfer(transfer_id id,
                                             const std::string& name,
                                             uint64_t total_size,
                                             const std::vector<file_id>& files)
    -> std::shared_ptr<const transfer_context> {
    std::shared_ptr<transfer_context> context;
    bool created = false;
    {
        std::unique_lock lock(registry_mutex_);
        auto it = transfers_.find(id);
        if (it == transfers_.end()) {
            context = std::make_shared<transfer_context>(id, name, total_size);
            transfers_.emplace(id, context);
            created = true;
        } else {
            context = it->second;
        }
    }

    auto added = context->add_files(files);
    if (!added) {
        FD_LOG_WARN(log_category::coordinator, added.error().message);
    }

    if (created) {
        transfer_log_context ctx;
        ctx.transfer_id = id;
        ctx.filename = name;
        ctx.transfer_total = total_size;
        FD_LOG_INFO_CTX(log_category::coordinator, "Transfer registered", ctx);
    } else if (total_size != 0 && context->total_size() == 0) {
        // A concurrent registration may have fixed the total first
        auto res = context->set_total_size(total_size);
        if (!res) {
            FD_LOG_DEBUG(log_category::coordinator, res.error().message);
        }
    }

    return context;
}

auto transfer_coordinator::get_transfer_context(transfer_id id) const
    -> std::shared_ptr<const transfer_context> {
    return find(id);
}

void transfer_coordinator::get_all_transfers(const visitor& visit) const {
    std::vector<std::shared_ptr<transfer_context>> contexts;
    {
        std::shared_lock lock(registry_mutex_);
        contexts.reserve(transfers_.size());
        for (const auto& [id, context] : transfers_) {
            contexts.push_back(context);
        }
    }

    std::sort(contexts.begin(), contexts.end(),
              [](const auto& a, const auto& b) { return a->id() < b->id(); });

    for (const auto& context : contexts) {
        auto snapshot = context->view();
        visit(snapshot);
    }
}

auto transfer_coordinator::add_files(transfer_id id, const std::vector<file_id>& files)
    -> result<void> {
    auto context = find(id);
    if (!context) {
        return unexpected(not_found(id));
    }
    auto added = context->add_files(files);
    if (!added) {
        return unexpected(added.error());
    }
    return {};
}

auto transfer_coordinator::set_total_size(transfer_id id, uint64_t total_size)
    -> result<void> {
    auto context = find(id);
    if (!context) {
        return unexpected(not_found(id));
    }
    return context->set_total_size(total_size);
}

auto transfer_coordinator::mark_file_started(transfer_id id, file_id file) -> result<void> {
    auto context = find(id);
    if (!context) {
        return unexpected(not_found(id));
    }

    if (is_terminal(context->state())) {
        return unexpected(error(error_code::transfer_not_active,
                                "transfer " + std::to_string(id) + " is " +
                                    std::string(to_string(context->state()))));
    }

    if (context->mark_file_started(file, std::chrono::steady_clock::now())) {
        transfer_log_context ctx;
        ctx.transfer_id = id;
        ctx.file_id = file;
        ctx.filename = context->name();
        FD_LOG_DEBUG_CTX(log_category::coordinator, "Transfer started downloading", ctx);
    }
    return {};
}

auto transfer_coordinator::record_file_bytes(transfer_id id, file_id file, uint64_t bytes)
    -> result<void> {
    auto context = find(id);
    if (!context) {
        return unexpected(not_found(id));
    }

    auto record = context->record_file_bytes(file, bytes);

    transfer_log_context ctx;
    ctx.transfer_id = id;
    ctx.file_id = file;
    ctx.file_size = bytes;
    ctx.transfer_downloaded = record.downloaded_size;
    ctx.transfer_total = record.total_size;

    if (!record.accepted) {
        FD_LOG_DEBUG_CTX(log_category::coordinator,
                         "File bytes already recorded, ignoring", ctx);
    } else if (record.clamped) {
        FD_LOG_WARN_CTX(log_category::coordinator,
                        "Downloaded bytes exceed transfer total, clamped", ctx);
    } else {
        FD_LOG_DEBUG_CTX(log_category::coordinator,
                         "Updated transfer with completed file size", ctx);
    }
    return {};
}

auto transfer_coordinator::handle_file_completion(transfer_id id, file_id file)
    -> result<void> {
    auto context = find(id);
    if (!context) {
        FD_LOG_WARN(log_category::coordinator,
                    "Completion for unknown transfer " + std::to_string(id));
        return unexpected(not_found(id));
    }

    auto before = context->state();
    auto after = context->complete_file(file);

    if (after == transfer_lifecycle::completed && before != after) {
        auto snapshot = context->view();
        transfer_log_context ctx;
        ctx.transfer_id = id;
        ctx.filename = snapshot.name;
        ctx.transfer_downloaded = snapshot.downloaded_size;
        ctx.transfer_total = snapshot.total_size;
        if (snapshot.start_time) {
            ctx.duration_ms = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - *snapshot.start_time)
                    .count());
        }
        FD_LOG_INFO_CTX(log_category::coordinator, "Transfer completed", ctx);
    }
    return {};
}

auto transfer_coordinator::handle_file_failure(transfer_id id,
                                               file_id file,
                                               const std::string& reason)
    -> result<void> {
    auto context = find(id);
    if (!context) {
        FD_LOG_WARN(log_category::coordinator,
                    "Failure for unknown transfer " + std::to_string(id));
        return unexpected(not_found(id));
    }

    auto before = context->state();
    auto after = context->fail_file(file, reason);

    transfer_log_context ctx;
    ctx.transfer_id = id;
    ctx.file_id = file;
    ctx.filename = context->name();
    ctx.error_message = reason;

    if (after == transfer_lifecycle::failed && before != after) {
        FD_LOG_ERROR_CTX(log_category::coordinator,
                         "Transfer failed, no file could be downloaded", ctx);
    } else {
        FD_LOG_WARN_CTX(log_category::coordinator, "File failed permanently", ctx);
    }
    return {};
}

auto transfer_coordinator::cancel_transfer(transfer_id id) -> result<void> {
    auto context = find(id);
    if (!context) {
        return unexpected(not_found(id));
    }

    if (!context->cancel()) {
        return unexpected(error(error_code::transfer_not_active,
                                "transfer " + std::to_string(id) + " already " +
                                    std::string(to_string(context->state()))));
    }

    FD_LOG_INFO(log_category::coordinator, "Transfer " + std::to_string(id) + " cancelled");
    return {};
}

auto transfer_coordinator::remove_transfer(transfer_id id) -> bool {
    std::unique_lock lock(registry_mutex_);
    return transfers_.erase(id) > 0;
}

auto transfer_coordinator::evict_terminal_transfers() -> std::size_t {
    std::vector<std::shared_ptr<transfer_context>> contexts;
    {
        std::shared_lock lock(registry_mutex_);
        for (const auto& [id, context] : transfers_) {
            contexts.push_back(context);
        }
    }

    std::vector<transfer_id> terminal;
    for (const auto& context : contexts) {
        if (is_terminal(context->state())) {
            terminal.push_back(context->id());
        }
    }

    std::size_t removed = 0;
    {
        std::unique_lock lock(registry_mutex_);
        for (auto id : terminal) {
            removed += transfers_.erase(id);
        }
    }

    if (removed > 0) {
        FD_LOG_DEBUG(log_category::coordinator,
                     "Evicted " + std::to_string(removed) + " finished transfers");
    }
    return removed;
}

auto transfer_coordinator::transfer_count() const -> std::size_t {
    std::shared_lock lock(registry_mutex_);
    return transfers_.size();
}

auto transfer_coordinator::find(transfer_id id) const -> std::shared_ptr<transfer_context> {
    std::shared_lock lock(registry_mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end()) {
        return nullptr;
    }
    return it->second;
}

auto transfer_coordinator::not_found(transfer_id id) -> error {
    return error(error_code::transfer_not_found,
                 "transfer " + std::to_string(id) + " not found");
}

}  // namespace fetchd
