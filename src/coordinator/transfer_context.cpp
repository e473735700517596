/**
 * @file transfer_context.cpp
 * @brief Per-transfer aggregate state
 */

#include "fetchd/coordinator/transfer_context.h"

#include <mutex>

namespace fetchd {

transfer_context::transfer_context(transfer_id id,
                                   std::string name,
                                   uint64_t total_size,
                                   std::chrono::steady_clock::time_point registered_at)
    : id_(id),
      name_(std::move(name)),
      total_size_(total_size),
      registered_at_(registered_at) {}

auto transfer_context::view() const -> transfer_view {
    std::shared_lock lock(mutex_);

    transfer_view v;
    v.id = id_;
    v.name = name_;
    v.state = state_;
    v.total_size = total_size_;
    v.downloaded_size = downloaded_size_;
    v.registered_at = registered_at_;
    v.start_time = start_time_;
    v.expected_files = expected_.size();
    v.completed_files = completed_.size();
    v.failed_files = failed_.size();
    v.failures = failed_;
    return v;
}

auto transfer_context::state() const -> transfer_lifecycle {
    std::shared_lock lock(mutex_);
    return state_;
}

auto transfer_context::total_size() const -> uint64_t {
    std::shared_lock lock(mutex_);
    return total_size_;
}

auto transfer_context::downloaded_size() const -> uint64_t {
    std::shared_lock lock(mutex_);
    return downloaded_size_;
}

auto transfer_context::is_expected(file_id file) const -> bool {
    std::shared_lock lock(mutex_);
    return expected_.count(file) > 0;
}

auto transfer_context::add_files(const std::vector<file_id>& files) -> result<std::size_t> {
    std::unique_lock lock(mutex_);
    if (is_terminal(state_)) {
        return unexpected(error(error_code::transfer_not_active,
                                "transfer " + std::to_string(id_) + " is " +
                                    std::string(to_string(state_))));
    }

    std::size_t added = 0;
    for (auto file : files) {
        if (expected_.insert(file).second) {
            ++added;
        }
    }
    return added;
}

auto transfer_context::set_total_size(uint64_t size) -> result<void> {
    std::unique_lock lock(mutex_);
    if (total_size_ != 0 && total_size_ != size) {
        return unexpected(error(error_code::total_size_fixed,
                                "total size of transfer " + std::to_string(id_) +
                                    " is already " + std::to_string(total_size_)));
    }

    total_size_ = size;
    if (total_size_ != 0 && downloaded_size_ > total_size_) {
        downloaded_size_ = total_size_;
    }
    return {};
}

auto transfer_context::mark_file_started(file_id file,
                                         std::chrono::steady_clock::time_point now) -> bool {
    std::unique_lock lock(mutex_);
    if (is_terminal(state_)) {
        return false;
    }

    expected_.insert(file);
    // A re-enqueued file gets another chance
    failed_.erase(file);

    if (!start_time_) {
        start_time_ = now;
    }
    if (state_ == transfer_lifecycle::pending) {
        state_ = transfer_lifecycle::downloading;
        return true;
    }
    return false;
}

auto transfer_context::record_file_bytes(file_id file, uint64_t bytes) -> byte_record {
    std::unique_lock lock(mutex_);

    byte_record record;
    record.total_size = total_size_;

    if (file_bytes_.count(file) > 0) {
        record.downloaded_size = downloaded_size_;
        return record;
    }

    file_bytes_.emplace(file, bytes);
    downloaded_size_ += bytes;
    if (total_size_ != 0 && downloaded_size_ > total_size_) {
        downloaded_size_ = total_size_;
        record.clamped = true;
    }

    record.accepted = true;
    record.downloaded_size = downloaded_size_;
    return record;
}

auto transfer_context::complete_file(file_id file) -> transfer_lifecycle {
    std::unique_lock lock(mutex_);
    if (is_terminal(state_)) {
        return state_;
    }

    expected_.insert(file);
    failed_.erase(file);
    completed_.insert(file);
    if (state_ == transfer_lifecycle::pending) {
        state_ = transfer_lifecycle::downloading;
    }

    evaluate_state_locked();
    return state_;
}

auto transfer_context::fail_file(file_id file, const std::string& reason) -> transfer_lifecycle {
    std::unique_lock lock(mutex_);
    if (is_terminal(state_) || completed_.count(file) > 0) {
        return state_;
    }

    expected_.insert(file);
    failed_[file] = reason;
    if (state_ == transfer_lifecycle::pending) {
        state_ = transfer_lifecycle::downloading;
    }

    evaluate_state_locked();
    return state_;
}

auto transfer_context::cancel() -> bool {
    std::unique_lock lock(mutex_);
    if (is_terminal(state_)) {
        return false;
    }
    state_ = transfer_lifecycle::cancelled;
    return true;
}

void transfer_context::evaluate_state_locked() {
    if (is_terminal(state_) || expected_.empty()) {
        return;
    }

    // With a known total, more files may still be enqueued until its bytes arrive
    bool bytes_complete = total_size_ == 0 || downloaded_size_ >= total_size_;
    if (completed_.size() == expected_.size() && bytes_complete) {
        state_ = transfer_lifecycle::completed;
        return;
    }

    auto settled = completed_.size() + failed_.size();
    if (settled >= expected_.size() && completed_.empty()) {
        state_ = transfer_lifecycle::failed;
    }
}

}  // namespace fetchd
