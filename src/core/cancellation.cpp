/**
 * @file cancellation.cpp
 * @brief Cooperative cancellation implementation
 */

#include "fetchd/core/cancellation.h"

#include <algorithm>

namespace fetchd {

auto cancellation_token::is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
}

auto cancellation_token::wait_for(std::chrono::milliseconds timeout) const -> bool {
    if (!state_) {
        return false;
    }

    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

auto cancellation_token::on_cancel(std::function<void()> callback) const -> uint64_t {
    if (!state_ || !callback) {
        return 0;
    }

    {
        std::lock_guard lock(state_->mutex);
        if (!state_->cancelled.load(std::memory_order_acquire)) {
            auto id = state_->next_callback_id++;
            state_->callbacks.emplace_back(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void cancellation_token::unregister_callback(uint64_t id) const {
    if (!state_ || id == 0) {
        return;
    }

    std::lock_guard lock(state_->mutex);
    auto& callbacks = state_->callbacks;
    callbacks.erase(
        std::remove_if(callbacks.begin(), callbacks.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        callbacks.end());
}

cancellation_source::cancellation_source()
    : state_(std::make_shared<detail::cancellation_state>()) {}

auto cancellation_source::token() const -> cancellation_token {
    return cancellation_token(state_);
}

void cancellation_source::cancel() {
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        callbacks.swap(state_->callbacks);
    }
    state_->cv.notify_all();

    // Callbacks run outside the lock so they may touch the token
    for (auto& [id, callback] : callbacks) {
        callback();
    }
}

auto cancellation_source::is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
}

}  // namespace fetchd
