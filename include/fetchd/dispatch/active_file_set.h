/**
 * @file active_file_set.h
 * @brief Set of file ids currently queued or being downloaded
 */

#ifndef FETCHD_DISPATCH_ACTIVE_FILE_SET_H
#define FETCHD_DISPATCH_ACTIVE_FILE_SET_H

#include <cstddef>
#include <mutex>
#include <unordered_set>

#include "fetchd/core/types.h"

namespace fetchd {

/**
 * @brief Guarantees a file id is owned by at most one job at a time
 *
 * An id is inserted when its job is submitted and released once the job
 * finishes or is discarded.
 */
class active_file_set {
public:
    /**
     * @brief Atomic check-and-insert
     * @return true if the id was not active and is now owned by the caller
     */
    auto try_acquire(file_id id) -> bool {
        std::lock_guard lock(mutex_);
        return ids_.insert(id).second;
    }

    /**
     * @brief Release an id
     * @return true if the id was active
     */
    auto release(file_id id) -> bool {
        std::lock_guard lock(mutex_);
        return ids_.erase(id) > 0;
    }

    [[nodiscard]] auto contains(file_id id) const -> bool {
        std::lock_guard lock(mutex_);
        return ids_.count(id) > 0;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return ids_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_set<file_id> ids_;
};

}  // namespace fetchd

#endif  // FETCHD_DISPATCH_ACTIVE_FILE_SET_H
