/**
 * @file transfer_types.cpp
 * @brief Transfer type helpers
 */

#include "fetchd/core/transfer_types.h"

namespace fetchd {

auto format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "unknown";
    }

    auto hours = seconds / 3600;
    auto minutes = (seconds % 3600) / 60;
    auto secs = seconds % 60;

    if (hours > 0) {
        return std::to_string(hours) + "h" + std::to_string(minutes) + "m";
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m" + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

}  // namespace fetchd
