/**
 * @file transient_classifier.cpp
 * @brief Transient error classification
 */

#include "fetchd/core/transient_classifier.h"

#include <array>

namespace fetchd {

namespace {

constexpr std::array<std::string_view, 7> transient_markers = {
    "connection reset",
    "connection refused",
    "i/o timeout",
    "429",
    "502",
    "503",
    "504",
};

}  // namespace

auto is_transient_message(std::string_view message) -> bool {
    for (auto marker : transient_markers) {
        if (message.find(marker) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

auto is_transient(const error& err) -> bool {
    if (!err) {
        return false;
    }

    if (err.code == error_code::download_cancelled) {
        return false;
    }

    if (is_network_error(err.code)) {
        return true;
    }

    return is_transient_message(err.message);
}

}  // namespace fetchd
