/**
 * @file transient_classifier.h
 * @brief Classification of download errors into transient and permanent
 */

#ifndef FETCHD_CORE_TRANSIENT_CLASSIFIER_H
#define FETCHD_CORE_TRANSIENT_CLASSIFIER_H

#include <string_view>

#include "types.h"

namespace fetchd {

/**
 * @brief Check if the error code belongs to the network error range
 */
[[nodiscard]] constexpr auto is_network_error(error_code code) noexcept -> bool {
    auto value = static_cast<int>(code);
    return value <= -160 && value > -180;
}

/**
 * @brief Check if an error text names a transient condition
 *
 * Matches "connection reset", "connection refused", "i/o timeout" and the
 * HTTP statuses 429, 502, 503 and 504 anywhere in the text.
 */
[[nodiscard]] auto is_transient_message(std::string_view message) -> bool;

/**
 * @brief Decide whether a failed attempt may succeed when retried
 *
 * Cancellation is never transient. Typed network errors always are. For
 * any other code the message text decides.
 */
[[nodiscard]] auto is_transient(const error& err) -> bool;

}  // namespace fetchd

#endif  // FETCHD_CORE_TRANSIENT_CLASSIFIER_H
