/**
 * @file file_hosting_client.h
 * @brief Interface to the service that resolves file ids to download URLs
 */

#ifndef FETCHD_EXECUTION_FILE_HOSTING_CLIENT_H
#define FETCHD_EXECUTION_FILE_HOSTING_CLIENT_H

#include <functional>
#include <string>
#include <utility>

#include "fetchd/core/types.h"

namespace fetchd {

/**
 * @brief Resolves a hosted file to a direct download URL
 *
 * Implementations must be safe to call from several worker threads at once.
 * URLs may be short-lived, so the executor resolves again on every attempt.
 */
class file_hosting_client {
public:
    virtual ~file_hosting_client() = default;

    virtual auto get_download_url(file_id id) -> result<std::string> = 0;
};

/**
 * @brief Hosting client backed by a callable
 */
class callback_hosting_client : public file_hosting_client {
public:
    using resolver = std::function<result<std::string>(file_id)>;

    explicit callback_hosting_client(resolver resolve) : resolve_(std::move(resolve)) {}

    auto get_download_url(file_id id) -> result<std::string> override {
        return resolve_(id);
    }

private:
    resolver resolve_;
};

}  // namespace fetchd

#endif  // FETCHD_EXECUTION_FILE_HOSTING_CLIENT_H
