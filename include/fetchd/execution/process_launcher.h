/**
 * @file process_launcher.h
 * @brief Subprocess launching abstraction with a POSIX implementation
 *
 * The executor talks to the downloader only through these interfaces so that
 * tests can substitute scripted processes.
 */

#ifndef FETCHD_EXECUTION_PROCESS_LAUNCHER_H
#define FETCHD_EXECUTION_PROCESS_LAUNCHER_H

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fetchd/core/types.h"

namespace fetchd {

/**
 * @brief A running child process whose stdout and stderr share one pipe
 */
class process_handle {
public:
    virtual ~process_handle() = default;

    /**
     * @brief Read end of the merged output pipe
     */
    [[nodiscard]] virtual auto output_fd() const -> int = 0;

    /**
     * @brief Non-blocking exit check
     * @return Exit status once the process has exited. A process killed by
     *         signal N reports 128 + N.
     */
    virtual auto try_wait() -> std::optional<int> = 0;

    /**
     * @brief Stop the process and reap it
     */
    virtual void terminate() = 0;
};

/**
 * @brief Starts child processes
 */
class process_launcher {
public:
    virtual ~process_launcher() = default;

    /**
     * @brief Start argv[0] (looked up on PATH) with the given arguments
     */
    virtual auto launch(const std::vector<std::string>& argv)
        -> result<std::unique_ptr<process_handle>> = 0;
};

/**
 * @brief fork/exec based launcher
 *
 * The child gets its stdout and stderr redirected into one pipe. If exec
 * fails the child exits with status 127.
 */
class posix_process_launcher : public process_launcher {
public:
    /**
     * @param termination_grace Time allowed between SIGTERM and SIGKILL
     */
    explicit posix_process_launcher(
        std::chrono::milliseconds termination_grace = std::chrono::milliseconds(2000));

    auto launch(const std::vector<std::string>& argv)
        -> result<std::unique_ptr<process_handle>> override;

private:
    std::chrono::milliseconds termination_grace_;
};

/**
 * @brief Handle to a child started by posix_process_launcher
 */
class posix_process_handle : public process_handle {
public:
    posix_process_handle(pid_t pid, int output_fd, std::chrono::milliseconds termination_grace);
    ~posix_process_handle() override;

    posix_process_handle(const posix_process_handle&) = delete;
    auto operator=(const posix_process_handle&) -> posix_process_handle& = delete;

    [[nodiscard]] auto output_fd() const -> int override { return output_fd_; }
    auto try_wait() -> std::optional<int> override;
    void terminate() override;

    [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }

private:
    static auto decode_status(int status) -> int;

    pid_t pid_;
    int output_fd_;
    std::chrono::milliseconds termination_grace_;
    std::optional<int> exit_status_;
};

}  // namespace fetchd

#endif  // FETCHD_EXECUTION_PROCESS_LAUNCHER_H
