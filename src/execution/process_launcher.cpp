/**
 * @file process_launcher.cpp
 * @brief POSIX subprocess launching
 */

#include "fetchd/execution/process_launcher.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "fetchd/core/logging.h"

namespace fetchd {

namespace {

constexpr auto reap_poll_interval = std::chrono::milliseconds(20);

}  // namespace

posix_process_launcher::posix_process_launcher(std::chrono::milliseconds termination_grace)
    : termination_grace_(termination_grace) {}

auto posix_process_launcher::launch(const std::vector<std::string>& argv)
    -> result<std::unique_ptr<process_handle>> {
    if (argv.empty() || argv.front().empty()) {
        return unexpected(error(error_code::process_spawn_failed, "empty command line"));
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return unexpected(error(error_code::process_spawn_failed,
                                std::string("failed to create output pipe: ") +
                                    std::strerror(errno)));
    }

    // Build the argument vector before forking; the child must not allocate
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return unexpected(error(error_code::process_spawn_failed,
                                std::string("fork failed: ") + std::strerror(saved)));
    }

    if (pid == 0) {
        // Child process
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(fds[1]);

    FD_LOG_DEBUG(log_category::process,
                 "Started " + argv.front() + " (pid " + std::to_string(pid) + ")");

    return std::unique_ptr<process_handle>(
        std::make_unique<posix_process_handle>(pid, fds[0], termination_grace_));
}

posix_process_handle::posix_process_handle(pid_t pid,
                                           int output_fd,
                                           std::chrono::milliseconds termination_grace)
    : pid_(pid), output_fd_(output_fd), termination_grace_(termination_grace) {}

posix_process_handle::~posix_process_handle() {
    if (!exit_status_) {
        terminate();
    }
    if (output_fd_ >= 0) {
        ::close(output_fd_);
    }
}

auto posix_process_handle::try_wait() -> std::optional<int> {
    if (exit_status_) {
        return exit_status_;
    }

    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == pid_) {
        exit_status_ = decode_status(status);
    } else if (rc < 0 && errno == ECHILD) {
        // Reaped elsewhere; no status available
        exit_status_ = 128 + SIGKILL;
    }
    return exit_status_;
}

void posix_process_handle::terminate() {
    if (try_wait()) {
        return;
    }

    ::kill(pid_, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + termination_grace_;
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_wait()) {
            return;
        }
        std::this_thread::sleep_for(reap_poll_interval);
    }

    FD_LOG_WARN(log_category::process,
                "Process " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
    ::kill(pid_, SIGKILL);

    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid_, &status, 0);
    } while (rc < 0 && errno == EINTR);

    exit_status_ = rc == pid_ ? decode_status(status) : 128 + SIGKILL;
}

auto posix_process_handle::decode_status(int status) -> int {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace fetchd
