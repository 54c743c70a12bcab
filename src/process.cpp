#include "netheal/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "netheal/common.hpp"

namespace netheal {

namespace {

constexpr size_t kMaxCapturedOutput = 64 * 1024;
constexpr double kTerminateGraceSeconds = 5.0;

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void drain(int fd, std::string& output) {
    char buffer[4096];
    while (true) {
        const ssize_t count = ::read(fd, buffer, sizeof(buffer));
        if (count > 0) {
            if (output.size() < kMaxCapturedOutput) {
                output.append(buffer, static_cast<size_t>(count));
            }
            continue;
        }
        if (count < 0 && errno == EINTR) {
            continue;
        }
        return;
    }
}

int wait_blocking(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return decode_status(status);
}

// SIGTERM, then SIGKILL once the grace period runs out.
int terminate(pid_t pid) {
    ::kill(pid, SIGTERM);
    const double deadline = seconds_since_epoch() + kTerminateGraceSeconds;
    while (seconds_since_epoch() < deadline) {
        int status = 0;
        const pid_t result = ::waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            return decode_status(status);
        }
        if (result < 0 && errno != EINTR) {
            return -1;
        }
        ::poll(nullptr, 0, 100);
    }
    ::kill(pid, SIGKILL);
    return wait_blocking(pid);
}

}  // namespace

CommandError::CommandError(const std::vector<std::string>& argv, CommandResult result)
    : std::runtime_error(describe_command(argv) + " failed with exit code " +
                         std::to_string(result.exit_code) +
                         (result.timed_out ? " (timed out)" : "") +
                         (result.output.empty() ? "" : ": " + trim(result.output))),
      result_(std::move(result)) {}

SystemCommandRunner::SystemCommandRunner(double poll_interval_s) : poll_interval_s_(poll_interval_s) {}

CommandResult SystemCommandRunner::run(const std::vector<std::string>& argv, double timeout_s,
                                       std::function<bool()> stop_when) {
    if (argv.empty()) {
        throw std::runtime_error("cannot run an empty command");
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    std::vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int fork_errno = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(fork_errno));
    }

    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execvp(child_argv[0], child_argv.data());
        _exit(127);
    }

    ::close(fds[1]);
    const int read_fd = fds[0];
    ::fcntl(read_fd, F_SETFL, ::fcntl(read_fd, F_GETFL) | O_NONBLOCK);

    CommandResult result;
    const bool bounded = timeout_s > 0.0;
    const double deadline = seconds_since_epoch() + timeout_s;
    const int slice_ms = static_cast<int>(poll_interval_s_ * 1000.0) > 0
                             ? static_cast<int>(poll_interval_s_ * 1000.0)
                             : 1;
    bool eof = false;

    while (true) {
        if (!eof) {
            pollfd entry{read_fd, POLLIN, 0};
            const int ready = ::poll(&entry, 1, slice_ms);
            if (ready > 0) {
                char buffer[4096];
                const ssize_t count = ::read(read_fd, buffer, sizeof(buffer));
                if (count > 0) {
                    if (result.output.size() < kMaxCapturedOutput) {
                        result.output.append(buffer, static_cast<size_t>(count));
                    }
                } else if (count == 0 || (errno != EINTR && errno != EAGAIN)) {
                    eof = true;
                }
            }
        } else {
            ::poll(nullptr, 0, slice_ms);
        }

        int status = 0;
        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            result.exit_code = decode_status(status);
            break;
        }
        if (waited < 0 && errno != EINTR) {
            result.exit_code = -1;
            break;
        }

        if (bounded && seconds_since_epoch() >= deadline) {
            ::kill(pid, SIGKILL);
            result.exit_code = wait_blocking(pid);
            result.timed_out = true;
            break;
        }
        if (stop_when && stop_when()) {
            result.exit_code = terminate(pid);
            result.interrupted = true;
            break;
        }
    }

    drain(read_fd, result.output);
    ::close(read_fd);
    return result;
}

std::string describe_command(const std::vector<std::string>& argv) {
    return join(argv, " ");
}

}  // namespace netheal
