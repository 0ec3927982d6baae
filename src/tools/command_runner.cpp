#include "tools/command_runner.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace winsys::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    int exec_errno = 0;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] != -1) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

// The child reports a failed execvp through a close-on-exec pipe; a
// successful exec closes it with nothing written.
int read_exec_errno(const int fd) {
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(close(fd));
    return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

core::errors::Result<ProcessCapture> spawn_and_capture(const CommandRequest& request) {
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return ToolError{ErrorCategory::Internal,
                         "Failed to create process pipes.",
                         "spawn_failed"};
    }

    std::vector<char*> argv;
    argv.reserve(request.arguments.size() + 2);
    argv.push_back(const_cast<char*>(request.program.c_str()));
    for (const auto& argument : request.arguments) {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return ToolError{ErrorCategory::Internal,
                         "Failed to fork process.",
                         "spawn_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        execvp(request.program.c_str(), argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(exec_pipe[1]));

    ProcessCapture capture;
    capture.exec_errno = read_exec_errno(exec_pipe[0]);

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 now - started)
                                 .count();
        if (!capture.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms) && !child_exited) {
            capture.timed_out = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else if (!child_exited) {
            static_cast<void>(usleep(10 * 1000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A grandchild holding the pipes open must not outlive the timeout.
        if (capture.timed_out && child_exited) {
            break;
        }
    }

    if (stdout_open) {
        static_cast<void>(close(stdout_pipe[0]));
    }
    if (stderr_open) {
        static_cast<void>(close(stderr_pipe[0]));
    }
    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

std::string trim_trailing_newlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

}  // namespace

std::string describe_command(const CommandRequest& request) {
    std::string line = request.program;
    for (const auto& argument : request.arguments) {
        line += ' ';
        if (argument.find_first_of(" \t\"") != std::string::npos) {
            line += '"' + argument + '"';
        } else {
            line += argument;
        }
    }
    return line;
}

core::errors::Result<CommandOutput> ProcessCommandRunner::run(
    const CommandRequest& request) const {
    if (request.program.empty()) {
        return ToolError{ErrorCategory::Internal, "Command program cannot be empty.",
                         "spawn_failed"};
    }

    const std::string command_line = describe_command(request);
    WINSYS_LOG_DEBUG("exec: " + command_line);

    auto capture_result = spawn_and_capture(request);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.exec_errno != 0) {
        return ToolError{ErrorCategory::Execution,
                         "Command not found: " + request.program + " (" +
                             std::strerror(capture.exec_errno) + ")",
                         "command_not_found",
                         "Check that the program is installed and on PATH."};
    }

    if (capture.timed_out) {
        return ToolError{ErrorCategory::Execution,
                         "Command timed out after " +
                             std::to_string(request.timeout_ms) + " ms: " + command_line,
                         "command_timed_out"};
    }

    if (capture.exit_code != 0) {
        std::string message = "Command failed: " + command_line;
        const std::string detail = trim_trailing_newlines(
            capture.stderr_text.empty() ? capture.stdout_text : capture.stderr_text);
        if (!detail.empty()) {
            message += "\n" + detail;
        } else {
            message += "\nexit code " + std::to_string(capture.exit_code);
        }
        return ToolError{ErrorCategory::Execution, message, "external_command_failed"};
    }

    CommandOutput output;
    output.exit_code = capture.exit_code;
    output.stdout_text = capture.stdout_text;
    output.stderr_text = capture.stderr_text;
    output.duration_ms = capture.duration_ms;
    return output;
}

}  // namespace winsys::tools
