#include "tools/command_executor.hpp"

#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace storyloop::tools {

using core::errors::ErrorCategory;
using core::errors::LoopError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        close_fd(fd);
        return;
    }
}

void feed_stdin(int& fd, const std::string& text, std::size_t& offset) {
    if (fd < 0) {
        return;
    }
    while (offset < text.size()) {
        const ssize_t n = write(fd, text.data() + offset, text.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        // EPIPE: the child stopped reading.
        break;
    }
    close_fd(fd);
}

LoopError pipe_error() {
    return LoopError{ErrorCategory::Internal, "Failed to create process pipes.",
                     "pipe_creation_failed"};
}

}  // namespace

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    quoted.reserve(value.size() + 16);
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

core::errors::Result<ProcessCapture> ShellCommandExecutor::run(
    const ProcessRequest& request) const {
    if (request.command.empty()) {
        return LoopError{ErrorCategory::Input, "Command cannot be empty.",
                         "empty_command"};
    }

    // A child that exits without reading its input must not kill the loop.
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdin_pipe) != 0) {
        return pipe_error();
    }
    if (pipe(stdout_pipe) != 0) {
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        return pipe_error();
    }
    if (pipe(stderr_pipe) != 0) {
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return pipe_error();
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fd : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0],
                        &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1]}) {
            close_fd(*fd);
        }
        return LoopError{ErrorCategory::Internal, "Failed to fork process.",
                         "fork_failed"};
    }

    if (pid == 0) {
        // Own process group, so a timeout also reaches anything the command spawned.
        static_cast<void>(setpgid(0, 0));
        if (chdir(request.working_directory.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdin_pipe[0]));
        static_cast<void>(close(stdin_pipe[1]));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execl("/bin/sh", "sh", "-c", request.command.c_str(),
              static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    set_nonblocking(stdin_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    const std::string stdin_text = request.stdin_text.value_or("");
    std::size_t stdin_offset = 0;
    if (!request.stdin_text.has_value()) {
        close_fd(stdin_pipe[1]);
    }

    ProcessCapture capture;
    bool child_exited = false;
    int status = 0;

    while (stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0 || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
            drain_pipe(stdout_pipe[0], capture.stdout_text);
            drain_pipe(stderr_pipe[0], capture.stderr_text);
            break;
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdin_pipe[1] >= 0) {
            fds[nfds].fd = stdin_pipe[1];
            fds[nfds].events = POLLOUT;
            ++nfds;
        }
        if (stdout_pipe[0] >= 0) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        }

        feed_stdin(stdin_pipe[1], stdin_text, stdin_offset);
        drain_pipe(stdout_pipe[0], capture.stdout_text);
        drain_pipe(stderr_pipe[0], capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        if (child_exited && stdout_pipe[0] < 0 && stderr_pipe[0] < 0) {
            break;
        }
    }

    close_fd(stdin_pipe[1]);
    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);
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

}  // namespace storyloop::tools
