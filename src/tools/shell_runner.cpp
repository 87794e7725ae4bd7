#include "tools/shell_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolsrv::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) {
        static_cast<void>(close(fds[0]));
    }
    if (fds[1] >= 0) {
        static_cast<void>(close(fds[1]));
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out, const std::size_t cap,
                bool& truncated) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const auto received = static_cast<std::size_t>(n);
            if (out.size() < cap) {
                const std::size_t room = cap - out.size();
                out.append(buffer, received < room ? received : room);
                if (received > room) {
                    truncated = true;
                }
            } else {
                truncated = true;
            }
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

void kill_group(const pid_t pid) {
    static_cast<void>(kill(-pid, SIGKILL));
    static_cast<void>(kill(pid, SIGKILL));
}

}  // namespace

core::errors::Result<ProcessCapture> run_shell_command(const ShellRequest& request) {
    // Everything the child touches is prepared before fork.
    std::vector<char*> envp;
    envp.reserve(request.environment.size() + 1);
    for (const auto& entry : request.environment) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    const std::string cwd = request.working_directory.string();
    char shell_path[] = "/bin/sh";
    char shell_name[] = "sh";
    char shell_flag[] = "-c";
    char* argv[] = {shell_name, shell_flag, const_cast<char*>(request.command.c_str()),
                    nullptr};

    // O_CLOEXEC keeps these ends out of shells forked concurrently by other tasks.
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return ToolError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close_pair(stdout_pipe);
        return ToolError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return ToolError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            static_cast<void>(dup2(null_fd, STDIN_FILENO));
            static_cast<void>(close(null_fd));
        } else {
            static_cast<void>(close(STDIN_FILENO));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execve(shell_path, argv, envp.data());
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!capture.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
            capture.timed_out = true;
            kill_group(pid);
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
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text,
                   request.max_output_bytes, capture.stdout_truncated);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text,
                   request.max_output_bytes, capture.stderr_truncated);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        if (child_exited && capture.timed_out) {
            // A killed group may leave a descendant holding a pipe; stop waiting for EOF.
            break;
        }
    }

    if (stdout_open) {
        static_cast<void>(close(stdout_pipe[0]));
    }
    if (stderr_open) {
        static_cast<void>(close(stderr_pipe[0]));
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

}  // namespace toolsrv::tools
