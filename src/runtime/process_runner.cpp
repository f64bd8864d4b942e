#include "runtime/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <deque>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace forge::runtime {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
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

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

}  // namespace

namespace detail {

void kill_process_group(const pid_t pid) {
    if (kill(-pid, SIGKILL) != 0) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

std::unique_ptr<ChildLaunch> make_launch(
    const std::vector<std::string>& argv,
    const std::map<std::string, std::string>& extra_env) {
    auto launch = std::make_unique<ChildLaunch>();
    launch->args = argv;

    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string current(*entry);
        const auto eq = current.find('=');
        const std::string name = current.substr(0, eq);
        if (extra_env.find(name) == extra_env.end()) {
            launch->env.push_back(current);
        }
    }
    for (const auto& [name, value] : extra_env) {
        launch->env.push_back(name + "=" + value);
    }

    for (auto& arg : launch->args) {
        launch->argv.push_back(arg.data());
    }
    launch->argv.push_back(nullptr);
    for (auto& entry : launch->env) {
        launch->envp.push_back(entry.data());
    }
    launch->envp.push_back(nullptr);
    return launch;
}

void exec_child(const ChildLaunch& launch,
                const std::optional<std::filesystem::path>& working_directory) {
    static_cast<void>(setpgid(0, 0));

    sigset_t none;
    sigemptyset(&none);
    static_cast<void>(sigprocmask(SIG_SETMASK, &none, nullptr));

    if (working_directory.has_value() && chdir(working_directory->c_str()) != 0) {
        _exit(126);
    }
    execvpe(launch.argv[0], launch.argv.data(), launch.envp.data());
    _exit(127);
}

}  // namespace detail

std::string tail_lines(const std::string& text, const std::size_t max_lines) {
    std::deque<std::string> kept;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        kept.push_back(line);
        if (kept.size() > max_lines) {
            kept.pop_front();
        }
    }

    std::string out;
    for (const auto& kept_line : kept) {
        if (!out.empty()) {
            out.push_back('\n');
        }
        out += kept_line;
    }
    return out;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += arg;
    }
    return out;
}

core::errors::Result<ProcessCapture> run_process(
    const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        return ForgeError{ErrorCategory::Internal, "Process command is empty.",
                          "empty_command"};
    }

    const auto& cancel_token = options.cancel_token;
    if (cancel_token && cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return ForgeError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    const auto launch = detail::make_launch(argv, options.extra_env);

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return ForgeError{ErrorCategory::Internal, "Failed to fork process.",
                          "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        detail::exec_child(*launch, options.working_directory);
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
        if (cancel_token && cancel_token->load() && !child_exited && !capture.cancelled) {
            capture.cancelled = true;
            detail::kill_process_group(pid);
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && options.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(options.timeout_ms) && !child_exited) {
            capture.timed_out = true;
            detail::kill_process_group(pid);
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
            // Both pipes closed but the child is still running.
            static_cast<void>(poll(nullptr, 0, 20));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

}  // namespace forge::runtime
