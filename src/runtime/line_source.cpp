#include "runtime/line_source.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include "runtime/process_runner.hpp"

namespace forge::runtime {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

ForgeError stream_error(const std::string& message, const std::string& code) {
    return ForgeError{ErrorCategory::Stream, message, code,
                      "Check that the container engine is still running."};
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

}  // namespace

core::errors::Result<std::unique_ptr<ProcessLineSource>> ProcessLineSource::spawn(
    const std::vector<std::string>& argv,
    const std::map<std::string, std::string>& extra_env) {
    if (argv.empty()) {
        return ForgeError{ErrorCategory::Internal, "Stream command is empty.",
                          "empty_command"};
    }

    int output_pipe[2] = {-1, -1};
    int wake_pipe[2] = {-1, -1};
    if (pipe2(output_pipe, O_CLOEXEC) != 0) {
        return stream_error("Failed to create stream pipe.", "pipe_creation_failed");
    }
    if (pipe2(wake_pipe, O_CLOEXEC | O_NONBLOCK) != 0) {
        close_fd(output_pipe[0]);
        close_fd(output_pipe[1]);
        return stream_error("Failed to create wake pipe.", "pipe_creation_failed");
    }

    const auto launch = detail::make_launch(argv, extra_env);
    const pid_t pid = fork();
    if (pid < 0) {
        close_fd(output_pipe[0]);
        close_fd(output_pipe[1]);
        close_fd(wake_pipe[0]);
        close_fd(wake_pipe[1]);
        return stream_error("Failed to fork stream process.", "fork_failed");
    }

    if (pid == 0) {
        static_cast<void>(dup2(output_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(output_pipe[1], STDERR_FILENO));
        detail::exec_child(*launch, std::nullopt);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(output_pipe[1]);
    return std::unique_ptr<ProcessLineSource>(
        new ProcessLineSource(pid, output_pipe[0], wake_pipe[0], wake_pipe[1]));
}

ProcessLineSource::ProcessLineSource(const pid_t pid, const int output_fd,
                                     const int wake_read_fd, const int wake_write_fd)
    : pid_(pid),
      output_fd_(output_fd),
      wake_read_fd_(wake_read_fd),
      wake_write_fd_(wake_write_fd) {}

ProcessLineSource::~ProcessLineSource() {
    if (!reaped_) {
        terminate_child();
        reap_child(true);
    }
    close_fd(output_fd_);
    close_fd(wake_read_fd_);
    close_fd(wake_write_fd_);
}

void ProcessLineSource::interrupt() {
    if (interrupted_.exchange(true)) {
        return;
    }
    const char signal_byte = 'x';
    static_cast<void>(write(wake_write_fd_, &signal_byte, 1));
}

void ProcessLineSource::terminate_child() {
    if (!reaped_ && pid_ > 0) {
        detail::kill_process_group(pid_);
    }
}

void ProcessLineSource::reap_child(const bool block) {
    if (reaped_) {
        return;
    }
    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (waited < 0 && errno == EINTR);
    if (waited != pid_) {
        return;
    }

    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
}

std::optional<std::string> ProcessLineSource::pop_line(const bool flush_partial) {
    const auto newline = buffer_.find('\n');
    if ((newline == std::string::npos || newline > kMaxLineBytes) &&
        buffer_.size() >= kMaxLineBytes) {
        std::string head = buffer_.substr(0, kMaxLineBytes);
        buffer_.erase(0, kMaxLineBytes);
        return head;
    }
    if (newline == std::string::npos) {
        if (!flush_partial || buffer_.empty()) {
            return std::nullopt;
        }
        std::string rest;
        rest.swap(buffer_);
        return rest;
    }

    std::string line = buffer_.substr(0, newline);
    buffer_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

core::errors::Result<std::optional<std::string>> ProcessLineSource::next_line() {
    while (true) {
        if (interrupted_.load()) {
            terminate_child();
            return std::optional<std::string>{};
        }
        if (auto line = pop_line(eof_)) {
            return line;
        }
        if (eof_) {
            reap_child(true);
            if (exit_code_ != 0) {
                return stream_error(
                    "Log stream exited with code " + std::to_string(exit_code_),
                    "stream_exit_nonzero");
            }
            return std::optional<std::string>{};
        }

        pollfd fds[2];
        fds[0].fd = output_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wake_read_fd_;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        const int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return stream_error("poll() failed on log stream.", "stream_poll_failed");
        }
        if ((fds[1].revents & POLLIN) != 0) {
            continue;
        }
        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            continue;
        }

        char chunk[4096];
        const ssize_t n = read(output_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            return stream_error("Read failed on log stream.", "stream_read_failed");
        }
    }
}

}  // namespace forge::runtime
