#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/forge_errors.hpp"

namespace forge::runtime {

// An ordered, lazily produced sequence of output lines.
//
// next_line() blocks until a complete line is available and returns it,
// returns std::nullopt once the stream has closed or interrupt() was called,
// and returns a Stream error if the transport fails. interrupt() may be
// called from any thread and is idempotent.
class LineSource {
public:
    virtual ~LineSource() = default;

    virtual core::errors::Result<std::optional<std::string>> next_line() = 0;
    virtual void interrupt() = 0;
    virtual bool interrupted() const = 0;
};

// Streams the merged stdout/stderr of a child process line by line. Reads
// wait in poll() on the output pipe and a wake pipe, so an interrupt from
// another thread unblocks a pending read immediately.
class ProcessLineSource : public LineSource {
public:
    // Output without a newline is split into lines of at most this many bytes.
    static constexpr std::size_t kMaxLineBytes = 64 * 1024;

    static core::errors::Result<std::unique_ptr<ProcessLineSource>> spawn(
        const std::vector<std::string>& argv,
        const std::map<std::string, std::string>& extra_env = {});

    ~ProcessLineSource() override;

    ProcessLineSource(const ProcessLineSource&) = delete;
    ProcessLineSource& operator=(const ProcessLineSource&) = delete;

    core::errors::Result<std::optional<std::string>> next_line() override;
    void interrupt() override;
    bool interrupted() const override { return interrupted_.load(); }

    // Exit status of the child once the stream has closed, -1 before that.
    int exit_code() const { return exit_code_; }

private:
    ProcessLineSource(pid_t pid, int output_fd, int wake_read_fd, int wake_write_fd);

    std::optional<std::string> pop_line(bool flush_partial);
    void terminate_child();
    void reap_child(bool block);

    pid_t pid_;
    int output_fd_;
    int wake_read_fd_;
    int wake_write_fd_;
    bool eof_ = false;
    bool reaped_ = false;
    int exit_code_ = -1;
    std::string buffer_;
    std::atomic_bool interrupted_{false};
};

}  // namespace forge::runtime
