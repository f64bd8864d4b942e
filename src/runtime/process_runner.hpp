#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>
#include "core/errors/forge_errors.hpp"

namespace forge::runtime {

struct ProcessOptions {
    std::uint32_t timeout_ms = 30000;  // 0 disables the limit
    std::shared_ptr<std::atomic_bool> cancel_token;
    // Added to the child's environment only; never placed on the command line.
    std::map<std::string, std::string> extra_env;
    std::optional<std::filesystem::path> working_directory;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs argv[0] (looked up on PATH) to completion, capturing stdout and
// stderr separately. The child runs in its own process group so terminal
// signals aimed at this process do not reach it.
core::errors::Result<ProcessCapture> run_process(
    const std::vector<std::string>& argv, const ProcessOptions& options = {});

// Last `max_lines` non-empty lines of `text`, joined with '\n'.
std::string tail_lines(const std::string& text, std::size_t max_lines);

std::string join_command(const std::vector<std::string>& argv);

namespace detail {

// argv/envp for execvpe, built before fork so the child never allocates.
struct ChildLaunch {
    std::vector<std::string> args;
    std::vector<std::string> env;
    std::vector<char*> argv;
    std::vector<char*> envp;
};

std::unique_ptr<ChildLaunch> make_launch(
    const std::vector<std::string>& argv,
    const std::map<std::string, std::string>& extra_env);

// SIGKILLs the process group led by `pid`, or `pid` alone if it has not
// created its group yet.
void kill_process_group(pid_t pid);

// Runs in a freshly forked child: own process group, default signal mask,
// optional working directory, then exec. Never returns.
[[noreturn]] void exec_child(const ChildLaunch& launch,
                             const std::optional<std::filesystem::path>& working_directory);

}  // namespace detail

}  // namespace forge::runtime
