#include "runtime/docker_cli_engine.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace forge::runtime {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

constexpr std::size_t kDiagnosticLines = 20;
constexpr const char* kEngineHint =
    "Ensure Docker is running and accessible. Check the daemon with 'docker info'.";

std::string trim(const std::string& value) {
    const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
                          return std::isspace(c) != 0;
                      }).base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

std::string diagnostic(const ProcessCapture& capture) {
    std::string text = tail_lines(capture.stderr_text, kDiagnosticLines);
    if (text.empty()) {
        text = tail_lines(capture.stdout_text, kDiagnosticLines);
    }
    if (capture.timed_out) {
        text += text.empty() ? "command timed out" : "\ncommand timed out";
    }
    return text;
}

ForgeError engine_error(const std::string& what, const ProcessCapture& capture,
                        const std::string& code) {
    return ForgeError{ErrorCategory::RuntimeStart,
                      what + " (exit " + std::to_string(capture.exit_code) + "): " +
                          diagnostic(capture),
                      code, kEngineHint};
}

std::map<std::string, std::string> secret_environment(const ContainerSpec& spec) {
    std::map<std::string, std::string> secrets;
    for (const auto& var : spec.env) {
        if (var.secret) {
            secrets[var.name] = var.value;
        }
    }
    return secrets;
}

}  // namespace

DockerCliEngine::DockerCliEngine(DockerCliOptions options)
    : options_(std::move(options)) {}

ProcessOptions DockerCliEngine::default_options() const {
    ProcessOptions options;
    options.timeout_ms = options_.command_timeout_ms;
    return options;
}

core::errors::Result<ProcessCapture> DockerCliEngine::docker(
    const std::vector<std::string>& args, const ProcessOptions& options) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(options_.binary);
    argv.insert(argv.end(), args.begin(), args.end());

    LOG_DEBUG("DockerCliEngine: " + join_command(argv));
    auto capture_result = run_process(argv, options);
    if (core::errors::is_error(capture_result)) {
        auto error = core::errors::get_error(capture_result);
        error.category = ErrorCategory::RuntimeStart;
        error.hint = kEngineHint;
        return error;
    }

    const auto& capture = core::errors::get_value(capture_result);
    if (capture.exit_code == 127) {
        return ForgeError{ErrorCategory::RuntimeStart,
                          "Container engine client not found: " + options_.binary,
                          "engine_not_found",
                          "Install Docker or put the docker client on PATH."};
    }
    return capture_result;
}

core::errors::Status DockerCliEngine::ping() {
    auto result = docker({"version", "--format", "{{.Server.Version}}"}, default_options());
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    if (capture.exit_code != 0) {
        return engine_error("Container engine is unreachable", capture,
                            "engine_unreachable");
    }
    LOG_DEBUG("DockerCliEngine: server version " + trim(capture.stdout_text));
    return core::errors::ok();
}

core::errors::Result<bool> DockerCliEngine::image_exists(const std::string& image_ref) {
    auto result =
        docker({"image", "inspect", "--format", "{{.Id}}", image_ref}, default_options());
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    if (capture.exit_code == 0) {
        return true;
    }

    // `image inspect` exits 1 both for a missing image and for an unreachable
    // daemon; only the former is a normal answer.
    std::string lowered = capture.stderr_text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered.find("no such image") != std::string::npos ||
        lowered.find("not found") != std::string::npos) {
        return false;
    }
    return engine_error("Unable to inspect image " + image_ref, capture,
                        "engine_unreachable");
}

core::errors::Status DockerCliEngine::build_image(const std::filesystem::path& context,
                                                  const std::string& image_ref,
                                                  const bool no_cache,
                                                  const CancelToken& cancel) {
    std::vector<std::string> args = {"build", "-t", image_ref, "--rm", "--force-rm"};
    if (no_cache) {
        args.emplace_back("--no-cache");
    }
    args.push_back(context.string());

    ProcessOptions options = default_options();
    options.timeout_ms = static_cast<std::uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.build_timeout)
            .count());
    options.cancel_token = cancel;

    auto result = docker(args, options);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    if (capture.cancelled) {
        return ForgeError{ErrorCategory::Cancelled,
                          "Image build cancelled for " + image_ref + ".",
                          "build_cancelled",
                          "Rerun the command to build the image again."};
    }
    if (capture.exit_code != 0 || capture.timed_out) {
        return ForgeError{ErrorCategory::Build,
                          "Image build failed for " + image_ref + " (exit " +
                              std::to_string(capture.exit_code) + "): " +
                              diagnostic(capture),
                          "image_build_failed",
                          "Check the Dockerfile in " + context.string() +
                              " and retry with --no-cache."};
    }
    return core::errors::ok();
}

std::vector<std::string> DockerCliEngine::run_arguments(const ContainerSpec& spec) {
    std::vector<std::string> args = {"run", "-d"};
    if (!spec.name.empty()) {
        args.insert(args.end(), {"--name", spec.name});
    }
    for (const auto& mount : spec.mounts) {
        args.emplace_back("-v");
        args.push_back(mount.host_path.string() + ":" + mount.container_path +
                       (mount.read_only ? ":ro" : ":rw"));
    }
    for (const auto& var : spec.env) {
        args.emplace_back("-e");
        args.push_back(var.secret ? var.name : var.name + "=" + var.value);
    }
    for (const auto& [key, value] : spec.labels) {
        args.emplace_back("--label");
        args.push_back(key + "=" + value);
    }
    if (!spec.working_dir.empty()) {
        args.insert(args.end(), {"-w", spec.working_dir});
    }
    if (!spec.user.empty()) {
        args.insert(args.end(), {"--user", spec.user});
    }
    if (!spec.network.empty()) {
        args.insert(args.end(), {"--network", spec.network});
    }
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

core::errors::Result<std::string> DockerCliEngine::run(const ContainerSpec& spec) {
    ProcessOptions options = default_options();
    options.extra_env = secret_environment(spec);

    auto result = docker(run_arguments(spec), options);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    const std::string id = trim(capture.stdout_text);
    if (capture.exit_code != 0 || id.empty()) {
        return engine_error("Container failed to start from " + spec.image, capture,
                            "container_start_failed");
    }
    return id;
}

core::errors::Result<std::unique_ptr<LineSource>> DockerCliEngine::logs(
    const std::string& container_id) {
    const std::vector<std::string> argv = {options_.binary, "logs", "--follow",
                                           container_id};
    LOG_DEBUG("DockerCliEngine: " + join_command(argv));
    auto spawned = ProcessLineSource::spawn(argv);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    return std::unique_ptr<LineSource>(core::errors::take_value(spawned));
}

core::errors::Status DockerCliEngine::stop(const std::string& container_id,
                                           const std::chrono::seconds grace) {
    ProcessOptions options = default_options();
    options.timeout_ms = static_cast<std::uint32_t>(
        options_.command_timeout_ms +
        std::chrono::duration_cast<std::chrono::milliseconds>(grace).count());

    auto result = docker({"stop", "-t", std::to_string(grace.count()), container_id},
                         options);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    if (capture.exit_code != 0) {
        return engine_error("Failed to stop container " + container_id, capture,
                            "container_stop_failed");
    }
    return core::errors::ok();
}

core::errors::Status DockerCliEngine::kill(const std::string& container_id) {
    auto result = docker({"kill", container_id}, default_options());
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    if (capture.exit_code != 0) {
        return engine_error("Failed to kill container " + container_id, capture,
                            "container_kill_failed");
    }
    return core::errors::ok();
}

core::errors::Status DockerCliEngine::remove(const std::string& container_id) {
    auto result = docker({"rm", "-f", container_id}, default_options());
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    if (capture.exit_code != 0) {
        return engine_error("Failed to remove container " + container_id, capture,
                            "container_remove_failed");
    }
    return core::errors::ok();
}

core::errors::Result<ContainerStatus> DockerCliEngine::inspect(
    const std::string& container_id) {
    auto result = docker({"inspect", "--format", "{{.State.Status}}", container_id},
                         default_options());
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    if (capture.exit_code != 0) {
        if (capture.stderr_text.find("No such") != std::string::npos) {
            return ContainerStatus::Removed;
        }
        return engine_error("Failed to inspect container " + container_id, capture,
                            "container_inspect_failed");
    }

    const std::string state = trim(capture.stdout_text);
    if (state == "created") {
        return ContainerStatus::Created;
    }
    if (state == "running" || state == "restarting" || state == "paused") {
        return ContainerStatus::Running;
    }
    if (state == "exited" || state == "dead" || state == "removing") {
        return ContainerStatus::Exited;
    }
    return ContainerStatus::Unknown;
}

core::errors::Result<int> DockerCliEngine::wait(const std::string& container_id) {
    ProcessOptions options = default_options();
    options.timeout_ms = 0;

    auto result = docker({"wait", container_id}, options);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);
    const std::string text = trim(capture.stdout_text);
    int exit_code = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, exit_code);
    if (capture.exit_code != 0 || ec != std::errc() || ptr != end) {
        return engine_error("Failed to wait for container " + container_id, capture,
                            "container_wait_failed");
    }
    return exit_code;
}

}  // namespace forge::runtime
