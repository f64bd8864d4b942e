#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <pthread.h>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include "app/cli_parser.hpp"
#include "collaborators/default_collaborators.hpp"
#include "core/config/execution_id.hpp"
#include "core/config/settings.hpp"
#include "core/errors/forge_errors.hpp"
#include "core/logging/logger.hpp"
#include "orchestration/cancellation.hpp"
#include "orchestration/orchestrator.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/docker_cli_engine.hpp"
#include "runtime/image_provisioner.hpp"
#include "workspace/workspace_manager.hpp"

namespace {

constexpr int kInputErrorExit = 2;

void report_error(const std::string& what, const forge::core::errors::ForgeError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

forge::core::errors::Result<forge::core::config::Settings> load_settings(
    const forge::app::cli::CliInvocation& invocation) {
    forge::core::config::Settings settings;
    if (invocation.config_file) {
        auto from_file = forge::core::config::load_settings_file(*invocation.config_file, settings);
        if (forge::core::errors::is_error(from_file)) {
            return forge::core::errors::get_error(from_file);
        }
        settings = forge::core::errors::take_value(from_file);
    }

    auto from_env = forge::core::config::apply_environment(
        settings, forge::core::config::process_environment());
    if (forge::core::errors::is_error(from_env)) {
        return forge::core::errors::get_error(from_env);
    }
    settings = forge::core::errors::take_value(from_env);

    auto valid = forge::core::config::validate_settings(settings);
    if (forge::core::errors::is_error(valid)) {
        return forge::core::errors::get_error(valid);
    }
    return settings;
}

// Turns SIGINT and SIGTERM into a cancellation request. The signals are
// blocked in every thread and consumed here with sigwait(); SIGUSR1 ends
// the loop.
class SignalCancellation {
public:
    explicit SignalCancellation(forge::orchestration::CancellationSource& source)
        : source_(source) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
        thread_ = std::thread([this] { wait_loop(); });
    }

    ~SignalCancellation() {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

    SignalCancellation(const SignalCancellation&) = delete;
    SignalCancellation& operator=(const SignalCancellation&) = delete;

private:
    void wait_loop() {
        while (true) {
            int signal_number = 0;
            if (sigwait(&signals_, &signal_number) != 0 || signal_number == SIGUSR1) {
                return;
            }
            LOG_WARN("Received signal " + std::to_string(signal_number) + "; cancelling.");
            source_.cancel();
        }
    }

    forge::orchestration::CancellationSource& source_;
    sigset_t signals_;
    std::thread thread_;
};

int run_doctor(const forge::app::cli::CliInvocation& invocation,
               const forge::core::config::Settings& settings) {
    LOG_INFO("forge system health check");
    bool healthy = true;

    forge::runtime::DockerCliEngine engine(
        forge::runtime::DockerCliOptions{"docker", 60000, settings.build_timeout});
    auto ping = engine.ping();
    if (forge::core::errors::is_error(ping)) {
        report_error("Container engine", forge::core::errors::get_error(ping));
        healthy = false;
    } else {
        LOG_INFO("Container engine: available");
        auto image = engine.image_exists(settings.image_ref());
        if (forge::core::errors::is_error(image)) {
            report_error("Runtime image", forge::core::errors::get_error(image));
            healthy = false;
        } else if (forge::core::errors::get_value(image)) {
            LOG_INFO("Runtime image " + settings.image_ref() + ": present");
        } else {
            LOG_WARN("Runtime image " + settings.image_ref() +
                     ": missing (it is built on the first run)");
        }
    }

    forge::runtime::ImageProvisioner provisioner(engine, settings.image_name,
                                                 settings.image_tag, settings.build_context);
    auto context = provisioner.validate_build_context();
    if (forge::core::errors::is_error(context)) {
        report_error("Build context", forge::core::errors::get_error(context));
        healthy = false;
    } else {
        LOG_INFO("Build context " + settings.build_context.string() + ": found");
    }

    const auto base = invocation.output_dir.value_or(std::filesystem::current_path());
    const auto workspaces = base / forge::workspace::kWorkspacesDir;
    const auto marker_file =
        workspaces / (".doctor_" + forge::core::config::generate_execution_id());
    std::error_code ec;
    std::filesystem::create_directories(workspaces, ec);
    bool writable = !ec;
    if (writable) {
        std::ofstream out(marker_file);
        out << "ok\n";
        writable = out.good();
    }
    std::filesystem::remove(marker_file, ec);
    if (writable) {
        LOG_INFO("Output directory " + workspaces.string() + ": writable");
    } else {
        LOG_ERROR("Output directory " + workspaces.string() + ": not writable");
        healthy = false;
    }

    const auto credential = forge::core::config::process_environment()(settings.credential_env);
    if (credential.has_value() && !credential->empty()) {
        LOG_INFO("Credential " + settings.credential_env + ": set");
    } else {
        LOG_WARN("Credential " + settings.credential_env + ": not set");
    }

    if (healthy) {
        LOG_INFO("All systems operational.");
        return 0;
    }
    LOG_ERROR("Some checks failed. Resolve them before running forge.");
    return 1;
}

int run_execution(const forge::app::cli::CliInvocation& invocation,
                  const forge::core::config::Settings& settings) {
    const auto& req = invocation.request;

    forge::orchestration::CancellationSource cancellation;
    SignalCancellation signals(cancellation);

    forge::runtime::DockerCliEngine engine(
        forge::runtime::DockerCliOptions{"docker", 60000, settings.build_timeout});
    forge::collaborators::NullIdeaAnalyzer analyzer;
    forge::collaborators::ForcedAgentSelector selector;
    forge::collaborators::ContextFileRenderer renderer;

    forge::orchestration::OrchestratorOptions options;
    options.settings = settings;
    options.credential_value = forge::core::config::process_environment()(settings.credential_env);

    forge::orchestration::Orchestrator orchestrator(
        forge::orchestration::OrchestratorDependencies{engine, analyzer, selector, renderer,
                                                       cancellation},
        std::move(options));

    LOG_INFO("Model: " + req.model + ", timeout: " + req.timeout.describe() +
             ", image: " + settings.image_ref());
    const auto result = orchestrator.execute(req);

    LOG_INFO("Status: " + forge::protocol::to_string(result.status));
    if (!result.workspace_root.empty()) {
        LOG_INFO("Workspace: " + result.workspace_root.string());
        LOG_INFO("Output: " + result.output_path.string());
    }
    LOG_INFO("Elapsed: " + std::to_string(result.elapsed.count() / 1000.0) + "s");
    if (result.error.has_value()) {
        report_error(forge::core::errors::to_string(result.error->category), *result.error);
        if (!result.log_tail.empty()) {
            LOG_INFO("Last container output:");
            for (const auto& line : result.log_tail) {
                LOG_INFO("  " + line);
            }
        }
    }
    if (req.keep_container && !result.container_id.empty()) {
        LOG_INFO("Container kept: " + result.container_id);
    }

    if (result.error.has_value() &&
        result.error->category == forge::core::errors::ErrorCategory::Input) {
        return kInputErrorExit;
    }
    return forge::protocol::to_exit_code(result.status);
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = forge::app::cli::parse_and_validate(argc, argv);
    if (forge::core::errors::is_error(parsed)) {
        report_error("Input error", forge::core::errors::get_error(parsed));
        return kInputErrorExit;
    }
    const auto& invocation = forge::core::errors::get_value(parsed);
    if (invocation.command == forge::app::cli::Command::Help) {
        std::cout << forge::app::cli::usage();
        return 0;
    }

    // 2. Configure the global logger
    auto& logger = forge::core::logging::Logger::get();
    if (invocation.verbose) {
        logger.set_min_level(forge::core::logging::LogLevel::DEBUG);
    }
    if (invocation.log_file && !logger.set_log_file(*invocation.log_file)) {
        LOG_WARN("Unable to open log file: " + invocation.log_file->string());
    }

    // 3. Layer settings: defaults, file, environment
    auto settings = load_settings(invocation);
    if (forge::core::errors::is_error(settings)) {
        report_error("Configuration error", forge::core::errors::get_error(settings));
        return kInputErrorExit;
    }

    if (invocation.command == forge::app::cli::Command::Doctor) {
        return run_doctor(invocation, forge::core::errors::get_value(settings));
    }
    return run_execution(invocation, forge::core::errors::get_value(settings));
}
