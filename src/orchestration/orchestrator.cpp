#include "orchestration/orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <thread>
#include <utility>
#include "core/config/execution_id.hpp"
#include "core/logging/logger.hpp"
#include "orchestration/session_script.hpp"
#include "orchestration/timeout_guard.hpp"

namespace forge::orchestration {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::ExecutionRequest;
using protocol::ExecutionResult;
using protocol::ExecutionStatus;
using protocol::OrchestratorState;

namespace {

// Runs the wrapped action once, at the latest when the scope ends.
class CleanupScope {
public:
    explicit CleanupScope(std::function<void()> action) : action_(std::move(action)) {}
    ~CleanupScope() { run(); }

    CleanupScope(const CleanupScope&) = delete;
    CleanupScope& operator=(const CleanupScope&) = delete;

    void run() {
        if (!done_) {
            done_ = true;
            action_();
        }
    }

private:
    std::function<void()> action_;
    bool done_ = false;
};

// Interrupts the stream and joins the consumer thread when the scope ends.
class WorkerJoin {
public:
    WorkerJoin(std::thread& worker, runtime::LineSource& source)
        : worker_(worker), source_(source) {}
    ~WorkerJoin() {
        source_.interrupt();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    WorkerJoin(const WorkerJoin&) = delete;
    WorkerJoin& operator=(const WorkerJoin&) = delete;

private:
    std::thread& worker_;
    runtime::LineSource& source_;
};

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
}

ExecutionStatus status_for(const OrchestratorState state) {
    switch (state) {
        case OrchestratorState::Completed:
            return ExecutionStatus::Success;
        case OrchestratorState::TimedOut:
            return ExecutionStatus::Timeout;
        case OrchestratorState::Cancelled:
            return ExecutionStatus::Cancelled;
        default:
            return ExecutionStatus::Failure;
    }
}

}  // namespace

Orchestrator::Orchestrator(OrchestratorDependencies deps, OrchestratorOptions options)
    : deps_(deps),
      options_(std::move(options)),
      execution_id_(options_.execution_id.value_or(core::config::generate_execution_id())),
      provisioner_(deps_.engine, options_.settings.image_name, options_.settings.image_tag,
                   options_.settings.build_context),
      monitor_(deps_.engine, runtime::LogClassifier(options_.settings.markers),
               options_.settings.log_tail_lines) {}

bool Orchestrator::is_allowed(const OrchestratorState from, const OrchestratorState to) {
    switch (from) {
        case OrchestratorState::Init:
            return to == OrchestratorState::WorkspaceReady || to == OrchestratorState::Failed ||
                   to == OrchestratorState::Cancelled;
        case OrchestratorState::WorkspaceReady:
            return to == OrchestratorState::ImageReady || to == OrchestratorState::Failed ||
                   to == OrchestratorState::Cancelled;
        case OrchestratorState::ImageReady:
            return to == OrchestratorState::ContainerRunning ||
                   to == OrchestratorState::Failed || to == OrchestratorState::Cancelled;
        case OrchestratorState::ContainerRunning:
            return protocol::is_terminal(to);
        case OrchestratorState::Completed:
        case OrchestratorState::Failed:
        case OrchestratorState::TimedOut:
        case OrchestratorState::Cancelled:
            return to == OrchestratorState::CleanedUp;
        default:
            return false;
    }
}

TerminalEvent Orchestrator::failed(ForgeError error) {
    TerminalEvent event;
    event.state = OrchestratorState::Failed;
    event.error = std::move(error);
    event.source = "orchestrator";
    return event;
}

TerminalEvent Orchestrator::cancelled(const std::string& source) {
    TerminalEvent event;
    event.state = OrchestratorState::Cancelled;
    event.error = ForgeError{ErrorCategory::Cancelled, "Execution cancelled by request.",
                             "execution_cancelled",
                             "Rerun the command to start a new execution."};
    event.source = source;
    return event;
}

core::errors::Status Orchestrator::advance(const OrchestratorState next,
                                           const std::string& note) {
    const OrchestratorState current = state_.load();
    if (!is_allowed(current, next)) {
        return ForgeError{ErrorCategory::Internal,
                          "Invalid state transition " + protocol::to_string(current) +
                              " -> " + protocol::to_string(next),
                          "invalid_state_transition"};
    }

    state_.store(next);
    LOG_INFO("Orchestrator: " + protocol::to_string(current) + " -> " +
             protocol::to_string(next) + (note.empty() ? "" : " (" + note + ")"));
    if (journal_ != nullptr) {
        auto written = journal_->write_transition(execution_id_, current, next, note);
        if (core::errors::is_error(written)) {
            LOG_WARN("Failed to journal transition: " +
                     core::errors::get_error(written).message);
        }
    }
    return core::errors::ok();
}

std::optional<TerminalEvent> Orchestrator::cancelled_before(
    const OrchestratorState next) const {
    if (!deps_.cancellation.cancelled()) {
        return std::nullopt;
    }
    LOG_WARN("Cancellation requested before " + protocol::to_string(next));
    return cancelled("cancel");
}

ExecutionResult Orchestrator::execute(const ExecutionRequest& request) {
    if (executed_.exchange(true)) {
        ExecutionResult rejected;
        rejected.execution_id = execution_id_;
        rejected.status = ExecutionStatus::Failure;
        rejected.error = ForgeError{ErrorCategory::Internal,
                                    "Orchestrator instances run a single execution.",
                                    "orchestrator_reused",
                                    "Create a new Orchestrator for each execution."};
        return rejected;
    }

    const auto started = std::chrono::steady_clock::now();
    core::logging::Logger::get().set_execution_id(execution_id_);
    LOG_INFO("Starting execution for idea: " + request.idea);

    CleanupScope cleanup_scope([this, &request] { cleanup(request); });

    TerminalEvent terminal = run_phases(request);
    auto entered = advance(terminal.state, terminal.source);
    if (core::errors::is_error(entered)) {
        LOG_ERROR(core::errors::get_error(entered).message);
        terminal = failed(core::errors::get_error(entered));
        state_.store(OrchestratorState::Failed);
    }

    cleanup_scope.run();
    auto cleaned = advance(OrchestratorState::CleanedUp);
    if (core::errors::is_error(cleaned)) {
        LOG_ERROR(core::errors::get_error(cleaned).message);
    }
    return finish(terminal, started);
}

TerminalEvent Orchestrator::run_phases(const ExecutionRequest& request) {
    if (is_blank(request.idea)) {
        return failed(ForgeError{ErrorCategory::Input, "Project idea cannot be empty.",
                                 "empty_idea", "Describe the project to generate."});
    }

    if (auto stop = cancelled_before(OrchestratorState::WorkspaceReady)) {
        return *stop;
    }
    workspace::WorkspaceManager workspaces(request.output_base_dir, options_.clock);
    auto layout = workspaces.create(request.idea);
    if (core::errors::is_error(layout)) {
        return failed(core::errors::get_error(layout));
    }
    layout_ = core::errors::take_value(layout);
    journal_ = std::make_unique<session::ExecutionJournal>(layout_->root);
    auto journalled = journal_->write_request(execution_id_, request);
    if (core::errors::is_error(journalled)) {
        LOG_WARN("Failed to journal request: " + core::errors::get_error(journalled).message);
    }
    auto ready = advance(OrchestratorState::WorkspaceReady, layout_->root.string());
    if (core::errors::is_error(ready)) {
        return failed(core::errors::get_error(ready));
    }

    auto prepared = prepare_session(request);
    if (core::errors::is_error(prepared)) {
        return failed(core::errors::get_error(prepared));
    }

    if (auto stop = cancelled_before(OrchestratorState::ImageReady)) {
        return *stop;
    }
    // The build can run for minutes; cancellation aborts it instead of
    // waiting for the next transition.
    auto build_cancel = std::make_shared<std::atomic_bool>(false);
    auto build_subscription =
        deps_.cancellation.subscribe([build_cancel] { build_cancel->store(true); });
    auto image = provisioner_.ensure(request.force_rebuild, build_cancel);
    build_subscription.reset();
    if (core::errors::is_error(image)) {
        if (core::errors::get_error(image).category == ErrorCategory::Cancelled) {
            LOG_WARN("Cancellation requested during image provisioning.");
            return cancelled("cancel");
        }
        return failed(core::errors::get_error(image));
    }
    const auto image_ref = core::errors::get_value(image);
    auto image_ready = advance(OrchestratorState::ImageReady,
                               image_ref.ref() + (image_ref.built ? " (built)" : " (cached)"));
    if (core::errors::is_error(image_ready)) {
        return failed(core::errors::get_error(image_ready));
    }

    if (auto stop = cancelled_before(OrchestratorState::ContainerRunning)) {
        return *stop;
    }
    auto handle = launch_container(request, image_ref);
    if (core::errors::is_error(handle)) {
        return failed(core::errors::get_error(handle));
    }
    const runtime::ContainerHandle* running = core::errors::get_value(handle);
    container_id_ = running->id;
    auto container_running = advance(OrchestratorState::ContainerRunning, running->name);
    if (core::errors::is_error(container_running)) {
        return failed(core::errors::get_error(container_running));
    }

    return monitor_container(request, *running);
}

core::errors::Status Orchestrator::prepare_session(const ExecutionRequest& request) {
    const auto analysis = deps_.analyzer.analyze(request.idea);
    agents_ = deps_.selector.select(request.idea, analysis, request.forced_agents);
    if (agents_.empty()) {
        LOG_INFO("No specialist agents selected.");
    } else {
        std::string joined;
        for (const auto& agent : agents_) {
            joined += (joined.empty() ? "" : ", ") + agent;
        }
        LOG_INFO("Selected agents: " + joined);
    }

    protocol::ExecutionContext context{execution_id_, request, *layout_, agents_};
    auto rendered = deps_.renderer.render(context, *layout_, agents_, analysis);
    if (core::errors::is_error(rendered)) {
        return core::errors::get_error(rendered);
    }
    LOG_DEBUG("Rendered configuration: " + core::errors::get_value(rendered).string());

    auto script = write_session_script(*layout_, request.idea, agents_,
                                       options_.settings.credential_env);
    if (core::errors::is_error(script)) {
        return core::errors::get_error(script);
    }
    session_command_ = core::errors::get_value(script).command;
    return core::errors::ok();
}

core::errors::Result<const runtime::ContainerHandle*> Orchestrator::launch_container(
    const ExecutionRequest& request, const runtime::ImageRef& image) {
    const auto& settings = options_.settings;
    runtime_ = std::make_unique<runtime::ContainerRuntime>(
        deps_.engine, policy::MountGuard(layout_->root), settings.cleanup_attempts);

    runtime::ContainerLaunch launch;
    launch.image = image.ref();
    launch.name = "forge-" + execution_id_;
    launch.mounts = {runtime::Mount{layout_->root, kContainerWorkspace, false}};
    launch.command = options_.command_override.value_or(session_command_);
    launch.working_dir = kContainerWorkspace;
    launch.user = settings.container_user;
    launch.network = settings.network;
    launch.labels = {{"forge.execution_id", execution_id_},
                     {"forge.workspace", layout_->name}};
    launch.env = {
        {"CLAUDE_MODEL", request.model, false},
        {"CLAUDE_AUTO_COMPACT", "false", false},
        {"CLAUDE_MAX_THINKING_TOKENS", std::to_string(settings.max_thinking_tokens), false},
        {"CLAUDE_CODE_WORKSPACE", kContainerWorkspace, false},
        {"CLAUDE_CODE_OUTPUT", kContainerOutput, false},
    };
    if (options_.credential_value.has_value() && !options_.credential_value->empty()) {
        launch.env.push_back({settings.credential_env, *options_.credential_value, true});
    } else {
        LOG_WARN("No " + settings.credential_env +
                 " found in environment. The session cannot authenticate.");
    }

    return runtime_->start(launch);
}

TerminalEvent Orchestrator::monitor_container(const ExecutionRequest& request,
                                              const runtime::ContainerHandle& handle) {
    auto stream = monitor_.stream(handle);
    if (core::errors::is_error(stream)) {
        return failed(core::errors::get_error(stream));
    }
    std::unique_ptr<runtime::LineSource> source = core::errors::take_value(stream);

    TerminalLatch latch;
    TimeoutGuard timeout(request.timeout);
    timeout.arm();
    LOG_INFO("Monitoring container output (timeout: " + request.timeout.describe() + ")");

    std::thread worker;
    WorkerJoin join(worker, *source);

    auto subscription = deps_.cancellation.subscribe([&latch, &source] {
        if (latch.try_set(cancelled("cancel"))) {
            LOG_WARN("Cancellation requested; stopping execution.");
        }
        source->interrupt();
    });

    worker = std::thread([this, &latch, &source] {
        const auto outcome = monitor_.watch(*source);
        if (outcome.end == runtime::WatchEnd::Interrupted) {
            return;
        }
        latch.try_set(classify_stream_end(outcome));
    });

    const TerminalEvent decided = timeout.guard(latch, [&source] { source->interrupt(); });
    subscription.reset();
    return decided;
}

TerminalEvent Orchestrator::classify_stream_end(const runtime::WatchOutcome& outcome) {
    TerminalEvent event;
    event.source = "monitor";
    switch (outcome.end) {
        case runtime::WatchEnd::Completed:
            event.state = OrchestratorState::Completed;
            return event;
        case runtime::WatchEnd::Failed:
            event.state = OrchestratorState::Failed;
            if (outcome.detail.empty()) {
                event.error = ForgeError{ErrorCategory::Unclassified,
                                         "Container reported a fatal error without detail.",
                                         "unclassified_failure",
                                         "Inspect the log tail for the cause."};
            } else {
                event.error = ForgeError{ErrorCategory::Execution, outcome.detail,
                                         "fatal_marker", "Inspect the log tail for context."};
            }
            return event;
        case runtime::WatchEnd::StreamError:
            event.state = OrchestratorState::Failed;
            event.error = outcome.error.value_or(
                ForgeError{ErrorCategory::Stream, "Log stream failed.", "stream_failed"});
            return event;
        default:
            break;
    }

    // The stream closed without a marker: the container's exit code decides,
    // but only once the container has stopped, so wait_exit cannot block.
    auto observed = runtime_->status();
    if (core::errors::is_error(observed)) {
        event.state = OrchestratorState::Failed;
        event.error = core::errors::get_error(observed);
        return event;
    }
    if (core::errors::get_value(observed) == runtime::ContainerStatus::Running) {
        event.state = OrchestratorState::Failed;
        event.error = ForgeError{ErrorCategory::Stream,
                                 "Log stream closed while the container is still running.",
                                 "stream_closed_early", "Inspect the container with docker logs."};
        return event;
    }
    auto exited = runtime_->wait_exit();
    if (core::errors::is_error(exited)) {
        event.state = OrchestratorState::Failed;
        event.error = core::errors::get_error(exited);
        return event;
    }
    const int exit_code = core::errors::get_value(exited);
    LOG_INFO("Container exited with code " + std::to_string(exit_code));
    if (exit_code == 0) {
        event.state = OrchestratorState::Completed;
        return event;
    }
    event.state = OrchestratorState::Failed;
    event.error = ForgeError{ErrorCategory::Unclassified,
                             "Container exited with code " + std::to_string(exit_code) +
                                 " without a completion marker.",
                             "container_exit_nonzero", "Inspect the log tail for the cause."};
    return event;
}

void Orchestrator::cleanup(const ExecutionRequest& request) {
    if (runtime_ == nullptr || runtime_->handle() == nullptr) {
        return;
    }
    runtime_->stop(options_.settings.stop_grace);
    if (request.keep_container) {
        LOG_INFO("Keeping container " + container_id_ + " for inspection.");
        return;
    }
    runtime_->remove();
}

ExecutionResult Orchestrator::finish(const TerminalEvent& terminal,
                                     const std::chrono::steady_clock::time_point started) {
    ExecutionResult result;
    result.execution_id = execution_id_;
    result.status = status_for(terminal.state);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    result.log_tail = monitor_.tail();
    result.container_id = container_id_;
    result.agents = agents_;
    result.error = terminal.error;
    if (result.error.has_value() && result.error->hint.empty()) {
        result.error->hint = "See the execution journal under " +
                             std::string(session::kJournalSubdir) +
                             " in the workspace for details.";
    }
    if (layout_.has_value()) {
        result.workspace_root = layout_->root;
        result.output_path = layout_->output_dir;
    }

    if (journal_ != nullptr) {
        auto final_written = journal_->write_final(result);
        if (core::errors::is_error(final_written)) {
            LOG_WARN("Failed to journal result: " +
                     core::errors::get_error(final_written).message);
        }
        auto result_written = journal_->write_result_file(result);
        if (core::errors::is_error(result_written)) {
            LOG_WARN("Failed to write result file: " +
                     core::errors::get_error(result_written).message);
        }
    }

    if (result.error.has_value()) {
        LOG_ERROR("Execution " + protocol::to_string(result.status) + " [" +
                  core::errors::to_string(result.error->category) + "/" +
                  result.error->code + "]: " + result.error->message);
    } else {
        LOG_INFO("Execution " + protocol::to_string(result.status) + " in " +
                 std::to_string(result.elapsed.count()) + " ms");
    }
    return result;
}

}  // namespace forge::orchestration
