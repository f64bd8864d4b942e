#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "collaborators/collaborators.hpp"
#include "core/config/settings.hpp"
#include "core/errors/forge_errors.hpp"
#include "orchestration/cancellation.hpp"
#include "orchestration/terminal_latch.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/execution_request.hpp"
#include "runtime/container_engine.hpp"
#include "runtime/container_runtime.hpp"
#include "runtime/image_provisioner.hpp"
#include "runtime/log_monitor.hpp"
#include "session/execution_journal.hpp"
#include "workspace/workspace_manager.hpp"

namespace forge::orchestration {

// Collaborators supplied by the caller. All of them must outlive the
// Orchestrator.
struct OrchestratorDependencies {
    runtime::ContainerEngine& engine;
    collaborators::IdeaAnalyzer& analyzer;
    collaborators::AgentSelector& selector;
    collaborators::ConfigRenderer& renderer;
    CancellationSource& cancellation;
};

struct OrchestratorOptions {
    core::config::Settings settings;
    // Injected into the container environment only.
    std::optional<std::string> credential_value;
    std::optional<std::vector<std::string>> command_override;
    std::optional<std::string> execution_id;
    workspace::WallClock clock = [] { return std::chrono::system_clock::now(); };
};

// Drives one execution from INIT to CLEANED_UP:
//
//   INIT -> WORKSPACE_READY -> IMAGE_READY -> CONTAINER_RUNNING
//        -> {COMPLETED, FAILED, TIMED_OUT, CANCELLED} -> CLEANED_UP
//
// Any step may fail straight to FAILED. While the container runs, the log
// consumer, the timeout clock and external cancellation race on a
// TerminalLatch; the first to report decides the outcome. Container cleanup
// runs exactly once on every path.
class Orchestrator {
public:
    Orchestrator(OrchestratorDependencies deps, OrchestratorOptions options);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Runs the execution. A second call returns a failure without side
    // effects.
    protocol::ExecutionResult execute(const protocol::ExecutionRequest& request);

    protocol::OrchestratorState state() const { return state_.load(); }
    const std::string& execution_id() const { return execution_id_; }

private:
    TerminalEvent run_phases(const protocol::ExecutionRequest& request);
    core::errors::Status prepare_session(const protocol::ExecutionRequest& request);
    core::errors::Result<const runtime::ContainerHandle*> launch_container(
        const protocol::ExecutionRequest& request, const runtime::ImageRef& image);
    TerminalEvent monitor_container(const protocol::ExecutionRequest& request,
                                    const runtime::ContainerHandle& handle);
    TerminalEvent classify_stream_end(const runtime::WatchOutcome& outcome);

    core::errors::Status advance(protocol::OrchestratorState next,
                                 const std::string& note = "");
    std::optional<TerminalEvent> cancelled_before(protocol::OrchestratorState next) const;
    void cleanup(const protocol::ExecutionRequest& request);
    protocol::ExecutionResult finish(const TerminalEvent& terminal,
                                     std::chrono::steady_clock::time_point started);

    static bool is_allowed(protocol::OrchestratorState from, protocol::OrchestratorState to);
    static TerminalEvent failed(core::errors::ForgeError error);
    static TerminalEvent cancelled(const std::string& source);

    OrchestratorDependencies deps_;
    OrchestratorOptions options_;
    std::string execution_id_;
    std::atomic_bool executed_{false};
    std::atomic<protocol::OrchestratorState> state_{protocol::OrchestratorState::Init};

    runtime::ImageProvisioner provisioner_;
    runtime::LogMonitor monitor_;
    std::unique_ptr<runtime::ContainerRuntime> runtime_;
    std::unique_ptr<session::ExecutionJournal> journal_;
    std::optional<protocol::WorkspaceLayout> layout_;
    std::vector<std::string> agents_;
    std::vector<std::string> session_command_;
    std::string container_id_;
};

}  // namespace forge::orchestration
