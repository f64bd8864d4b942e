#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"

namespace forge::protocol {

enum class ExecutionStatus {
    Success,
    Timeout,
    Failure,
    Cancelled
};

enum class OrchestratorState {
    Init,
    WorkspaceReady,
    ImageReady,
    ContainerRunning,
    Completed,
    Failed,
    TimedOut,
    Cancelled,
    CleanedUp
};

struct ExecutionResult {
    std::string execution_id;
    ExecutionStatus status = ExecutionStatus::Failure;
    std::filesystem::path workspace_root;
    std::filesystem::path output_path;
    std::chrono::milliseconds elapsed{0};
    std::vector<std::string> log_tail;
    std::string container_id;
    std::vector<std::string> agents;
    std::optional<core::errors::ForgeError> error;
};

inline std::string to_string(const ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Success:
            return "success";
        case ExecutionStatus::Timeout:
            return "timeout";
        case ExecutionStatus::Failure:
            return "failure";
        case ExecutionStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

inline std::string to_string(const OrchestratorState state) {
    switch (state) {
        case OrchestratorState::Init:
            return "INIT";
        case OrchestratorState::WorkspaceReady:
            return "WORKSPACE_READY";
        case OrchestratorState::ImageReady:
            return "IMAGE_READY";
        case OrchestratorState::ContainerRunning:
            return "CONTAINER_RUNNING";
        case OrchestratorState::Completed:
            return "COMPLETED";
        case OrchestratorState::Failed:
            return "FAILED";
        case OrchestratorState::TimedOut:
            return "TIMED_OUT";
        case OrchestratorState::Cancelled:
            return "CANCELLED";
        case OrchestratorState::CleanedUp:
            return "CLEANED_UP";
        default:
            return "UNKNOWN";
    }
}

inline bool is_terminal(const OrchestratorState state) {
    return state == OrchestratorState::Completed ||
           state == OrchestratorState::Failed ||
           state == OrchestratorState::TimedOut ||
           state == OrchestratorState::Cancelled;
}

// Process exit status for a finished execution.
inline int to_exit_code(const ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Success:
            return 0;
        case ExecutionStatus::Failure:
            return 1;
        case ExecutionStatus::Timeout:
            return 124;
        case ExecutionStatus::Cancelled:
            return 130;
        default:
            return 1;
    }
}

}  // namespace forge::protocol
