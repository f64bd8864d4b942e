#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "core/config/timeout_spec.hpp"

namespace forge::protocol {

    // Validated caller input for one execution
    struct ExecutionRequest {
        std::string idea;
        std::string model = "opus";
        core::config::TimeoutSpec timeout;  // unlimited unless set
        bool keep_container = false;
        bool force_rebuild = false;
        std::vector<std::string> forced_agents;
        std::filesystem::path output_base_dir = std::filesystem::current_path();
        std::map<std::string, std::string> template_vars;
        bool verbose = false;
    };

    // Per-run directory tree. Never reused across runs.
    struct WorkspaceLayout {
        std::string name;
        std::filesystem::path root;
        std::filesystem::path config_dir;
        std::filesystem::path output_dir;
    };

    // Everything known about a run once its workspace exists. Built once by
    // the orchestrator and passed by const reference afterwards.
    struct ExecutionContext {
        std::string execution_id;
        ExecutionRequest request;
        WorkspaceLayout workspace;
        std::vector<std::string> agents;
    };

} // namespace forge::protocol
