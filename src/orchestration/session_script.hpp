#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "protocol/execution_request.hpp"

namespace forge::orchestration {

inline constexpr const char* kContainerWorkspace = "/workspace";
inline constexpr const char* kContainerOutput = "/workspace/output";

struct SessionScript {
    std::filesystem::path script_path;
    std::filesystem::path prompt_path;
    std::vector<std::string> command;  // container command running the script
};

std::string build_prompt(const std::string& idea, const std::vector<std::string>& agents);

// Shell script run as the container command. It names the credential
// variable but never contains its value.
std::string build_startup_script(const std::string& credential_env);

// Writes startup.sh and prompt.txt into the workspace root.
core::errors::Result<SessionScript> write_session_script(
    const protocol::WorkspaceLayout& layout, const std::string& idea,
    const std::vector<std::string>& agents, const std::string& credential_env);

}  // namespace forge::orchestration
