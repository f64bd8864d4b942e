#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/execution_request.hpp"

namespace forge::workspace {

using WallClock = std::function<std::chrono::system_clock::time_point()>;

inline constexpr const char* kWorkspacesDir = "forge_output";
inline constexpr const char* kConfigSubdir = ".claude";
inline constexpr const char* kOutputSubdir = "output";

class WorkspaceManager {
public:
    explicit WorkspaceManager(
        std::filesystem::path output_base_dir,
        WallClock clock = [] { return std::chrono::system_clock::now(); });

    // Creates <base>/forge_output/<timestamp>_<suffix> with its config and
    // output subdirectories. Fails if the directory already exists.
    core::errors::Result<protocol::WorkspaceLayout> create(
        const std::string& idea) const;

    static std::string workspace_name(const std::string& idea,
                                      std::chrono::system_clock::time_point now);
    static std::string safe_suffix(const std::string& idea);

    const std::filesystem::path& workspaces_root() const { return workspaces_root_; }

private:
    std::filesystem::path workspaces_root_;
    WallClock clock_;
};

}  // namespace forge::workspace
