#include "workspace/workspace_manager.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace forge::workspace {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using protocol::WorkspaceLayout;

namespace {

constexpr std::size_t kSuffixSourceChars = 30;

ForgeError filesystem_error(const std::string& message, const std::string& code,
                            const std::error_code& ec) {
    std::string detail = message;
    if (ec) {
        detail += " (" + ec.message() + ")";
    }
    return ForgeError{ErrorCategory::Filesystem, detail, code,
                      "Check that the output directory exists and is writable."};
}

}  // namespace

WorkspaceManager::WorkspaceManager(std::filesystem::path output_base_dir,
                                   WallClock clock)
    : workspaces_root_(std::move(output_base_dir) / kWorkspacesDir),
      clock_(std::move(clock)) {}

std::string WorkspaceManager::safe_suffix(const std::string& idea) {
    std::string suffix;
    const std::string head = idea.substr(0, kSuffixSourceChars);
    for (const char c : head) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_') {
            suffix.push_back(c);
        }
    }

    const auto first = suffix.find_first_not_of("-_");
    if (first == std::string::npos) {
        return "project";
    }
    const auto last = suffix.find_last_not_of("-_");
    return suffix.substr(first, last - first + 1);
}

std::string WorkspaceManager::workspace_name(
    const std::string& idea, const std::chrono::system_clock::time_point now) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream name;
    name << std::put_time(&local, "%Y%m%d_%H%M%S") << "_" << safe_suffix(idea);
    return name.str();
}

core::errors::Result<WorkspaceLayout> WorkspaceManager::create(
    const std::string& idea) const {
    std::error_code ec;
    std::filesystem::create_directories(workspaces_root_, ec);
    if (ec) {
        return filesystem_error(
            "Unable to create workspaces directory: " + workspaces_root_.string(),
            "workspace_base_unwritable", ec);
    }

    WorkspaceLayout layout;
    layout.name = workspace_name(idea, clock_());
    layout.root = workspaces_root_ / layout.name;
    layout.config_dir = layout.root / kConfigSubdir;
    layout.output_dir = layout.root / kOutputSubdir;

    // create_directory reports false for an existing path; a workspace is
    // never shared with an earlier run.
    const bool created = std::filesystem::create_directory(layout.root, ec);
    if (ec) {
        return filesystem_error("Unable to create workspace: " + layout.root.string(),
                                "workspace_create_failed", ec);
    }
    if (!created) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Workspace already exists: " + layout.root.string(),
                          "workspace_exists",
                          "Retry in a moment; workspace names include a timestamp."};
    }

    for (const auto& dir : {layout.config_dir, layout.output_dir}) {
        std::filesystem::create_directory(dir, ec);
        if (ec) {
            return filesystem_error("Unable to create directory: " + dir.string(),
                                    "workspace_create_failed", ec);
        }
    }

    LOG_INFO("WorkspaceManager: workspace prepared at " + layout.root.string());
    return layout;
}

}  // namespace forge::workspace
