#include "policy/mount_guard.hpp"

#include <cctype>
#include <set>
#include <system_error>
#include <utility>

namespace forge::policy {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

ForgeError invalid_launch(const std::string& message, const std::string& code) {
    return ForgeError{ErrorCategory::RuntimeStart, message, code,
                      "Check the workspace directory and container settings."};
}

}  // namespace

MountGuard::MountGuard(std::filesystem::path allowed_root)
    : allowed_root_(std::move(allowed_root)) {}

bool MountGuard::is_within_root(const std::filesystem::path& root,
                                const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

bool MountGuard::is_valid_env_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && first != '_') {
        return false;
    }
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) == 0 && uc != '_') {
            return false;
        }
    }
    return true;
}

core::errors::Result<std::vector<runtime::Mount>> MountGuard::validate_mounts(
    const std::vector<runtime::Mount>& mounts) const {
    std::error_code ec;
    const auto canonical_root = std::filesystem::weakly_canonical(allowed_root_, ec);
    if (ec) {
        return invalid_launch("Unable to resolve workspace root: " + allowed_root_.string(),
                              "invalid_workspace_root");
    }

    std::vector<runtime::Mount> resolved;
    std::set<std::string> targets;
    for (const auto& mount : mounts) {
        if (!std::filesystem::is_directory(mount.host_path, ec) || ec) {
            return invalid_launch("Mount source is not a directory: " +
                                      mount.host_path.string(),
                                  "invalid_mount_source");
        }
        const auto canonical_host = std::filesystem::weakly_canonical(mount.host_path, ec);
        if (ec) {
            return invalid_launch("Unable to resolve mount source: " +
                                      mount.host_path.string(),
                                  "invalid_mount_source");
        }
        if (!is_within_root(canonical_root, canonical_host)) {
            return invalid_launch("Mount source escapes workspace root: " +
                                      canonical_host.string(),
                                  "mount_outside_workspace");
        }

        const std::filesystem::path target(mount.container_path);
        if (!target.is_absolute() ||
            mount.container_path.find("..") != std::string::npos ||
            mount.container_path.find(':') != std::string::npos) {
            return invalid_launch("Mount target must be an absolute path: " +
                                      mount.container_path,
                                  "invalid_mount_target");
        }
        if (!targets.insert(mount.container_path).second) {
            return invalid_launch("Mount target bound twice: " + mount.container_path,
                                  "duplicate_mount_target");
        }

        resolved.push_back(runtime::Mount{canonical_host, mount.container_path,
                                          mount.read_only});
    }
    return resolved;
}

core::errors::Status MountGuard::validate_env(
    const std::vector<runtime::EnvVar>& env) const {
    std::set<std::string> names;
    for (const auto& var : env) {
        if (!is_valid_env_name(var.name)) {
            return invalid_launch("Invalid environment variable name: '" + var.name + "'",
                                  "invalid_env_name");
        }
        if (!names.insert(var.name).second) {
            return invalid_launch("Environment variable set twice: " + var.name,
                                  "duplicate_env_name");
        }
        if (var.value.find('\0') != std::string::npos) {
            // The value stays out of the message.
            return invalid_launch("Environment variable contains a NUL byte: " + var.name,
                                  "invalid_env_value");
        }
    }
    return core::errors::ok();
}

core::errors::Status MountGuard::validate_command(
    const std::vector<std::string>& command) const {
    if (command.empty() || command.front().empty()) {
        return invalid_launch("Container command cannot be empty.", "empty_command");
    }
    return core::errors::ok();
}

}  // namespace forge::policy
