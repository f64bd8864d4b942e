#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "runtime/container_engine.hpp"

namespace forge::policy {

// Checks a container launch request before it reaches the engine. Host
// mounts must be existing directories inside `allowed_root`.
class MountGuard {
public:
    explicit MountGuard(std::filesystem::path allowed_root);

    // Returns the mounts with canonical host paths.
    core::errors::Result<std::vector<runtime::Mount>> validate_mounts(
        const std::vector<runtime::Mount>& mounts) const;

    core::errors::Status validate_env(const std::vector<runtime::EnvVar>& env) const;

    core::errors::Status validate_command(const std::vector<std::string>& command) const;

    static bool is_valid_env_name(const std::string& name);

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    std::filesystem::path allowed_root_;
};

}  // namespace forge::policy
