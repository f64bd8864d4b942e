#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"

namespace forge::core::config {

// Text patterns that move an execution to a terminal state. Completion
// markers match anywhere in a line, fatal markers only at its start; both
// ignore letter case. Lines starting with "Error:" stay progress by default.
struct MarkerSet {
    std::vector<std::string> completion = {
        "Project generation complete",
        "All tasks completed",
        "Claude Code session ended",
        "Generation successful"};
    std::vector<std::string> fatal = {"FATAL:"};
};

struct Settings {
    std::string image_name = "forge-runtime";
    std::string image_tag = "latest";
    std::filesystem::path build_context = "docker";
    std::chrono::seconds build_timeout{1800};

    std::string container_user = "forge";
    std::string network = "bridge";
    std::chrono::seconds stop_grace{10};
    int cleanup_attempts = 2;

    std::size_t log_tail_lines = 50;
    std::uint32_t max_thinking_tokens = 32000;
    std::string credential_env = "ANTHROPIC_API_KEY";
    MarkerSet markers;

    std::string image_ref() const { return image_name + ":" + image_tag; }
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads variables from the real process environment.
EnvLookup process_environment();

// Overlays values from a JSON settings file. Relative paths in the file are
// resolved against the file's directory.
errors::Result<Settings> load_settings_file(const std::filesystem::path& path,
                                            Settings base = {});

// Overlays FORGE_IMAGE, FORGE_IMAGE_TAG, FORGE_BUILD_CONTEXT,
// FORGE_CONTAINER_USER and FORGE_STOP_GRACE_SECONDS.
errors::Result<Settings> apply_environment(Settings base, const EnvLookup& env);

errors::Status validate_settings(const Settings& settings);

}  // namespace forge::core::config
