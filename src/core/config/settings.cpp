#include "core/config/settings.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace forge::core::config {

using errors::ErrorCategory;
using errors::ForgeError;
using nlohmann::json;

namespace {

ForgeError invalid_settings(const std::string& message) {
    return ForgeError{ErrorCategory::Input, message, "invalid_settings",
                      "Fix the value in the settings file or environment."};
}

std::vector<std::string> string_list(const json& node) {
    std::vector<std::string> out;
    for (const auto& item : node) {
        out.push_back(item.get<std::string>());
    }
    return out;
}

void overlay(Settings& settings, const json& doc,
             const std::filesystem::path& base_dir) {
    if (doc.contains("image")) {
        const auto& image = doc.at("image");
        settings.image_name = image.value("name", settings.image_name);
        settings.image_tag = image.value("tag", settings.image_tag);
        if (image.contains("build_context")) {
            std::filesystem::path context =
                image.at("build_context").get<std::string>();
            settings.build_context =
                context.is_relative() ? base_dir / context : context;
        }
        if (image.contains("build_timeout_seconds")) {
            settings.build_timeout = std::chrono::seconds(
                image.at("build_timeout_seconds").get<std::int64_t>());
        }
    }

    if (doc.contains("container")) {
        const auto& container = doc.at("container");
        settings.container_user = container.value("user", settings.container_user);
        settings.network = container.value("network", settings.network);
        settings.cleanup_attempts =
            container.value("cleanup_attempts", settings.cleanup_attempts);
        if (container.contains("stop_grace_seconds")) {
            settings.stop_grace = std::chrono::seconds(
                container.at("stop_grace_seconds").get<std::int64_t>());
        }
    }

    if (doc.contains("execution")) {
        const auto& execution = doc.at("execution");
        settings.log_tail_lines =
            execution.value("log_tail_lines", settings.log_tail_lines);
        settings.max_thinking_tokens =
            execution.value("max_thinking_tokens", settings.max_thinking_tokens);
        settings.credential_env =
            execution.value("credential_env", settings.credential_env);
    }

    if (doc.contains("markers")) {
        const auto& markers = doc.at("markers");
        if (markers.contains("completion")) {
            settings.markers.completion = string_list(markers.at("completion"));
        }
        if (markers.contains("fatal")) {
            settings.markers.fatal = string_list(markers.at("fatal"));
        }
    }
}

}  // namespace

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

errors::Result<Settings> load_settings_file(const std::filesystem::path& path,
                                            Settings base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ForgeError{ErrorCategory::Input,
                          "Unable to open settings file: " + path.string(),
                          "settings_file_unreadable",
                          "Check the --config path."};
    }

    try {
        const json doc = json::parse(in);
        if (!doc.is_object()) {
            return invalid_settings("Settings file must contain a JSON object: " +
                                    path.string());
        }
        overlay(base, doc, path.parent_path());
    } catch (const json::exception& e) {
        return invalid_settings("Malformed settings file " + path.string() + ": " +
                                e.what());
    }

    return base;
}

errors::Result<Settings> apply_environment(Settings base, const EnvLookup& env) {
    if (auto value = env("FORGE_IMAGE")) {
        base.image_name = *value;
    }
    if (auto value = env("FORGE_IMAGE_TAG")) {
        base.image_tag = *value;
    }
    if (auto value = env("FORGE_BUILD_CONTEXT")) {
        base.build_context = *value;
    }
    if (auto value = env("FORGE_CONTAINER_USER")) {
        base.container_user = *value;
    }
    if (auto value = env("FORGE_STOP_GRACE_SECONDS")) {
        std::int64_t seconds = 0;
        const char* begin = value->data();
        const char* end = value->data() + value->size();
        auto [ptr, ec] = std::from_chars(begin, end, seconds);
        if (ec != std::errc() || ptr != end) {
            return invalid_settings("FORGE_STOP_GRACE_SECONDS is not an integer: " +
                                    *value);
        }
        base.stop_grace = std::chrono::seconds(seconds);
    }
    return base;
}

errors::Status validate_settings(const Settings& settings) {
    if (settings.image_name.empty() || settings.image_tag.empty()) {
        return invalid_settings("Image name and tag must not be empty.");
    }
    if (settings.stop_grace.count() < 0 || settings.stop_grace.count() > 300) {
        return invalid_settings("Stop grace period must be between 0 and 300 seconds.");
    }
    if (settings.cleanup_attempts < 1 || settings.cleanup_attempts > 10) {
        return invalid_settings("Cleanup attempts must be between 1 and 10.");
    }
    if (settings.build_timeout.count() <= 0) {
        return invalid_settings("Build timeout must be positive.");
    }
    if (settings.log_tail_lines == 0) {
        return invalid_settings("Log tail must keep at least one line.");
    }
    if (settings.max_thinking_tokens < 1000 || settings.max_thinking_tokens > 100000) {
        return invalid_settings("Max thinking tokens must be between 1000 and 100000.");
    }
    if (settings.credential_env.empty()) {
        return invalid_settings("Credential environment variable name must not be empty.");
    }
    if (settings.markers.completion.empty()) {
        return invalid_settings("At least one completion marker is required.");
    }
    return errors::ok();
}

}  // namespace forge::core::config
