#include "collaborators/default_collaborators.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace forge::collaborators {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;

AnalysisResult NullIdeaAnalyzer::analyze(const std::string& /*idea*/) {
    return AnalysisResult{};
}

std::vector<std::string> ForcedAgentSelector::select(
    const std::string& /*idea*/, const AnalysisResult& /*analysis*/,
    const std::vector<std::string>& forced) {
    return forced;
}

core::errors::Result<std::filesystem::path> ContextFileRenderer::render(
    const protocol::ExecutionContext& context,
    const protocol::WorkspaceLayout& layout,
    const std::vector<std::string>& agents,
    const AnalysisResult& analysis) {
    json payload;
    payload["execution_id"] = context.execution_id;
    payload["idea"] = context.request.idea;
    payload["model"] = context.request.model;
    payload["timeout"] = context.request.timeout.describe();
    payload["agents"] = agents;
    payload["analysis"] = {{"domains", analysis.domains},
                           {"technologies", analysis.technologies},
                           {"complexity", analysis.complexity}};
    payload["template_vars"] = context.request.template_vars;
    payload["workspace"] = {{"name", layout.name},
                            {"root", layout.root.string()},
                            {"output", layout.output_dir.string()}};

    const auto path = layout.config_dir / "context.json";
    std::ofstream out(path);
    if (!out.is_open()) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Unable to write configuration file: " + path.string(),
                          "config_write_failed",
                          "Check permissions on the output directory."};
    }
    out << payload.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Unable to write configuration file: " + path.string(),
                          "config_write_failed",
                          "Check free disk space and permissions on the output directory."};
    }
    return path;
}

}  // namespace forge::collaborators
