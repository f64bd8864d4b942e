#pragma once

#include "collaborators/collaborators.hpp"

namespace forge::collaborators {

class NullIdeaAnalyzer : public IdeaAnalyzer {
public:
    AnalysisResult analyze(const std::string& idea) override;
};

// Returns the forced agents unchanged.
class ForcedAgentSelector : public AgentSelector {
public:
    std::vector<std::string> select(const std::string& idea,
                                    const AnalysisResult& analysis,
                                    const std::vector<std::string>& forced) override;
};

// Writes <config_dir>/context.json describing the run.
class ContextFileRenderer : public ConfigRenderer {
public:
    core::errors::Result<std::filesystem::path> render(
        const protocol::ExecutionContext& context,
        const protocol::WorkspaceLayout& layout,
        const std::vector<std::string>& agents,
        const AnalysisResult& analysis) override;
};

}  // namespace forge::collaborators
