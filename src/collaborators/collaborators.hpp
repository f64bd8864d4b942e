#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "protocol/execution_request.hpp"

namespace forge::collaborators {

struct AnalysisResult {
    std::vector<std::string> domains;
    std::vector<std::string> technologies;
    std::string complexity = "unknown";
};

class IdeaAnalyzer {
public:
    virtual ~IdeaAnalyzer() = default;
    virtual AnalysisResult analyze(const std::string& idea) = 0;
};

class AgentSelector {
public:
    virtual ~AgentSelector() = default;
    virtual std::vector<std::string> select(const std::string& idea,
                                            const AnalysisResult& analysis,
                                            const std::vector<std::string>& forced) = 0;
};

// Writes the agent configuration for a run into its workspace and returns
// the path of the main file written.
class ConfigRenderer {
public:
    virtual ~ConfigRenderer() = default;
    virtual core::errors::Result<std::filesystem::path> render(
        const protocol::ExecutionContext& context,
        const protocol::WorkspaceLayout& layout,
        const std::vector<std::string>& agents,
        const AnalysisResult& analysis) = 0;
};

}  // namespace forge::collaborators
