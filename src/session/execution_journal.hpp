#pragma once

#include <filesystem>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/execution_request.hpp"

namespace forge::session {

inline constexpr const char* kJournalSubdir = ".forge_runs";
inline constexpr const char* kResultFileName = "execution.json";

// Append-only JSONL record of one execution, kept inside its workspace.
class ExecutionJournal {
public:
    explicit ExecutionJournal(std::filesystem::path workspace_root,
                              std::filesystem::path journal_subdir = kJournalSubdir);

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& execution_id, const protocol::ExecutionRequest& request) const;

    core::errors::Result<std::filesystem::path> write_transition(
        const std::string& execution_id, protocol::OrchestratorState from,
        protocol::OrchestratorState to, const std::string& note = "") const;

    core::errors::Result<std::filesystem::path> write_final(
        const protocol::ExecutionResult& result) const;

    // Writes the result as pretty-printed JSON to <workspace>/execution.json.
    core::errors::Result<std::filesystem::path> write_result_file(
        const protocol::ExecutionResult& result) const;

    core::errors::Result<std::filesystem::path> journal_path(
        const std::string& execution_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& execution_id, const std::string& event_json) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path journal_subdir_;
};

}  // namespace forge::session
