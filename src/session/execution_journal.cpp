#include "session/execution_journal.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace forge::session {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;

namespace {

// Idea text and container output are arbitrary bytes; invalid UTF-8 is
// written as U+FFFD instead of failing the whole record.
std::string serialize(const json& value, const int indent = -1) {
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json request_to_json(const protocol::ExecutionRequest& request) {
    json payload;
    payload["idea"] = request.idea;
    payload["model"] = request.model;
    payload["timeout"] = request.timeout.describe();
    payload["keep_container"] = request.keep_container;
    payload["force_rebuild"] = request.force_rebuild;
    payload["forced_agents"] = request.forced_agents;
    payload["output_base_dir"] = request.output_base_dir.string();
    payload["template_vars"] = request.template_vars;
    return payload;
}

json error_to_json(const core::errors::ForgeError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    payload["hint"] = error.hint;
    return payload;
}

json result_to_json(const protocol::ExecutionResult& result) {
    json payload;
    payload["execution_id"] = result.execution_id;
    payload["status"] = protocol::to_string(result.status);
    payload["workspace"] = result.workspace_root.string();
    payload["output_path"] = result.output_path.string();
    payload["elapsed_ms"] = result.elapsed.count();
    payload["container_id"] = result.container_id;
    payload["agents"] = result.agents;
    payload["log_tail"] = result.log_tail;
    payload["error"] = result.error.has_value() ? error_to_json(*result.error) : json(nullptr);
    return payload;
}

}  // namespace

ExecutionJournal::ExecutionJournal(std::filesystem::path workspace_root,
                                   std::filesystem::path journal_subdir)
    : workspace_root_(std::move(workspace_root)),
      journal_subdir_(std::move(journal_subdir)) {}

core::errors::Result<std::filesystem::path> ExecutionJournal::journal_path(
    const std::string& execution_id) const {
    if (execution_id.empty()) {
        return ForgeError{ErrorCategory::Input, "Execution ID cannot be empty.",
                          "invalid_execution_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Workspace root is not a directory: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto journal_dir = workspace_root_ / journal_subdir_;
    std::filesystem::create_directories(journal_dir, ec);
    if (ec) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Unable to create journal directory: " + journal_dir.string(),
                          "journal_dir_create_failed"};
    }
    return journal_dir / (execution_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> ExecutionJournal::append_event(
    const std::string& execution_id, const std::string& event_json) const {
    auto path_result = journal_path(execution_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Unable to open journal file: " + path.string(),
                          "journal_open_failed"};
    }
    out << event_json << "\n";
    if (!out.good()) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Unable to write journal event: " + path.string(),
                          "journal_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_request(
    const std::string& execution_id, const protocol::ExecutionRequest& request) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "request";
    event["execution_id"] = execution_id;
    event["payload"] = request_to_json(request);
    return append_event(execution_id, serialize(event));
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_transition(
    const std::string& execution_id, const protocol::OrchestratorState from,
    const protocol::OrchestratorState to, const std::string& note) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "transition";
    event["execution_id"] = execution_id;
    event["payload"] = {{"from", protocol::to_string(from)},
                        {"to", protocol::to_string(to)},
                        {"note", note}};
    return append_event(execution_id, serialize(event));
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_final(
    const protocol::ExecutionResult& result) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "final";
    event["execution_id"] = result.execution_id;
    event["payload"] = result_to_json(result);
    return append_event(result.execution_id, serialize(event));
}

core::errors::Result<std::filesystem::path> ExecutionJournal::write_result_file(
    const protocol::ExecutionResult& result) const {
    const auto path = workspace_root_ / kResultFileName;
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Unable to open result file: " + path.string(),
                          "result_open_failed"};
    }
    out << serialize(result_to_json(result), 2) << "\n";
    if (!out.good()) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Unable to write result file: " + path.string(),
                          "result_write_failed"};
    }
    return path;
}

}  // namespace forge::session
