#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "session/execution_journal.hpp"
#include "temp_dir.hpp"

namespace {

using forge::core::errors::ErrorCategory;
using forge::core::errors::ForgeError;
using forge::core::errors::get_error;
using forge::core::errors::get_value;
using forge::core::errors::is_error;
using forge::protocol::ExecutionResult;
using forge::protocol::ExecutionStatus;
using forge::protocol::OrchestratorState;
using forge::session::ExecutionJournal;
using forge::testing::TempDir;
using forge::testing::read_file;

std::vector<nlohmann::json> read_events(const std::filesystem::path& path) {
    std::vector<nlohmann::json> events;
    std::istringstream lines(read_file(path));
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            events.push_back(nlohmann::json::parse(line));
        }
    }
    return events;
}

TEST(ExecutionJournalTest, AppendsEventsInOrder) {
    TempDir dir("journal");
    ExecutionJournal journal(dir.root());

    forge::protocol::ExecutionRequest request;
    request.idea = "a todo app with auth";
    ASSERT_FALSE(is_error(journal.write_request("exec-1", request)));
    ASSERT_FALSE(is_error(journal.write_transition("exec-1", OrchestratorState::Init,
                                                   OrchestratorState::WorkspaceReady)));
    auto path = journal.write_transition("exec-1", OrchestratorState::WorkspaceReady,
                                         OrchestratorState::Failed, "build failed");
    ASSERT_FALSE(is_error(path));
    EXPECT_EQ(get_value(path), dir.root() / ".forge_runs" / "exec-1.jsonl");

    const auto events = read_events(get_value(path));
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0]["event"], "request");
    EXPECT_EQ(events[0]["payload"]["idea"], "a todo app with auth");
    EXPECT_EQ(events[1]["payload"]["to"], "WORKSPACE_READY");
    EXPECT_EQ(events[2]["payload"]["note"], "build failed");
    EXPECT_TRUE(events[2].contains("ts_unix_ms"));
}

TEST(ExecutionJournalTest, ResultFileCarriesErrorDetails) {
    TempDir dir("journal");
    ExecutionJournal journal(dir.root());

    ExecutionResult result;
    result.execution_id = "exec-2";
    result.status = ExecutionStatus::Timeout;
    result.workspace_root = dir.root();
    result.elapsed = std::chrono::milliseconds(1500);
    result.log_tail = {"still working"};
    result.error = ForgeError{ErrorCategory::Timeout, "too slow", "execution_timeout", "raise it"};

    auto path = journal.write_result_file(result);
    ASSERT_FALSE(is_error(path));
    const auto parsed = nlohmann::json::parse(read_file(get_value(path)));
    EXPECT_EQ(parsed["status"], "timeout");
    EXPECT_EQ(parsed["elapsed_ms"], 1500);
    EXPECT_EQ(parsed["error"]["category"], "TimeoutExceeded");
    EXPECT_EQ(parsed["error"]["code"], "execution_timeout");
    EXPECT_EQ(parsed["log_tail"][0], "still working");
}

TEST(ExecutionJournalTest, SuccessHasNullError) {
    TempDir dir("journal");
    ExecutionJournal journal(dir.root());

    ExecutionResult result;
    result.execution_id = "exec-3";
    result.status = ExecutionStatus::Success;

    auto path = journal.write_final(result);
    ASSERT_FALSE(is_error(path));
    const auto events = read_events(get_value(path));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["event"], "final");
    EXPECT_TRUE(events[0]["payload"]["error"].is_null());
}

TEST(ExecutionJournalTest, InvalidUtf8IsReplacedNotRejected) {
    TempDir dir("journal");
    ExecutionJournal journal(dir.root());

    ExecutionResult result;
    result.execution_id = "exec-4";
    result.status = ExecutionStatus::Success;
    result.log_tail = {"caf\xe9 latin-1 output"};

    auto final_event = journal.write_final(result);
    ASSERT_FALSE(is_error(final_event));
    auto path = journal.write_result_file(result);
    ASSERT_FALSE(is_error(path));
    const auto parsed = nlohmann::json::parse(read_file(get_value(path)));
    EXPECT_EQ(parsed["log_tail"][0], "caf\xef\xbf\xbd latin-1 output");
}

TEST(ExecutionJournalTest, RejectsEmptyIdAndMissingWorkspace) {
    TempDir dir("journal");
    ExecutionJournal journal(dir.root());
    auto empty = journal.journal_path("");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).category, ErrorCategory::Input);

    ExecutionJournal missing(dir.root() / "absent");
    auto absent = missing.journal_path("exec-4");
    ASSERT_TRUE(is_error(absent));
    EXPECT_EQ(get_error(absent).category, ErrorCategory::Filesystem);
}

}  // namespace
