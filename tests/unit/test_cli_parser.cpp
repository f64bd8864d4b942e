#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/forge_errors.hpp"
#include "temp_dir.hpp"

namespace {

using forge::app::cli::CliInvocation;
using forge::app::cli::Command;
using forge::app::cli::parse_and_validate;
using forge::core::errors::ErrorCategory;
using forge::core::errors::get_error;
using forge::core::errors::get_value;
using forge::core::errors::is_error;

constexpr const char* kIdea = "a todo app with authentication";

forge::core::errors::Result<CliInvocation> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("forge_cli");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, HelpNeedsNoArguments) {
    auto result = parse_tokens({"--help"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, Command::Help);
}

TEST(CliParserTest, FailsWhenIdeaMissing) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_idea");
}

TEST(CliParserTest, FailsWhenIdeaTooShort) {
    auto result = parse_tokens({"run", "todo"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "idea_too_short");
}

TEST(CliParserTest, DefaultsForRun) {
    auto result = parse_tokens({"run", kIdea});
    ASSERT_FALSE(is_error(result));
    const auto& invocation = get_value(result);
    EXPECT_EQ(invocation.command, Command::Run);
    EXPECT_EQ(invocation.request.idea, kIdea);
    EXPECT_EQ(invocation.request.model, "opus");
    EXPECT_TRUE(invocation.request.timeout.unlimited());
    EXPECT_FALSE(invocation.request.keep_container);
    EXPECT_FALSE(invocation.request.force_rebuild);
    EXPECT_TRUE(invocation.request.forced_agents.empty());
}

TEST(CliParserTest, ParsesAllRunFlags) {
    auto result = parse_tokens({"run", kIdea, "-m", "haiku", "--timeout", "30m",
                                "--agents", "backend-dev, tester", "--keep-container",
                                "--no-cache", "--var", "name=todo", "-v"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result).request;
    EXPECT_EQ(req.model, "haiku");
    ASSERT_FALSE(req.timeout.unlimited());
    EXPECT_EQ(*req.timeout.limit, std::chrono::seconds(1800));
    EXPECT_EQ(req.forced_agents, (std::vector<std::string>{"backend-dev", "tester"}));
    EXPECT_TRUE(req.keep_container);
    EXPECT_TRUE(req.force_rebuild);
    EXPECT_EQ(req.template_vars.at("name"), "todo");
    EXPECT_TRUE(get_value(result).verbose);
}

TEST(CliParserTest, AutoAgentsMeansNoForcedAgents) {
    auto result = parse_tokens({"run", kIdea, "--agents", "auto"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).request.forced_agents.empty());
}

TEST(CliParserTest, RejectsUnknownModel) {
    auto result = parse_tokens({"run", kIdea, "--model", "gpt-4"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_model");
}

TEST(CliParserTest, RejectsBadTimeout) {
    auto result = parse_tokens({"run", kIdea, "--timeout", "soon"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
}

TEST(CliParserTest, UnlimitedTimeoutSentinel) {
    auto result = parse_tokens({"run", kIdea, "-t", "unlimited"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).request.timeout.unlimited());
}

TEST(CliParserTest, RejectsMissingFlagValue) {
    auto result = parse_tokens({"run", kIdea, "--model"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, RejectsUnknownFlag) {
    auto result = parse_tokens({"run", kIdea, "--turbo"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, RejectsSecondPositional) {
    auto result = parse_tokens({"run", "a todo app", "with auth"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_argument");
}

TEST(CliParserTest, RejectsMalformedTemplateVar) {
    auto result = parse_tokens({"run", kIdea, "--var", "=value"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_template_var");
}

TEST(CliParserTest, OutputDirMustExistAndIsCanonicalized) {
    forge::testing::TempDir dir("cli_output");
    auto ok = parse_tokens({"run", kIdea, "-o", (dir.root() / ".").string()});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).request.output_base_dir, std::filesystem::canonical(dir.root()));

    auto missing = parse_tokens({"run", kIdea, "-o", (dir.root() / "absent").string()});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_path");
}

TEST(CliParserTest, DoctorAcceptsOnlyEnvironmentFlags) {
    forge::testing::TempDir dir("cli_doctor");
    auto ok = parse_tokens({"doctor", "--output-dir", dir.root().string(), "--verbose"});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).command, Command::Doctor);
    ASSERT_TRUE(get_value(ok).output_dir.has_value());

    auto bad = parse_tokens({"doctor", "--model", "opus"});
    ASSERT_TRUE(is_error(bad));
    EXPECT_EQ(get_error(bad).code, "unexpected_argument");
}

}  // namespace
