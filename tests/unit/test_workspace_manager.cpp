#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "temp_dir.hpp"
#include "workspace/workspace_manager.hpp"

namespace {

using forge::core::errors::ErrorCategory;
using forge::core::errors::get_error;
using forge::core::errors::get_value;
using forge::core::errors::is_error;
using forge::testing::TempDir;
using forge::workspace::WorkspaceManager;

std::chrono::system_clock::time_point fixed_time() {
    std::tm local{};
    local.tm_year = 2025 - 1900;
    local.tm_mon = 2;
    local.tm_mday = 14;
    local.tm_hour = 9;
    local.tm_min = 5;
    local.tm_sec = 7;
    local.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&local));
}

TEST(WorkspaceManagerTest, NameCombinesTimestampAndSafeSuffix) {
    const auto name = WorkspaceManager::workspace_name("todo app with auth", fixed_time());
    EXPECT_EQ(name, "20250314_090507_todoappwithauth");
}

TEST(WorkspaceManagerTest, SuffixUsesFirstThirtyCharactersOnly) {
    const std::string idea = "abcdefghijklmnopqrstuvwxyz0123456789";
    EXPECT_EQ(WorkspaceManager::safe_suffix(idea), "abcdefghijklmnopqrstuvwxyz0123");
}

TEST(WorkspaceManagerTest, SuffixStripsEdgeSeparatorsAndFallsBack) {
    EXPECT_EQ(WorkspaceManager::safe_suffix("--my_app--"), "my_app");
    EXPECT_EQ(WorkspaceManager::safe_suffix("!!! ???"), "project");
    EXPECT_EQ(WorkspaceManager::safe_suffix(""), "project");
}

TEST(WorkspaceManagerTest, CreatesRootConfigAndOutputDirectories) {
    TempDir base("workspace");
    WorkspaceManager manager(base.root(), fixed_time);

    auto result = manager.create("todo app");
    ASSERT_FALSE(is_error(result));
    const auto& layout = get_value(result);
    EXPECT_EQ(layout.root, base.root() / "forge_output" / layout.name);
    EXPECT_TRUE(std::filesystem::is_directory(layout.root));
    EXPECT_TRUE(std::filesystem::is_directory(layout.config_dir));
    EXPECT_TRUE(std::filesystem::is_directory(layout.output_dir));
    EXPECT_EQ(layout.config_dir.filename(), ".claude");
    EXPECT_EQ(layout.output_dir.filename(), "output");
}

TEST(WorkspaceManagerTest, NeverReusesAnExistingWorkspace) {
    TempDir base("workspace");
    WorkspaceManager manager(base.root(), fixed_time);

    auto first = manager.create("todo app");
    ASSERT_FALSE(is_error(first));
    auto second = manager.create("todo app");
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).category, ErrorCategory::Filesystem);
    EXPECT_EQ(get_error(second).code, "workspace_exists");
}

TEST(WorkspaceManagerTest, FailsWhenBaseIsNotWritable) {
    TempDir base("workspace");
    forge::testing::write_file(base.root() / "blocker", "file, not a directory");
    WorkspaceManager manager(base.root() / "blocker", fixed_time);

    auto result = manager.create("todo app");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Filesystem);
}

}  // namespace
