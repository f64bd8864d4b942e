#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/line_source.hpp"

namespace {

using forge::core::errors::ErrorCategory;
using forge::core::errors::get_error;
using forge::core::errors::get_value;
using forge::core::errors::is_error;
using forge::core::errors::take_value;
using forge::runtime::ProcessLineSource;

std::unique_ptr<ProcessLineSource> spawn_shell(const std::string& script) {
    auto spawned = ProcessLineSource::spawn({"/bin/sh", "-c", script});
    if (is_error(spawned)) {
        return nullptr;
    }
    return take_value(spawned);
}

std::vector<std::string> drain(ProcessLineSource& source) {
    std::vector<std::string> lines;
    while (true) {
        auto next = source.next_line();
        if (is_error(next) || !get_value(next).has_value()) {
            return lines;
        }
        lines.push_back(*get_value(next));
    }
}

TEST(LineSourceTest, YieldsLinesInOrderAcrossStreams) {
    auto source = spawn_shell("echo one; echo two 1>&2; printf 'three\\r\\n'; printf 'four'");
    ASSERT_NE(source, nullptr);

    const auto lines = drain(*source);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "three");
    EXPECT_EQ(lines[3], "four");
    EXPECT_EQ(source->exit_code(), 0);
}

TEST(LineSourceTest, OverlongOutputIsSplitAtLineLimit) {
    auto source = spawn_shell("head -c 200000 /dev/zero | tr '\\000' 'x'; echo; echo after");
    ASSERT_NE(source, nullptr);

    const auto lines = drain(*source);
    ASSERT_GE(lines.size(), 2u);
    std::size_t total = 0;
    for (std::size_t i = 0; i + 1 < lines.size(); ++i) {
        EXPECT_LE(lines[i].size(), ProcessLineSource::kMaxLineBytes);
        total += lines[i].size();
    }
    EXPECT_EQ(total, 200000u);
    EXPECT_EQ(lines.back(), "after");
}

TEST(LineSourceTest, NonZeroExitIsReportedAsStreamError) {
    auto source = spawn_shell("echo partial; exit 4");
    ASSERT_NE(source, nullptr);

    auto first = source->next_line();
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(*get_value(first), "partial");

    auto end = source->next_line();
    ASSERT_TRUE(is_error(end));
    EXPECT_EQ(get_error(end).category, ErrorCategory::Stream);
    EXPECT_EQ(get_error(end).code, "stream_exit_nonzero");
    EXPECT_EQ(source->exit_code(), 4);
}

TEST(LineSourceTest, InterruptUnblocksPendingRead) {
    auto source = spawn_shell("echo ready; sleep 30");
    ASSERT_NE(source, nullptr);

    auto first = source->next_line();
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(*get_value(first), "ready");

    std::thread interrupter([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        source->interrupt();
    });
    const auto started = std::chrono::steady_clock::now();
    auto next = source->next_line();
    interrupter.join();

    ASSERT_FALSE(is_error(next));
    EXPECT_FALSE(get_value(next).has_value());
    EXPECT_TRUE(source->interrupted());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(LineSourceTest, InterruptIsIdempotent) {
    auto source = spawn_shell("sleep 30");
    ASSERT_NE(source, nullptr);
    source->interrupt();
    source->interrupt();
    auto next = source->next_line();
    ASSERT_FALSE(is_error(next));
    EXPECT_FALSE(get_value(next).has_value());
}

}  // namespace
