#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/docker_cli_engine.hpp"
#include "temp_dir.hpp"

namespace {

using forge::core::errors::ErrorCategory;
using forge::core::errors::get_error;
using forge::core::errors::get_value;
using forge::core::errors::is_error;
using forge::core::errors::take_value;
using forge::runtime::ContainerSpec;
using forge::runtime::ContainerStatus;
using forge::runtime::DockerCliEngine;
using forge::runtime::DockerCliOptions;
using forge::runtime::EnvVar;
using forge::runtime::Mount;
using forge::testing::TempDir;
using forge::testing::write_file;

// Stand-in docker client. `run` succeeds only when the secret arrives
// through the environment.
constexpr const char* kFakeDocker = R"(#!/bin/sh
case "$1" in
  version) echo "24.0.7" ;;
  image)
    if [ "$5" = "present:latest" ]; then echo "sha256:abc"; exit 0; fi
    echo "Error: No such image: $5" >&2; exit 1 ;;
  build)
    if [ "$3" = "slow:latest" ]; then echo "step 1/9"; sleep 30; exit 0; fi
    echo "step 1/2" ; echo "failed to solve: missing base" >&2; exit 1 ;;
  run)
    if [ "$FORGE_TEST_SECRET" = "s3cret-value" ]; then echo "c0ffee1234567890"; exit 0; fi
    echo "secret missing" >&2; exit 125 ;;
  logs) echo "line one"; echo "line two" ;;
  inspect) echo "exited" ;;
  wait) echo "7" ;;
  stop|kill|rm) echo "$2" ;;
  *) exit 2 ;;
esac
)";

class DockerCliEngineTest : public ::testing::Test {
protected:
    DockerCliEngineTest() : dir_("docker_cli") {
        binary_ = dir_.root() / "docker";
        write_file(binary_, kFakeDocker);
        std::filesystem::permissions(binary_, std::filesystem::perms::owner_all);
    }

    DockerCliEngine engine() const {
        DockerCliOptions options;
        options.binary = binary_.string();
        options.command_timeout_ms = 10000;
        return DockerCliEngine(options);
    }

    TempDir dir_;
    std::filesystem::path binary_;
};

ContainerSpec sample_spec() {
    ContainerSpec spec;
    spec.image = "forge-runtime:latest";
    spec.name = "forge-exec-1";
    spec.mounts = {Mount{"/tmp/ws", "/workspace", false}};
    spec.env = {EnvVar{"CLAUDE_MODEL", "opus", false},
                EnvVar{"FORGE_TEST_SECRET", "s3cret-value", true}};
    spec.command = {"bash", "/workspace/startup.sh"};
    spec.working_dir = "/workspace";
    spec.user = "forge";
    spec.network = "bridge";
    return spec;
}

TEST(DockerRunArgumentsTest, SecretValuesNeverReachTheCommandLine) {
    const auto args = DockerCliEngine::run_arguments(sample_spec());
    for (const auto& arg : args) {
        EXPECT_EQ(arg.find("s3cret-value"), std::string::npos) << arg;
    }
    EXPECT_NE(std::find(args.begin(), args.end(), "FORGE_TEST_SECRET"), args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "CLAUDE_MODEL=opus"), args.end());
}

TEST(DockerRunArgumentsTest, BuildsDetachedRunWithMountsAndCommandLast) {
    const auto args = DockerCliEngine::run_arguments(sample_spec());
    ASSERT_GE(args.size(), 4u);
    EXPECT_EQ(args[0], "run");
    EXPECT_EQ(args[1], "-d");
    EXPECT_NE(std::find(args.begin(), args.end(), "/tmp/ws:/workspace:rw"), args.end());
    EXPECT_EQ(args[args.size() - 3], "forge-runtime:latest");
    EXPECT_EQ(args[args.size() - 2], "bash");
    EXPECT_EQ(args.back(), "/workspace/startup.sh");
}

TEST_F(DockerCliEngineTest, PingSucceedsWhenServerAnswers) {
    auto eng = engine();
    EXPECT_FALSE(is_error(eng.ping()));
}

TEST_F(DockerCliEngineTest, ImageExistsDistinguishesMissingImage) {
    auto eng = engine();
    auto present = eng.image_exists("present:latest");
    ASSERT_FALSE(is_error(present));
    EXPECT_TRUE(get_value(present));

    auto missing = eng.image_exists("absent:latest");
    ASSERT_FALSE(is_error(missing));
    EXPECT_FALSE(get_value(missing));
}

TEST_F(DockerCliEngineTest, BuildFailureCarriesDiagnosticTail) {
    auto eng = engine();
    auto built = eng.build_image(dir_.root(), "forge-runtime:latest", true, nullptr);
    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).category, ErrorCategory::Build);
    EXPECT_NE(get_error(built).message.find("failed to solve"), std::string::npos);
}

TEST_F(DockerCliEngineTest, CancelTokenAbortsRunningBuild) {
    auto eng = engine();
    auto cancel = std::make_shared<std::atomic_bool>(false);
    std::thread canceller([cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancel->store(true);
    });

    const auto start = std::chrono::steady_clock::now();
    auto built = eng.build_image(dir_.root(), "slow:latest", false, cancel);
    const auto waited = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(is_error(built));
    EXPECT_EQ(get_error(built).category, ErrorCategory::Cancelled);
    EXPECT_EQ(get_error(built).code, "build_cancelled");
    EXPECT_LT(waited, std::chrono::seconds(5));
}

TEST_F(DockerCliEngineTest, RunPassesSecretThroughEnvironment) {
    auto eng = engine();
    auto started = eng.run(sample_spec());
    ASSERT_FALSE(is_error(started));
    EXPECT_EQ(get_value(started), "c0ffee1234567890");
}

TEST_F(DockerCliEngineTest, LogsStreamContainerOutput) {
    auto eng = engine();
    auto stream = eng.logs("c0ffee");
    ASSERT_FALSE(is_error(stream));
    auto source = take_value(stream);
    auto first = source->next_line();
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(*get_value(first), "line one");
    auto second = source->next_line();
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(*get_value(second), "line two");
    auto end = source->next_line();
    ASSERT_FALSE(is_error(end));
    EXPECT_FALSE(get_value(end).has_value());
}

TEST_F(DockerCliEngineTest, InspectAndWaitParseOutput) {
    auto eng = engine();
    auto status = eng.inspect("c0ffee");
    ASSERT_FALSE(is_error(status));
    EXPECT_EQ(get_value(status), ContainerStatus::Exited);

    auto exit_code = eng.wait("c0ffee");
    ASSERT_FALSE(is_error(exit_code));
    EXPECT_EQ(get_value(exit_code), 7);
}

TEST_F(DockerCliEngineTest, LifecycleCommandsSucceed) {
    auto eng = engine();
    EXPECT_FALSE(is_error(eng.stop("c0ffee", std::chrono::seconds(1))));
    EXPECT_FALSE(is_error(eng.kill("c0ffee")));
    EXPECT_FALSE(is_error(eng.remove("c0ffee")));
}

TEST(DockerCliEngineMissingBinaryTest, ReportsEngineNotFound) {
    DockerCliOptions options;
    options.binary = "forge-no-such-docker-client";
    DockerCliEngine eng(options);
    auto ping = eng.ping();
    ASSERT_TRUE(is_error(ping));
    EXPECT_EQ(get_error(ping).category, ErrorCategory::RuntimeStart);
    EXPECT_EQ(get_error(ping).code, "engine_not_found");
}

}  // namespace
