#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "runtime/container_engine.hpp"
#include "runtime/line_source.hpp"

namespace forge::testing {

// Replays fixed lines, then either ends, fails, or blocks until interrupted.
class ScriptedLineSource : public runtime::LineSource {
public:
    ScriptedLineSource(std::vector<std::string> lines, bool hang_at_end,
                       std::optional<core::errors::ForgeError> end_error = std::nullopt,
                       std::chrono::milliseconds line_delay = std::chrono::milliseconds(0))
        : lines_(std::move(lines)),
          hang_at_end_(hang_at_end),
          end_error_(std::move(end_error)),
          line_delay_(line_delay) {}

    core::errors::Result<std::optional<std::string>> next_line() override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (line_delay_.count() > 0 && next_ < lines_.size()) {
            cv_.wait_for(lock, line_delay_, [this] { return interrupted_; });
        }
        if (interrupted_) {
            return std::optional<std::string>{};
        }
        if (next_ < lines_.size()) {
            return std::optional<std::string>{lines_[next_++]};
        }
        if (hang_at_end_) {
            cv_.wait(lock, [this] { return interrupted_; });
            return std::optional<std::string>{};
        }
        if (end_error_.has_value()) {
            return *end_error_;
        }
        return std::optional<std::string>{};
    }

    void interrupt() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = true;
        }
        cv_.notify_all();
    }

    bool interrupted() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return interrupted_;
    }

private:
    std::vector<std::string> lines_;
    bool hang_at_end_;
    std::optional<core::errors::ForgeError> end_error_;
    std::chrono::milliseconds line_delay_;
    std::size_t next_ = 0;
    bool interrupted_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

struct FakeEngineScript {
    bool reachable = true;
    bool image_present = true;
    bool build_fails = false;
    std::chrono::milliseconds build_duration{0};  // honours the cancel token
    bool run_fails = false;
    bool logs_fail = false;
    int stop_failures = 0;  // number of stop calls that fail before one succeeds
    bool remove_fails = false;
    std::vector<std::string> lines;
    bool hang_after_lines = false;
    std::optional<core::errors::ForgeError> stream_error;
    std::chrono::milliseconds line_delay{0};
    int exit_code = 0;
    bool running_after_stream = false;  // inspect keeps reporting running
};

// In-memory ContainerEngine that records every call.
class FakeContainerEngine : public runtime::ContainerEngine {
public:
    explicit FakeContainerEngine(FakeEngineScript script = {}) : script_(std::move(script)) {}

    core::errors::Status ping() override {
        ++ping_calls;
        if (!script_.reachable) {
            return unreachable();
        }
        return core::errors::ok();
    }

    core::errors::Result<bool> image_exists(const std::string& /*image_ref*/) override {
        ++image_checks;
        if (!script_.reachable) {
            return unreachable();
        }
        return script_.image_present;
    }

    core::errors::Status build_image(const std::filesystem::path& /*context*/,
                                     const std::string& /*image_ref*/,
                                     const bool no_cache,
                                     const runtime::CancelToken& cancel) override {
        ++build_calls;
        last_build_no_cache = no_cache;
        const auto deadline = std::chrono::steady_clock::now() + script_.build_duration;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel && cancel->load()) {
                return core::errors::ForgeError{core::errors::ErrorCategory::Cancelled,
                                                "Image build cancelled", "build_cancelled"};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (script_.build_fails) {
            return core::errors::ForgeError{core::errors::ErrorCategory::Build,
                                            "Image build failed: step 3/7 returned 1",
                                            "image_build_failed"};
        }
        return core::errors::ok();
    }

    core::errors::Result<std::string> run(const runtime::ContainerSpec& spec) override {
        ++run_calls;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            specs_.push_back(spec);
        }
        if (script_.run_fails) {
            return core::errors::ForgeError{core::errors::ErrorCategory::RuntimeStart,
                                            "Container failed to start", "container_start_failed"};
        }
        return std::string("fake-container-0001");
    }

    core::errors::Result<std::unique_ptr<runtime::LineSource>> logs(
        const std::string& /*container_id*/) override {
        ++logs_calls;
        if (script_.logs_fail) {
            return core::errors::ForgeError{core::errors::ErrorCategory::Stream,
                                            "Unable to attach to logs", "stream_attach_failed"};
        }
        return std::unique_ptr<runtime::LineSource>(new ScriptedLineSource(
            script_.lines, script_.hang_after_lines, script_.stream_error, script_.line_delay));
    }

    core::errors::Status stop(const std::string& /*container_id*/,
                              const std::chrono::seconds grace) override {
        ++stop_calls;
        last_grace = grace;
        if (stop_calls.load() <= script_.stop_failures) {
            return core::errors::ForgeError{core::errors::ErrorCategory::RuntimeStart,
                                            "stop timed out", "container_stop_failed"};
        }
        return core::errors::ok();
    }

    core::errors::Status kill(const std::string& /*container_id*/) override {
        ++kill_calls;
        return core::errors::ok();
    }

    core::errors::Status remove(const std::string& /*container_id*/) override {
        ++remove_calls;
        if (script_.remove_fails) {
            return core::errors::ForgeError{core::errors::ErrorCategory::RuntimeStart,
                                            "removal in progress", "container_remove_failed"};
        }
        return core::errors::ok();
    }

    core::errors::Result<runtime::ContainerStatus> inspect(
        const std::string& /*container_id*/) override {
        ++inspect_calls;
        if (script_.running_after_stream) {
            return runtime::ContainerStatus::Running;
        }
        return script_.hang_after_lines ? runtime::ContainerStatus::Running
                                        : runtime::ContainerStatus::Exited;
    }

    core::errors::Result<int> wait(const std::string& /*container_id*/) override {
        ++wait_calls;
        return script_.exit_code;
    }

    std::vector<runtime::ContainerSpec> specs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return specs_;
    }

    std::atomic_int ping_calls{0};
    std::atomic_int image_checks{0};
    std::atomic_int build_calls{0};
    std::atomic_int run_calls{0};
    std::atomic_int logs_calls{0};
    std::atomic_int stop_calls{0};
    std::atomic_int kill_calls{0};
    std::atomic_int remove_calls{0};
    std::atomic_int inspect_calls{0};
    std::atomic_int wait_calls{0};
    std::atomic_bool last_build_no_cache{false};
    std::chrono::seconds last_grace{0};

private:
    static core::errors::ForgeError unreachable() {
        return core::errors::ForgeError{core::errors::ErrorCategory::RuntimeStart,
                                        "Container engine is unreachable", "engine_unreachable"};
    }

    FakeEngineScript script_;
    mutable std::mutex mutex_;
    std::vector<runtime::ContainerSpec> specs_;
};

}  // namespace forge::testing
