#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "runtime/container_engine.hpp"
#include "runtime/container_runtime.hpp"
#include "runtime/log_classifier.hpp"

namespace forge::runtime {

enum class WatchEnd {
    Completed,     // completion marker seen
    Failed,        // fatal marker seen
    StreamClosed,  // source ended without a marker
    StreamError,   // transport failure
    Interrupted    // source was interrupted from another thread
};

struct WatchOutcome {
    WatchEnd end = WatchEnd::StreamClosed;
    std::string detail;
    std::optional<core::errors::ForgeError> error;
    std::size_t lines_seen = 0;
};

using LineObserver = std::function<void(const std::string&)>;

class LogMonitor {
public:
    LogMonitor(ContainerEngine& engine, LogClassifier classifier,
               std::size_t tail_capacity = 50);

    core::errors::Result<std::unique_ptr<LineSource>> stream(
        const ContainerHandle& handle) const;

    // Consumes `source` in order until the first terminal marker, the end of
    // the stream or an interrupt. `on_line` sees every line before it is
    // classified.
    WatchOutcome watch(LineSource& source, const LineObserver& on_line = {});

    std::vector<std::string> tail() const;

private:
    void remember(const std::string& line);

    ContainerEngine& engine_;
    LogClassifier classifier_;
    std::size_t tail_capacity_;
    mutable std::mutex tail_mutex_;
    std::deque<std::string> tail_;
};

}  // namespace forge::runtime
