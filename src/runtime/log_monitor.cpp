#include "runtime/log_monitor.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace forge::runtime {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

LogMonitor::LogMonitor(ContainerEngine& engine, LogClassifier classifier,
                       const std::size_t tail_capacity)
    : engine_(engine), classifier_(std::move(classifier)), tail_capacity_(tail_capacity) {}

core::errors::Result<std::unique_ptr<LineSource>> LogMonitor::stream(
    const ContainerHandle& handle) const {
    if (handle.status == ContainerStatus::Removed) {
        return ForgeError{ErrorCategory::Stream,
                          "Cannot stream logs of a removed container.",
                          "container_removed",
                          "The container was removed before monitoring began; rerun the "
                          "execution."};
    }
    auto source = engine_.logs(handle.id);
    if (core::errors::is_error(source)) {
        auto error = core::errors::get_error(source);
        error.category = ErrorCategory::Stream;
        return error;
    }
    return source;
}

void LogMonitor::remember(const std::string& line) {
    if (tail_capacity_ == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(tail_mutex_);
    tail_.push_back(line);
    while (tail_.size() > tail_capacity_) {
        tail_.pop_front();
    }
}

std::vector<std::string> LogMonitor::tail() const {
    std::lock_guard<std::mutex> lock(tail_mutex_);
    return std::vector<std::string>(tail_.begin(), tail_.end());
}

WatchOutcome LogMonitor::watch(LineSource& source, const LineObserver& on_line) {
    WatchOutcome outcome;
    while (true) {
        auto next = source.next_line();
        if (core::errors::is_error(next)) {
            if (source.interrupted()) {
                outcome.end = WatchEnd::Interrupted;
                return outcome;
            }
            outcome.end = WatchEnd::StreamError;
            outcome.error = core::errors::get_error(next);
            return outcome;
        }

        const auto& line = core::errors::get_value(next);
        if (!line.has_value()) {
            outcome.end = source.interrupted() ? WatchEnd::Interrupted : WatchEnd::StreamClosed;
            return outcome;
        }

        ++outcome.lines_seen;
        remember(*line);
        LOG_DEBUG("[container] " + *line);
        if (on_line) {
            on_line(*line);
        }

        const auto verdict = classifier_.classify(*line);
        switch (verdict.kind) {
            case LineKind::Completed:
                LOG_INFO("Completion marker detected: " + *line);
                outcome.end = WatchEnd::Completed;
                return outcome;
            case LineKind::Failed:
                LOG_ERROR("Fatal marker detected: " + *line);
                outcome.end = WatchEnd::Failed;
                outcome.detail = verdict.detail;
                return outcome;
            case LineKind::Progress:
                if (verdict.looks_like_error) {
                    LOG_WARN("Possible error in container output: " + *line);
                }
                break;
        }
    }
}

}  // namespace forge::runtime
