#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace forge::orchestration {

struct TerminalEvent {
    protocol::OrchestratorState state = protocol::OrchestratorState::Failed;
    std::optional<core::errors::ForgeError> error;
    std::string source;  // "monitor", "timeout" or "cancel"
};

// Records the first terminal state reported by any racer. Later reports are
// ignored, so a decided outcome is never overwritten.
class TerminalLatch {
public:
    using Clock = std::chrono::steady_clock;

    // Returns true if this call decided the outcome.
    bool try_set(TerminalEvent event);

    std::optional<TerminalEvent> get() const;

    // Blocks until a terminal state is set or `deadline` passes. With no
    // deadline it waits indefinitely. Returns the event if one was set.
    std::optional<TerminalEvent> wait_until(
        const std::optional<Clock::time_point>& deadline) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::optional<TerminalEvent> event_;
};

}  // namespace forge::orchestration
