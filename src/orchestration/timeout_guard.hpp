#pragma once

#include <functional>
#include <optional>
#include "core/config/timeout_spec.hpp"
#include "orchestration/terminal_latch.hpp"

namespace forge::orchestration {

// Bounds the monitoring phase with an optional wall-clock deadline.
class TimeoutGuard {
public:
    explicit TimeoutGuard(core::config::TimeoutSpec spec);

    // Starts the clock. Calling it again restarts it.
    void arm();

    std::optional<TerminalLatch::Clock::time_point> deadline() const { return deadline_; }

    // Waits on `latch` until a terminal state is decided. If the deadline
    // passes first, records TIMED_OUT and calls `on_expired` when that
    // record won the race. Returns the decided event.
    TerminalEvent guard(TerminalLatch& latch, const std::function<void()>& on_expired) const;

private:
    core::config::TimeoutSpec spec_;
    std::optional<TerminalLatch::Clock::time_point> deadline_;
};

}  // namespace forge::orchestration
