#include "orchestration/timeout_guard.hpp"

#include <utility>
#include "core/errors/forge_errors.hpp"
#include "core/logging/logger.hpp"

namespace forge::orchestration {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

TimeoutGuard::TimeoutGuard(core::config::TimeoutSpec spec) : spec_(std::move(spec)) {}

void TimeoutGuard::arm() {
    if (spec_.unlimited()) {
        deadline_.reset();
        return;
    }
    deadline_ = TerminalLatch::Clock::now() + *spec_.limit;
}

TerminalEvent TimeoutGuard::guard(TerminalLatch& latch,
                                  const std::function<void()>& on_expired) const {
    if (auto decided = latch.wait_until(deadline_)) {
        return *decided;
    }

    TerminalEvent expired;
    expired.state = protocol::OrchestratorState::TimedOut;
    expired.error = ForgeError{ErrorCategory::Timeout,
                               "Execution exceeded the timeout of " + spec_.describe(),
                               "execution_timeout",
                               "Raise --timeout or use --timeout unlimited."};
    expired.source = "timeout";
    if (latch.try_set(std::move(expired))) {
        LOG_WARN("Timeout of " + spec_.describe() + " reached; stopping execution.");
        if (on_expired) {
            on_expired();
        }
    }
    // try_set can lose to a racer that decided just after the deadline.
    return *latch.get();
}

}  // namespace forge::orchestration
