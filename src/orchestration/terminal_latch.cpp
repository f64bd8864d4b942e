#include "orchestration/terminal_latch.hpp"

#include <utility>

namespace forge::orchestration {

bool TerminalLatch::try_set(TerminalEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (event_.has_value()) {
            return false;
        }
        event_ = std::move(event);
    }
    cv_.notify_all();
    return true;
}

std::optional<TerminalEvent> TerminalLatch::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return event_;
}

std::optional<TerminalEvent> TerminalLatch::wait_until(
    const std::optional<Clock::time_point>& deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto decided = [this] { return event_.has_value(); };
    if (deadline.has_value()) {
        cv_.wait_until(lock, *deadline, decided);
    } else {
        cv_.wait(lock, decided);
    }
    return event_;
}

}  // namespace forge::orchestration
