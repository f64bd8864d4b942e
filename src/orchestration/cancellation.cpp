#include "orchestration/cancellation.hpp"

#include <utility>
#include <vector>

namespace forge::orchestration {

CancellationSource::Subscription::Subscription(CancellationSource* source,
                                               const std::uint64_t id)
    : source_(source), id_(id) {}

CancellationSource::Subscription::~Subscription() {
    reset();
}

CancellationSource::Subscription::Subscription(Subscription&& other) noexcept
    : source_(other.source_), id_(other.id_) {
    other.source_ = nullptr;
    other.id_ = 0;
}

CancellationSource::Subscription& CancellationSource::Subscription::operator=(
    Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        source_ = other.source_;
        id_ = other.id_;
        other.source_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void CancellationSource::Subscription::reset() {
    if (source_ != nullptr) {
        source_->unsubscribe(id_);
        source_ = nullptr;
        id_ = 0;
    }
}

void CancellationSource::cancel() {
    std::lock_guard<std::recursive_mutex> invoking(invoke_mutex_);
    std::map<std::uint64_t, Callback> to_run;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        to_run.swap(callbacks_);
    }
    // Callbacks run outside mutex_ so they may call back into this object.
    for (auto& entry : to_run) {
        entry.second();
    }
}

bool CancellationSource::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

CancellationSource::Subscription CancellationSource::subscribe(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            const std::uint64_t id = next_id_++;
            callbacks_.emplace(id, std::move(callback));
            return Subscription(this, id);
        }
    }
    callback();
    return Subscription();
}

void CancellationSource::unsubscribe(const std::uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.erase(id);
    }
    std::lock_guard<std::recursive_mutex> settled(invoke_mutex_);
}

}  // namespace forge::orchestration
