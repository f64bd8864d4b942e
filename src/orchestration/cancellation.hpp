#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace forge::orchestration {

// External stop signal for an execution. cancel() may be called from any
// thread, including a signal-handling thread, and runs every subscribed
// callback once. Subscribing after cancellation runs the callback
// immediately. Resetting a subscription waits for a callback that is
// already running on another thread.
class CancellationSource {
public:
    using Callback = std::function<void()>;

    class Subscription {
    public:
        Subscription() = default;
        Subscription(CancellationSource* source, std::uint64_t id);
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();

    private:
        CancellationSource* source_ = nullptr;
        std::uint64_t id_ = 0;
    };

    void cancel();
    bool cancelled() const;

    [[nodiscard]] Subscription subscribe(Callback callback);

private:
    void unsubscribe(std::uint64_t id);

    mutable std::mutex mutex_;
    std::recursive_mutex invoke_mutex_;
    bool cancelled_ = false;
    std::uint64_t next_id_ = 1;
    std::map<std::uint64_t, Callback> callbacks_;
};

}  // namespace forge::orchestration
