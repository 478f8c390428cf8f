#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace proxypool::upstream {

// Cooperative cancellation shared between a call and whoever may abort it.
//
// cancel() sets the flag and runs the registered abort callbacks on the
// calling thread. Callbacks must not block on I/O (e.g. they stop a socket,
// they do not drain it). A callback registered after cancellation runs
// immediately.
class CancellationToken {
public:
    using AbortCallback = std::function<void()>;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    void on_cancel(AbortCallback callback);

    // Drop callbacks once the resource they reference is gone
    void clear_callbacks();

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::vector<AbortCallback> callbacks_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

}  // namespace proxypool::upstream
