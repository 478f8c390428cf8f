#include "proxypool/upstream/cancellation.hpp"

namespace proxypool::upstream {

void CancellationToken::cancel() {
    std::vector<AbortCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        callbacks.swap(callbacks_);
    }
    for (auto& callback : callbacks) {
        callback();
    }
}

void CancellationToken::on_cancel(AbortCallback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load(std::memory_order_acquire)) {
            callbacks_.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

void CancellationToken::clear_callbacks() {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.clear();
}

}  // namespace proxypool::upstream
