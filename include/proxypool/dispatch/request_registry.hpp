#pragma once

#include "proxypool/core/types.hpp"
#include "proxypool/upstream/cancellation.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>

namespace proxypool::dispatch {

using namespace proxypool::core;
using upstream::CancellationToken;
using upstream::CancellationTokenPtr;

class RequestRegistry;

// One in-flight call. Unregisters itself when destroyed.
class RequestHandle {
public:
    RequestHandle(RequestRegistry* registry, RequestId id, CancellationTokenPtr token);
    ~RequestHandle();

    RequestHandle(RequestHandle&& other) noexcept;
    RequestHandle& operator=(RequestHandle&& other) noexcept;
    RequestHandle(const RequestHandle&) = delete;
    RequestHandle& operator=(const RequestHandle&) = delete;

    const RequestId& id() const { return id_; }
    CancellationToken& token() { return *token_; }
    bool is_cancelled() const { return token_ && token_->is_cancelled(); }

private:
    RequestRegistry* registry_;
    RequestId id_;
    CancellationTokenPtr token_;

    void release();
};

// Live request handles by id, so a call can be cancelled from elsewhere
class RequestRegistry {
public:
    RequestHandle open();

    // Returns false when no such call is in flight
    bool cancel(const RequestId& id);

    size_t active_count() const;
    std::vector<RequestId> active_ids() const;

private:
    friend class RequestHandle;

    mutable std::mutex mutex_;
    std::unordered_map<RequestId, CancellationTokenPtr> live_;

    void release(const RequestId& id);
};

}  // namespace proxypool::dispatch
