#include "proxypool/dispatch/request_registry.hpp"
#include "proxypool/core/uuid.hpp"

namespace proxypool::dispatch {

RequestHandle::RequestHandle(RequestRegistry* registry, RequestId id, CancellationTokenPtr token)
    : registry_(registry)
    , id_(std::move(id))
    , token_(std::move(token))
{
}

RequestHandle::~RequestHandle() {
    release();
}

RequestHandle::RequestHandle(RequestHandle&& other) noexcept
    : registry_(other.registry_)
    , id_(std::move(other.id_))
    , token_(std::move(other.token_))
{
    other.registry_ = nullptr;
}

RequestHandle& RequestHandle::operator=(RequestHandle&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = other.registry_;
        id_ = std::move(other.id_);
        token_ = std::move(other.token_);
        other.registry_ = nullptr;
    }
    return *this;
}

void RequestHandle::release() {
    if (registry_) {
        registry_->release(id_);
        registry_ = nullptr;
    }
    if (token_) {
        token_->clear_callbacks();
    }
}

RequestHandle RequestRegistry::open() {
    auto token = std::make_shared<CancellationToken>();
    RequestId id = generate_request_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (live_.count(id) > 0) {
            id = generate_request_id();
        }
        live_.emplace(id, token);
    }
    return RequestHandle(this, std::move(id), std::move(token));
}

bool RequestRegistry::cancel(const RequestId& id) {
    CancellationTokenPtr token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = live_.find(id);
        if (it == live_.end()) {
            return false;
        }
        token = it->second;
    }
    // Abort callbacks run outside the lock
    token->cancel();
    return true;
}

size_t RequestRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

std::vector<RequestId> RequestRegistry::active_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RequestId> ids;
    ids.reserve(live_.size());
    for (const auto& [id, token] : live_) {
        ids.push_back(id);
    }
    return ids;
}

void RequestRegistry::release(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_.erase(id);
}

}  // namespace proxypool::dispatch
