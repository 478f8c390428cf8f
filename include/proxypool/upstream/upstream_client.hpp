#pragma once

#include "proxypool/core/result.hpp"
#include "proxypool/protocol/chat_completions.hpp"
#include "proxypool/upstream/cancellation.hpp"
#include "proxypool/upstream/raw_error.hpp"

#include <functional>
#include <memory>
#include <string>

namespace proxypool::upstream {

using namespace proxypool::core;
using protocol::UpstreamChunk;
using protocol::UpstreamRequest;
using protocol::UpstreamResponse;

// Called once per decoded chunk. Return false to stop reading.
using ChunkCallback = std::function<bool(const UpstreamChunk& chunk)>;

// One upstream backend reached with one credential
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    // For logs; never includes the credential
    virtual std::string name() const = 0;

    // Unary call
    virtual Result<UpstreamResponse, RawUpstreamError> complete(const UpstreamRequest& request,
                                                                CancellationToken& token) = 0;

    // Streaming call. Returns ok when the upstream finished or the callback
    // asked to stop; a cancelled token yields TransportFailure::Cancelled.
    virtual Result<void, RawUpstreamError> stream(const UpstreamRequest& request,
                                                  const ChunkCallback& on_chunk,
                                                  CancellationToken& token) = 0;
};

// Creates a client bound to one credential secret
using UpstreamClientFactory = std::function<std::unique_ptr<UpstreamClient>(const std::string& api_key)>;

}  // namespace proxypool::upstream
