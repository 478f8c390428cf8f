#pragma once

#include "proxypool/upstream/upstream_client.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace proxypool::testing {

using namespace proxypool::core;

using upstream::CancellationToken;
using upstream::RawUpstreamError;
using upstream::TransportFailure;
using protocol::UpstreamChunk;
using protocol::UpstreamRequest;
using protocol::UpstreamResponse;

// Scripted upstream shared by every client the factory creates
struct FakeUpstream {
    std::mutex mutex;
    std::vector<std::string> keys_used;
    std::vector<UpstreamRequest> requests;

    // Unary replies, consumed in order; when empty a plain "ok" reply is used
    std::deque<Result<UpstreamResponse, RawUpstreamError>> completions;

    // Streaming script
    std::vector<UpstreamChunk> chunks;
    std::optional<RawUpstreamError> stream_error;  // after the chunks
    std::function<void(size_t)> after_chunk;      // hook, gets the chunk index
    size_t chunks_delivered = 0;

    void record(const std::string& key, const UpstreamRequest& request) {
        std::lock_guard<std::mutex> lock(mutex);
        keys_used.push_back(key);
        requests.push_back(request);
    }
};

inline UpstreamResponse text_response(const std::string& text,
                                      const std::string& finish_reason = "stop") {
    UpstreamResponse response;
    response.content.push_back(protocol::TextPart{text});
    response.finish_reason = finish_reason;
    response.usage = protocol::UpstreamUsage{10, 3};
    return response;
}

inline UpstreamChunk chunk_from(const char* json) {
    return UpstreamChunk::from_json(Json::parse(json)).value();
}

class FakeClient : public upstream::UpstreamClient {
public:
    FakeClient(std::shared_ptr<FakeUpstream> script, std::string key)
        : script_(std::move(script)), key_(std::move(key)) {}

    std::string name() const override { return "fake"; }

    Result<UpstreamResponse, RawUpstreamError> complete(const UpstreamRequest& request,
                                                        CancellationToken& /*token*/) override {
        script_->record(key_, request);
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (script_->completions.empty()) {
            return Result<UpstreamResponse, RawUpstreamError>::ok(text_response("ok"));
        }
        auto next = std::move(script_->completions.front());
        script_->completions.pop_front();
        return next;
    }

    Result<void, RawUpstreamError> stream(const UpstreamRequest& request,
                                          const upstream::ChunkCallback& on_chunk,
                                          CancellationToken& token) override {
        script_->record(key_, request);
        for (size_t i = 0; i < script_->chunks.size(); ++i) {
            if (token.is_cancelled()) {
                return Result<void, RawUpstreamError>::err(
                    RawUpstreamError::transport_error(TransportFailure::Cancelled, "cancelled"));
            }
            if (!on_chunk(script_->chunks[i])) {
                return Result<void, RawUpstreamError>::ok();
            }
            ++script_->chunks_delivered;
            if (script_->after_chunk) {
                script_->after_chunk(i);
            }
        }
        if (script_->stream_error) {
            return Result<void, RawUpstreamError>::err(*script_->stream_error);
        }
        return Result<void, RawUpstreamError>::ok();
    }

private:
    std::shared_ptr<FakeUpstream> script_;
    std::string key_;
};

inline upstream::UpstreamClientFactory fake_factory(std::shared_ptr<FakeUpstream> script) {
    return [script](const std::string& api_key) -> std::unique_ptr<upstream::UpstreamClient> {
        return std::make_unique<FakeClient>(script, api_key);
    };
}

}  // namespace proxypool::testing
