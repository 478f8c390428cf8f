#include "proxypool/upstream/http_upstream_client.hpp"
#include "proxypool/upstream/sse_decoder.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace proxypool::upstream {

namespace {

TransportFailure map_transport_error(httplib::Error error) {
    switch (error) {
        case httplib::Error::Connection:
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLLoadingCerts:
        case httplib::Error::SSLServerVerification:
        case httplib::Error::ProxyConnection:
            return TransportFailure::ConnectFailed;
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return TransportFailure::Timeout;
        case httplib::Error::Write:
            return TransportFailure::Reset;
        case httplib::Error::Canceled:
            return TransportFailure::Cancelled;
        default:
            return TransportFailure::Malformed;
    }
}

RawUpstreamError transport_error(httplib::Error error) {
    return RawUpstreamError::transport_error(map_transport_error(error), httplib::to_string(error));
}

RawUpstreamError cancelled_error() {
    return RawUpstreamError::transport_error(TransportFailure::Cancelled, "Request cancelled");
}

bool is_event_stream(const std::string& content_type) {
    return content_type.empty() || content_type.find("text/event-stream") != std::string::npos;
}

}  // namespace

UpstreamEndpoint UpstreamEndpoint::from_config(const UpstreamConfig& config) {
    UpstreamEndpoint endpoint;
    endpoint.base_url = config.base_url;
    endpoint.azure_api_version = config.azure_api_version;
    endpoint.connect_timeout_s = config.connect_timeout_s;
    endpoint.request_timeout_s = config.request_timeout_s;
    return endpoint;
}

std::pair<std::string, std::string> split_base_url(const std::string& base_url) {
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    size_t scheme = url.find("://");
    size_t host_start = scheme == std::string::npos ? 0 : scheme + 3;
    size_t path_start = url.find('/', host_start);
    if (path_start == std::string::npos) {
        return {url, ""};
    }
    return {url.substr(0, path_start), url.substr(path_start)};
}

HttpUpstreamClient::HttpUpstreamClient(UpstreamEndpoint endpoint, std::string api_key)
    : endpoint_(std::move(endpoint))
    , api_key_(std::move(api_key))
{
    auto [origin, prefix] = split_base_url(endpoint_.base_url);
    origin_ = std::move(origin);
    path_prefix_ = std::move(prefix);
}

std::string HttpUpstreamClient::name() const {
    return origin_ + path_prefix_;
}

UpstreamClientFactory HttpUpstreamClient::factory(const UpstreamConfig& config) {
    UpstreamEndpoint endpoint = UpstreamEndpoint::from_config(config);
    return [endpoint](const std::string& api_key) -> std::unique_ptr<UpstreamClient> {
        return std::make_unique<HttpUpstreamClient>(endpoint, api_key);
    };
}

std::shared_ptr<httplib::Client> HttpUpstreamClient::make_client(int read_timeout_s) const {
    auto client = std::make_shared<httplib::Client>(origin_);
    client->set_read_timeout(read_timeout_s);
    client->set_write_timeout(read_timeout_s);
    client->set_connection_timeout(endpoint_.connect_timeout_s);
    client->set_keep_alive(false);
    return client;
}

std::string HttpUpstreamClient::completions_path() const {
    std::string path = path_prefix_ + "/chat/completions";
    if (!endpoint_.azure_api_version.empty()) {
        path += "?api-version=" + endpoint_.azure_api_version;
    }
    return path;
}

Result<std::string, RawUpstreamError> HttpUpstreamClient::post_raw(const Json& body, int timeout_s) {
    auto client = make_client(timeout_s);

    httplib::Headers headers = {
        {"Authorization", "Bearer " + api_key_}
    };
    if (!endpoint_.azure_api_version.empty()) {
        headers.emplace("api-key", api_key_);
    }

    auto res = client->Post(completions_path(), headers, body.dump(), "application/json");
    if (!res) {
        return Result<std::string, RawUpstreamError>::err(transport_error(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        return Result<std::string, RawUpstreamError>::err(RawUpstreamError::http(res->status, res->body));
    }
    return Result<std::string, RawUpstreamError>::ok(res->body);
}

Result<UpstreamResponse, RawUpstreamError> HttpUpstreamClient::complete(const UpstreamRequest& request,
                                                                        CancellationToken& token) {
    using R = Result<UpstreamResponse, RawUpstreamError>;

    if (token.is_cancelled()) {
        return R::err(cancelled_error());
    }

    auto client = make_client(endpoint_.request_timeout_s);
    token.on_cancel([client]() { client->stop(); });

    httplib::Headers headers = {
        {"Authorization", "Bearer " + api_key_}
    };
    if (!endpoint_.azure_api_version.empty()) {
        headers.emplace("api-key", api_key_);
    }

    auto res = client->Post(completions_path(), headers, request.to_json().dump(), "application/json");
    token.clear_callbacks();

    if (token.is_cancelled()) {
        return R::err(cancelled_error());
    }
    if (!res) {
        return R::err(transport_error(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        return R::err(RawUpstreamError::http(res->status, res->body));
    }

    Json body = Json::parse(res->body, nullptr, false);
    if (body.is_discarded()) {
        return R::err(RawUpstreamError::transport_error(
            TransportFailure::Malformed, "Upstream returned a body that is not JSON"));
    }

    auto parsed = UpstreamResponse::from_json(body);
    if (parsed.is_err()) {
        RawUpstreamError error;
        error.body = res->body;
        error.transport = parsed.error().code == ErrorCode::UpstreamInvalidResponse && protocol::extract_error_message(body)
            ? TransportFailure::None
            : TransportFailure::Malformed;
        error.description = parsed.error().message;
        return R::err(std::move(error));
    }
    return R::ok(std::move(parsed).value());
}

Result<void, RawUpstreamError> HttpUpstreamClient::stream(const UpstreamRequest& request,
                                                          const ChunkCallback& on_chunk,
                                                          CancellationToken& token) {
    using R = Result<void, RawUpstreamError>;

    if (token.is_cancelled()) {
        return R::err(cancelled_error());
    }

    auto client = make_client(endpoint_.request_timeout_s);
    token.on_cancel([client]() { client->stop(); });

    httplib::Request req;
    req.method = "POST";
    req.path = completions_path();
    req.headers = {
        {"Authorization", "Bearer " + api_key_},
        {"Accept", "text/event-stream"},
        {"Content-Type", "application/json"}
    };
    if (!endpoint_.azure_api_version.empty()) {
        req.headers.emplace("api-key", api_key_);
    }
    req.body = request.to_json().dump();

    int status = 0;
    bool event_stream = true;
    std::string error_body;
    std::string plain_body;  // 2xx answer that is not an event stream
    SseDecoder decoder;
    bool finished = false;  // [DONE] seen or the consumer stopped
    std::optional<RawUpstreamError> chunk_error;

    auto handle_event = [&](const SseEvent& event) -> bool {
        if (event.done) {
            finished = true;
            return false;
        }

        Json data = Json::parse(event.data, nullptr, false);
        if (data.is_discarded()) {
            spdlog::warn("Skipping malformed upstream SSE payload ({} bytes)", event.data.size());
            return true;
        }

        auto chunk = UpstreamChunk::from_json(data);
        if (chunk.is_err()) {
            RawUpstreamError error;
            error.body = event.data;
            error.description = chunk.error().message;
            chunk_error = std::move(error);
            return false;
        }
        if (chunk.value().is_empty()) {
            return true;
        }
        if (!on_chunk(chunk.value())) {
            finished = true;
            return false;
        }
        return true;
    };

    req.response_handler = [&](const httplib::Response& response) {
        status = response.status;
        event_stream = is_event_stream(response.get_header_value("Content-Type"));
        return true;
    };

    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        if (token.is_cancelled()) {
            return false;
        }
        if (status < 200 || status >= 300) {
            error_body.append(data, len);
            return true;
        }
        if (!event_stream) {
            plain_body.append(data, len);
            return true;
        }
        for (const auto& event : decoder.feed(data, len)) {
            if (!handle_event(event)) {
                return false;
            }
        }
        return true;
    };

    httplib::Response res;
    httplib::Error error = httplib::Error::Success;
    bool sent = client->send(req, res, error);
    token.clear_callbacks();

    if (chunk_error) {
        return R::err(std::move(*chunk_error));
    }
    if (token.is_cancelled()) {
        return R::err(cancelled_error());
    }
    if (finished) {
        return R::ok();
    }
    if (!sent) {
        return R::err(transport_error(error));
    }
    if (status < 200 || status >= 300) {
        return R::err(RawUpstreamError::http(status, error_body.empty() ? res.body : error_body));
    }

    if (!event_stream) {
        Json body = Json::parse(plain_body, nullptr, false);
        if (body.is_object()) {
            if (protocol::extract_error_message(body)) {
                RawUpstreamError failure;
                failure.body = plain_body;
                failure.description = "Upstream answered the stream with an error body";
                return R::err(std::move(failure));
            }
            auto parsed = UpstreamResponse::from_json(body);
            if (parsed.is_err()) {
                return R::err(RawUpstreamError::transport_error(
                    TransportFailure::Malformed, parsed.error().message));
            }
            spdlog::debug("Upstream answered a stream request with a complete response");
            for (const auto& chunk : protocol::response_as_chunks(parsed.value())) {
                if (token.is_cancelled()) {
                    return R::err(cancelled_error());
                }
                if (!on_chunk(chunk)) {
                    break;
                }
            }
            return R::ok();
        }
        // Mislabelled event stream; decode it anyway
        std::vector<SseEvent> events = decoder.feed(plain_body);
        for (auto& event : decoder.flush()) {
            events.push_back(std::move(event));
        }
        if (events.empty()) {
            return R::err(RawUpstreamError::transport_error(
                TransportFailure::Malformed, "Upstream stream body is neither SSE nor JSON"));
        }
        for (const auto& event : events) {
            if (!handle_event(event)) {
                break;
            }
        }
        if (chunk_error) {
            return R::err(std::move(*chunk_error));
        }
        return R::ok();
    }

    // Stream closed without a sentinel; deliver anything left in the buffer
    for (const auto& event : decoder.flush()) {
        if (!handle_event(event)) {
            break;
        }
    }
    if (chunk_error) {
        return R::err(std::move(*chunk_error));
    }
    return R::ok();
}

}  // namespace proxypool::upstream
