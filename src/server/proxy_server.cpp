#include "proxypool/server/proxy_server.hpp"
#include "proxypool/protocol/messages.hpp"
#include "proxypool/protocol/stream_event.hpp"
#include "proxypool/translate/token_estimator.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <thread>

namespace proxypool::server {

namespace {

constexpr const char* kJson = "application/json";
constexpr const char* kEventStream = "text/event-stream";

void send_json(httplib::Response& res, int status, const Json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, Json::error_handler_t::replace), kJson);
}

void send_error(httplib::Response& res, const ErrorEnvelope& envelope) {
    send_json(res, response_status(envelope), protocol::error_body(envelope));
}

void send_error(httplib::Response& res, ErrorCategory category, const std::string& message) {
    ErrorEnvelope envelope;
    envelope.category = category;
    envelope.message = message;
    send_error(res, envelope);
}

std::string bearer_token(const std::string& authorization) {
    const std::string prefix = "Bearer ";
    if (authorization.size() > prefix.size() && authorization.compare(0, prefix.size(), prefix) == 0) {
        return authorization.substr(prefix.size());
    }
    return "";
}

// Parse the JSON body; on failure the error response is already written
std::optional<Json> read_body(const httplib::Request& req, httplib::Response& res) {
    Json body = Json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        send_error(res, ErrorCategory::InvalidRequest, "Request body must be a JSON object");
        return std::nullopt;
    }
    return body;
}

dispatch::ConnectionProbe connection_probe(const httplib::Request& req) {
    auto is_closed = req.is_connection_closed;
    return [is_closed]() {
        return !is_closed || !is_closed();
    };
}

}  // namespace

int response_status(const ErrorEnvelope& envelope) {
    if (envelope.upstream_status && *envelope.upstream_status >= 400 && *envelope.upstream_status < 600) {
        return *envelope.upstream_status;
    }
    return category_http_status(envelope.category);
}

ProxyServer::ProxyServer(const Config& config,
                         rotation::CredentialModelRotator& rotator,
                         dispatch::Dispatcher& dispatcher,
                         std::shared_ptr<probe::KeyProber> prober)
    : config_(config)
    , rotator_(rotator)
    , dispatcher_(dispatcher)
    , prober_(std::move(prober))
    , svr_(std::make_unique<httplib::Server>())
{
    setup_routes();
}

ProxyServer::~ProxyServer() {
    stop();
}

void ProxyServer::setup_routes() {
    size_t threads = static_cast<size_t>(config_.server.thread_pool_size);
    svr_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    svr_->set_read_timeout(config_.upstream.request_timeout_s);
    svr_->set_write_timeout(config_.upstream.request_timeout_s);

    svr_->set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        if (req.method == "OPTIONS") {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers",
                           "Content-Type, Authorization, x-api-key, anthropic-version");
            res.set_content("", "text/plain");
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr_->Post("/v1/messages", [this](const httplib::Request& req, httplib::Response& res) {
        handle_messages(req, res);
    });
    svr_->Post("/v1/messages/count_tokens", [this](const httplib::Request& req, httplib::Response& res) {
        handle_count_tokens(req, res);
    });
    svr_->Get("/validate-keys", [this](const httplib::Request& req, httplib::Response& res) {
        handle_validate_keys(req, res);
    });
    svr_->Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_root(req, res);
    });
    svr_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });

    svr_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (res.status == 404) {
            ErrorEnvelope envelope;
            envelope.category = ErrorCategory::InvalidRequest;
            envelope.message = "Not found: " + req.path;
            send_json(res, 404, protocol::error_body(envelope));
        }
    });

    svr_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            spdlog::error("Unhandled exception on {} {}: {}", req.method, req.path, e.what());
            send_error(res, ErrorCategory::Internal, "Internal server error");
        }
    });

    svr_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
    });
}

Result<void, Error> ProxyServer::start() {
    std::string models;
    for (const auto& model : rotator_.models()) {
        models += (models.empty() ? "" : ", ") + model;
    }
    spdlog::info("Listening on {}:{} ({} credential(s), models: {})",
                 config_.server.host, config_.server.port, rotator_.credential_count(), models);
    if (config_.server.client_api_key.empty()) {
        spdlog::warn("No client API key configured; inbound requests are not authenticated");
    }

    if (stop_requested_) {
        return Result<void, Error>::ok();
    }
    running_ = true;
    bool ok = svr_->listen(config_.server.host, config_.server.port);
    running_ = false;

    if (!ok) {
        return Result<void, Error>::err(
            ErrorCode::NetworkError,
            "Failed to listen",
            config_.server.host + ":" + std::to_string(config_.server.port)
        );
    }
    return Result<void, Error>::ok();
}

void ProxyServer::stop() {
    stop_requested_ = true;
    if (running_) {
        spdlog::info("Shutting down");
        // listen() may not have reached its accept loop yet
        while (running_ && !svr_->is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        svr_->stop();
        running_ = false;
    }
}

bool ProxyServer::authorize(const httplib::Request& req) const {
    const std::string& expected = config_.server.client_api_key;
    if (expected.empty()) {
        return true;
    }
    std::string presented = req.get_header_value("x-api-key");
    if (presented.empty()) {
        presented = bearer_token(req.get_header_value("Authorization"));
    }
    return presented == expected;
}

Result<protocol::CanonicalResponse, ErrorEnvelope> ProxyServer::complete_with_retry(
    const protocol::CanonicalRequest& request,
    const dispatch::ConnectionProbe& still_connected)
{
    int attempts = 1 + std::max(0, config_.upstream.max_retries);
    for (int attempt = 1;; ++attempt) {
        auto result = dispatcher_.complete(request, still_connected);
        if (result.is_ok() || attempt >= attempts || !result.error().is_retriable()) {
            return result;
        }
        spdlog::warn("Attempt {}/{} failed ({}), retrying with the next credential",
                     attempt, attempts, category_to_string(result.error().category));
    }
}

void ProxyServer::handle_messages(const httplib::Request& req, httplib::Response& res) {
    if (!authorize(req)) {
        send_error(res, ErrorCategory::Authentication, "Invalid API key");
        return;
    }

    auto body = read_body(req, res);
    if (!body) {
        return;
    }

    auto parsed = protocol::parse_messages_request(*body);
    if (parsed.is_err()) {
        send_error(res, ErrorCategory::InvalidRequest, parsed.error().full_message());
        return;
    }

    protocol::CanonicalRequest request = std::move(parsed).value();
    if (request.stream) {
        stream_messages(req, res, std::move(request));
        return;
    }

    auto result = complete_with_retry(request, connection_probe(req));
    if (result.is_err()) {
        send_error(res, result.error());
        return;
    }
    send_json(res, 200, result.value().to_json());
}

void ProxyServer::stream_messages(const httplib::Request& req, httplib::Response& res,
                                  protocol::CanonicalRequest request) {
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");

    auto probe = connection_probe(req);
    auto shared_request = std::make_shared<protocol::CanonicalRequest>(std::move(request));

    res.set_chunked_content_provider(
        kEventStream,
        [this, shared_request, probe](size_t /*offset*/, httplib::DataSink& sink) {
            dispatch::EventSink write_event = [&sink](const protocol::StreamEvent& event) {
                if (!sink.is_writable()) {
                    return false;
                }
                std::string frame = protocol::to_sse(event);
                return sink.write(frame.data(), frame.size());
            };

            auto result = dispatcher_.stream(*shared_request, write_event, probe);
            if (result.is_err() && result.error().category == ErrorCategory::Cancelled) {
                // Caller is gone; drop the connection without a terminator
                return false;
            }
            sink.done();
            return true;
        });
}

void ProxyServer::handle_count_tokens(const httplib::Request& req, httplib::Response& res) {
    if (!authorize(req)) {
        send_error(res, ErrorCategory::Authentication, "Invalid API key");
        return;
    }

    auto body = read_body(req, res);
    if (!body) {
        return;
    }

    auto parsed = protocol::parse_count_tokens_request(*body);
    if (parsed.is_err()) {
        send_error(res, ErrorCategory::InvalidRequest, parsed.error().full_message());
        return;
    }

    int tokens = translate::TokenEstimator::estimate_input(parsed.value());
    send_json(res, 200, Json{{"input_tokens", tokens}});
}

void ProxyServer::handle_validate_keys(const httplib::Request& req, httplib::Response& res) {
    if (!authorize(req)) {
        send_error(res, ErrorCategory::Authentication, "Invalid API key");
        return;
    }

    if (!prober_) {
        send_json(res, 200, Json{
            {"status", "skipped"},
            {"message", "Credential probing is not enabled"},
            {"endpoint", config_.upstream.base_url}
        });
        return;
    }

    std::string model = config_.probe.model.empty() ? rotator_.next_model() : config_.probe.model;
    probe::ProbeReport report = prober_->probe_all(rotator_.credentials(), model);
    send_json(res, 200, report.to_json());
}

void ProxyServer::handle_root(const httplib::Request& /*req*/, httplib::Response& res) {
    const auto& upstream = config_.upstream;
    send_json(res, 200, Json{
        {"message", "proxypool: Messages API to Chat-Completions proxy"},
        {"status", "running"},
        {"config", {
            {"base_url", upstream.base_url},
            {"models", rotator_.models()},
            {"credential_count", rotator_.credential_count()},
            {"max_tokens_limit", upstream.max_tokens_limit},
            {"min_tokens_limit", upstream.min_tokens_limit},
            {"max_retries", upstream.max_retries},
            {"passthrough_prefixes", upstream.passthrough_prefixes},
            {"client_api_key_validation", !config_.server.client_api_key.empty()}
        }},
        {"endpoints", {
            {"messages", "/v1/messages"},
            {"count_tokens", "/v1/messages/count_tokens"},
            {"validate_keys", "/validate-keys"},
            {"health", "/health"}
        }}
    });
}

void ProxyServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    send_json(res, 200, Json{
        {"status", "healthy"},
        {"credentials", rotator_.credential_count()},
        {"active_requests", dispatcher_.registry().active_count()}
    });
}

}  // namespace proxypool::server
