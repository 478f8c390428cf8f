#pragma once

#include "proxypool/core/config.hpp"
#include "proxypool/dispatch/dispatcher.hpp"
#include "proxypool/probe/key_prober.hpp"
#include "proxypool/rotation/credential_rotator.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace proxypool::server {

using namespace proxypool::core;

// HTTP front end for the dispatcher.
//
// Routes:
//   POST /v1/messages               - Messages API, unary or SSE
//   POST /v1/messages/count_tokens  - approximate input token count
//   GET  /validate-keys             - probe every credential (report only)
//   GET  /                          - status and non-secret configuration
//   GET  /health                    - liveness
//
// Handlers are public so they can be driven without a socket.
class ProxyServer {
public:
    ProxyServer(const Config& config,
                rotation::CredentialModelRotator& rotator,
                dispatch::Dispatcher& dispatcher,
                std::shared_ptr<probe::KeyProber> prober);
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    // Blocks until stop() is called from another thread or binding fails
    Result<void, Error> start();
    void stop();
    bool is_running() const { return running_; }

    // Inbound shared secret from x-api-key or Authorization: Bearer.
    // Always true when no client key is configured.
    bool authorize(const httplib::Request& req) const;

    void handle_messages(const httplib::Request& req, httplib::Response& res);
    void handle_count_tokens(const httplib::Request& req, httplib::Response& res);
    void handle_validate_keys(const httplib::Request& req, httplib::Response& res);
    void handle_root(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    // Non-streaming dispatch, re-dispatched on retriable failures
    Result<protocol::CanonicalResponse, ErrorEnvelope> complete_with_retry(
        const protocol::CanonicalRequest& request,
        const dispatch::ConnectionProbe& still_connected);

private:
    Config config_;
    rotation::CredentialModelRotator& rotator_;
    dispatch::Dispatcher& dispatcher_;
    std::shared_ptr<probe::KeyProber> prober_;
    std::unique_ptr<httplib::Server> svr_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};  // stop() before start() makes start() return

    void setup_routes();
    void stream_messages(const httplib::Request& req, httplib::Response& res,
                         protocol::CanonicalRequest request);
};

// HTTP status for a failed non-streaming call
int response_status(const ErrorEnvelope& envelope);

}  // namespace proxypool::server
