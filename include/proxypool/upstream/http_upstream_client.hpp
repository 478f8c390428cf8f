#pragma once

#include "proxypool/core/config.hpp"
#include "proxypool/upstream/upstream_client.hpp"

#include <memory>
#include <string>
#include <utility>

namespace httplib {
class Client;
}

namespace proxypool::upstream {

struct UpstreamEndpoint {
    std::string base_url;
    std::string azure_api_version;
    int connect_timeout_s = 30;
    int request_timeout_s = 90;

    static UpstreamEndpoint from_config(const UpstreamConfig& config);
};

// "https://host:port/v1/" -> {"https://host:port", "/v1"}
std::pair<std::string, std::string> split_base_url(const std::string& base_url);

// Chat-Completions backend over cpp-httplib
class HttpUpstreamClient : public UpstreamClient {
public:
    HttpUpstreamClient(UpstreamEndpoint endpoint, std::string api_key);

    std::string name() const override;

    Result<UpstreamResponse, RawUpstreamError> complete(const UpstreamRequest& request,
                                                        CancellationToken& token) override;

    Result<void, RawUpstreamError> stream(const UpstreamRequest& request,
                                          const ChunkCallback& on_chunk,
                                          CancellationToken& token) override;

    // POST an arbitrary body to the completions path; used by the key prober
    Result<std::string, RawUpstreamError> post_raw(const Json& body, int timeout_s);

    static UpstreamClientFactory factory(const UpstreamConfig& config);

private:
    UpstreamEndpoint endpoint_;
    std::string api_key_;
    std::string origin_;
    std::string path_prefix_;

    std::shared_ptr<httplib::Client> make_client(int read_timeout_s) const;
    std::string completions_path() const;
};

}  // namespace proxypool::upstream
