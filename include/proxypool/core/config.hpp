#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace proxypool::core {

namespace fs = std::filesystem;

// Upstream Chat-Completions backend
struct UpstreamConfig {
    std::string base_url = "https://api.openai.com/v1";
    std::vector<std::string> api_keys;          // From env: OPENAI_API_KEY (comma-separated)
    std::vector<std::string> models = {"gpt-4o"};  // From env: BIG_MODEL (comma-separated)
    std::string azure_api_version;              // Appended as ?api-version= when set

    int request_timeout_s = 90;
    int connect_timeout_s = 30;
    int max_retries = 2;

    // Bounds applied to the caller's max_tokens
    int max_tokens_limit = 4096;
    int min_tokens_limit = 100;

    // Ask for a trailing usage chunk on streamed calls
    bool request_stream_usage = true;

    // Caller model names starting with these are forwarded unchanged
    std::vector<std::string> passthrough_prefixes = {"gpt-", "o1-", "ep-", "doubao-", "deepseek-"};
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8082;
    std::string client_api_key;  // From env: ANTHROPIC_API_KEY; empty disables inbound auth
    int thread_pool_size = 8;
};

// Out-of-band credential probing
struct ProbeConfig {
    bool enabled = false;           // From env: ENABLE_API_VALIDATION
    bool keep_invalid_keys = true;  // From env: KEEP_INVALID_KEYS
    std::string key_prefix;         // e.g. "ms-"; empty skips the format check
    std::string model;              // Empty: take the next configured model
    int timeout_s = 10;
};

struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error
    fs::path log_path;               // Empty: console only
};

struct Config {
    UpstreamConfig upstream;
    ServerConfig server;
    ProbeConfig probe;
    ObservabilityConfig observability;

    // Load from a YAML file, then apply environment overrides and validate
    static Result<Config, Error> load(const fs::path& path);

    // Defaults plus environment overrides, validated. Used when no file exists.
    static Result<Config, Error> from_environment();

    static fs::path default_path();

    // Environment variables win over file values
    void apply_environment();

    Result<void, Error> validate() const;
};

// Expand ~ and ${VAR} / $VAR references
std::string expand_path(const std::string& path);

// Split "a, b,c" or a JSON array string into trimmed, non-empty items
std::vector<std::string> parse_list(const std::string& raw);

}  // namespace proxypool::core
