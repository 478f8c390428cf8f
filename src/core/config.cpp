#include "proxypool/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>

namespace proxypool::core {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool parse_bool(const std::string& raw, bool fallback) {
    std::string v = trim(raw);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return fallback;
}

int parse_int(const std::string& raw, int fallback) {
    try {
        size_t consumed = 0;
        int value = std::stoi(trim(raw), &consumed);
        return consumed > 0 ? value : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> read_list(const YAML::Node& node, const std::vector<std::string>& fallback) {
    if (!node) {
        return fallback;
    }
    if (node.IsScalar()) {
        return parse_list(node.as<std::string>());
    }
    std::vector<std::string> items;
    for (const auto& item : node) {
        std::string value = trim(expand_path(item.as<std::string>()));
        if (!value.empty()) {
            items.push_back(value);
        }
    }
    return items;
}

}  // namespace

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    // Expand $VAR patterns (without braces)
    std::regex env_regex2(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
    while (std::regex_search(result, match, env_regex2)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::vector<std::string> items;
    std::string text = trim(raw);

    if (!text.empty() && text.front() == '[') {
        try {
            Json arr = Json::parse(text);
            for (const auto& item : arr) {
                if (item.is_string()) {
                    std::string value = trim(item.get<std::string>());
                    if (!value.empty()) items.push_back(value);
                }
            }
            return items;
        } catch (const Json::exception&) {
            // Not JSON after all; fall through to comma splitting
        }
    }

    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string item = trim(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return items;
}

fs::path Config::default_path() {
    return fs::path(expand_path(std::string("~/.proxypool/config.yaml")));
}

void Config::apply_environment() {
    if (const char* v = std::getenv("OPENAI_API_KEY")) {
        auto keys = parse_list(v);
        if (!keys.empty()) upstream.api_keys = std::move(keys);
    }
    if (const char* v = std::getenv("OPENAI_BASE_URL")) {
        upstream.base_url = trim(v);
    }
    if (const char* v = std::getenv("BIG_MODEL")) {
        auto models = parse_list(v);
        if (!models.empty()) upstream.models = std::move(models);
    }
    if (const char* v = std::getenv("AZURE_API_VERSION")) {
        upstream.azure_api_version = trim(v);
    }
    if (const char* v = std::getenv("REQUEST_TIMEOUT")) {
        upstream.request_timeout_s = parse_int(v, upstream.request_timeout_s);
    }
    if (const char* v = std::getenv("MAX_RETRIES")) {
        upstream.max_retries = parse_int(v, upstream.max_retries);
    }
    if (const char* v = std::getenv("MAX_TOKENS_LIMIT")) {
        upstream.max_tokens_limit = parse_int(v, upstream.max_tokens_limit);
    }
    if (const char* v = std::getenv("MIN_TOKENS_LIMIT")) {
        upstream.min_tokens_limit = parse_int(v, upstream.min_tokens_limit);
    }
    if (const char* v = std::getenv("ANTHROPIC_API_KEY")) {
        server.client_api_key = trim(v);
    }
    if (const char* v = std::getenv("HOST")) {
        server.host = trim(v);
    }
    if (const char* v = std::getenv("PORT")) {
        server.port = parse_int(v, server.port);
    }
    if (const char* v = std::getenv("LOG_LEVEL")) {
        observability.log_level = trim(v);
    }
    if (const char* v = std::getenv("ENABLE_API_VALIDATION")) {
        probe.enabled = parse_bool(v, probe.enabled);
    }
    if (const char* v = std::getenv("KEEP_INVALID_KEYS")) {
        probe.keep_invalid_keys = parse_bool(v, probe.keep_invalid_keys);
    }
}

Result<void, Error> Config::validate() const {
    if (upstream.api_keys.empty()) {
        return Result<void, Error>::err(
            ErrorCode::UpstreamApiKeyMissing,
            "At least one upstream API key is required (upstream.api_keys or OPENAI_API_KEY)"
        );
    }

    if (upstream.models.empty()) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "At least one upstream model is required (upstream.models or BIG_MODEL)"
        );
    }

    if (upstream.base_url.empty()) {
        return Result<void, Error>::err(
            ErrorCode::ConfigKeyMissing,
            "upstream.base_url must not be empty"
        );
    }

    if (upstream.request_timeout_s <= 0 || upstream.connect_timeout_s <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "upstream timeouts must be positive"
        );
    }

    if (upstream.max_retries < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "upstream.max_retries must not be negative"
        );
    }

    if (upstream.min_tokens_limit <= 0 || upstream.min_tokens_limit > upstream.max_tokens_limit) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "upstream.min_tokens_limit must be positive and not exceed max_tokens_limit"
        );
    }

    if (server.port <= 0 || server.port > 65535) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "server.port must be between 1 and 65535"
        );
    }

    if (server.thread_pool_size < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "server.thread_pool_size must be at least 1"
        );
    }

    if (probe.timeout_s <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "probe.timeout_s must be positive"
        );
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = fs::path(expand_path(path.string()));

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto up = root["upstream"]) {
            config.upstream.base_url = expand_path(up["base_url"].as<std::string>(config.upstream.base_url));
            config.upstream.api_keys = read_list(up["api_keys"], config.upstream.api_keys);
            config.upstream.models = read_list(up["models"], config.upstream.models);
            config.upstream.azure_api_version = up["azure_api_version"].as<std::string>(config.upstream.azure_api_version);
            config.upstream.request_timeout_s = up["request_timeout_s"].as<int>(config.upstream.request_timeout_s);
            config.upstream.connect_timeout_s = up["connect_timeout_s"].as<int>(config.upstream.connect_timeout_s);
            config.upstream.max_retries = up["max_retries"].as<int>(config.upstream.max_retries);
            config.upstream.max_tokens_limit = up["max_tokens_limit"].as<int>(config.upstream.max_tokens_limit);
            config.upstream.min_tokens_limit = up["min_tokens_limit"].as<int>(config.upstream.min_tokens_limit);
            config.upstream.request_stream_usage = up["request_stream_usage"].as<bool>(config.upstream.request_stream_usage);
            config.upstream.passthrough_prefixes = read_list(up["passthrough_prefixes"], config.upstream.passthrough_prefixes);
        }

        if (auto srv = root["server"]) {
            config.server.host = srv["host"].as<std::string>(config.server.host);
            config.server.port = srv["port"].as<int>(config.server.port);
            config.server.client_api_key = expand_path(srv["client_api_key"].as<std::string>(""));
            config.server.thread_pool_size = srv["thread_pool_size"].as<int>(config.server.thread_pool_size);
        }

        if (auto pr = root["probe"]) {
            config.probe.enabled = pr["enabled"].as<bool>(config.probe.enabled);
            config.probe.keep_invalid_keys = pr["keep_invalid_keys"].as<bool>(config.probe.keep_invalid_keys);
            config.probe.key_prefix = pr["key_prefix"].as<std::string>(config.probe.key_prefix);
            config.probe.model = pr["model"].as<std::string>(config.probe.model);
            config.probe.timeout_s = pr["timeout_s"].as<int>(config.probe.timeout_s);
        }

        if (auto obs = root["observability"]) {
            config.observability.log_level = obs["log_level"].as<std::string>(config.observability.log_level);
            std::string log_path = obs["log_path"].as<std::string>("");
            if (!log_path.empty()) {
                config.observability.log_path = expand_path(log_path);
            }
        }

        config.apply_environment();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Result<Config, Error> Config::from_environment() {
    Config config;
    config.apply_environment();

    auto validation = config.validate();
    if (validation.is_err()) {
        return Result<Config, Error>::err(std::move(validation).error());
    }
    return Result<Config, Error>::ok(std::move(config));
}

}  // namespace proxypool::core
