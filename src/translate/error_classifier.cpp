#include "proxypool/translate/error_classifier.hpp"
#include "proxypool/protocol/chat_completions.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace proxypool::translate {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::optional<ErrorCategory> category_from_status(int status) {
    if (status < 400) return std::nullopt;
    if (status == 401) return ErrorCategory::Authentication;
    if (status == 429) return ErrorCategory::RateLimited;
    if (status == 408) return ErrorCategory::Timeout;
    if (status < 500) return ErrorCategory::InvalidRequest;
    return ErrorCategory::UpstreamUnavailable;
}

std::optional<ErrorCategory> category_from_transport(TransportFailure kind) {
    switch (kind) {
        case TransportFailure::Timeout: return ErrorCategory::Timeout;
        case TransportFailure::ConnectFailed:
        case TransportFailure::Reset:
            return ErrorCategory::UpstreamUnavailable;
        case TransportFailure::Cancelled: return ErrorCategory::Cancelled;
        case TransportFailure::None:
        case TransportFailure::Malformed:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<ErrorCategory> category_from_text(const std::string& text) {
    std::string lower = to_lower(text);
    if (contains_any(lower, {"unauthorized", "invalid api key", "incorrect api key", "authentication"})) {
        return ErrorCategory::Authentication;
    }
    if (contains_any(lower, {"rate limit", "rate_limit", "quota", "too many requests"})) {
        return ErrorCategory::RateLimited;
    }
    if (contains_any(lower, {"timed out", "timeout", "deadline"})) {
        return ErrorCategory::Timeout;
    }
    if (contains_any(lower, {"connection refused", "reset", "unavailable", "overloaded", "bad gateway"})) {
        return ErrorCategory::UpstreamUnavailable;
    }
    if (contains_any(lower, {"invalid request", "invalid_request", "context length", "context_length"})) {
        return ErrorCategory::InvalidRequest;
    }
    return std::nullopt;
}

std::string default_message(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Authentication: return "Upstream rejected the credential";
        case ErrorCategory::RateLimited: return "Upstream rate limit exceeded";
        case ErrorCategory::InvalidRequest: return "Upstream rejected the request";
        case ErrorCategory::UpstreamUnavailable: return "Upstream unavailable";
        case ErrorCategory::Timeout: return "Upstream request timed out";
        case ErrorCategory::Cancelled: return "Request cancelled";
        case ErrorCategory::Internal: return "Unexpected upstream failure";
    }
    return "Unexpected upstream failure";
}

// Cut at a UTF-8 character boundary
std::string truncate_utf8(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) {
        return s;
    }
    size_t cut = max_len;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return s.substr(0, cut);
}

}  // namespace

ErrorClassifier::ErrorClassifier(std::vector<std::string> secrets)
    : secrets_(std::move(secrets))
{
    secrets_.erase(std::remove_if(secrets_.begin(), secrets_.end(),
                                  [](const std::string& s) { return s.empty(); }),
                   secrets_.end());
}

std::string ErrorClassifier::describe(const RawUpstreamError& error) const {
    if (!error.body.empty()) {
        Json parsed = Json::parse(error.body, nullptr, false);
        if (!parsed.is_discarded()) {
            if (auto message = protocol::extract_error_message(parsed)) {
                return *message;
            }
        }
        return error.body;
    }
    return error.description;
}

std::string ErrorClassifier::sanitize(const std::string& message) const {
    std::string out = message;

    for (const auto& secret : secrets_) {
        size_t pos = 0;
        while ((pos = out.find(secret, pos)) != std::string::npos) {
            out.replace(pos, secret.size(), "[redacted]");
            pos += 10;
        }
    }

    static const std::regex bearer(R"((Bearer|bearer)\s+[A-Za-z0-9._~+/=\-]+)");
    static const std::regex key_literal(R"(\b(sk|ms)-[A-Za-z0-9_\-]{6,})");
    out = std::regex_replace(out, bearer, "Bearer [redacted]");
    out = std::regex_replace(out, key_literal, "[redacted]");

    return truncate_utf8(out, kMaxMessageLength);
}

ErrorEnvelope ErrorClassifier::classify(const RawUpstreamError& error) const {
    std::string detail = describe(error);

    std::optional<ErrorCategory> category;
    if (error.status) {
        category = category_from_status(*error.status);
    }
    if (!category) {
        category = category_from_transport(error.transport);
    }
    if (!category) {
        category = category_from_text(detail + " " + error.description);
    }

    ErrorEnvelope envelope;
    envelope.category = category.value_or(ErrorCategory::Internal);
    envelope.upstream_status = error.status;

    std::string message = sanitize(detail);
    envelope.message = message.empty() ? default_message(envelope.category) : message;
    return envelope;
}

}  // namespace proxypool::translate
