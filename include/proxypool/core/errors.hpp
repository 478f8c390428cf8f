#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace proxypool::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    Timeout = 6,
    Cancelled = 7,
    InternalError = 9,
    InvalidState = 10,

    // Upstream errors (200-299)
    UpstreamConnectionFailed = 200,
    UpstreamRateLimited = 201,
    UpstreamInvalidResponse = 203,
    UpstreamApiKeyMissing = 204,
    UpstreamUnavailable = 205,
    UpstreamStreamError = 207,

    // Translation errors (300-399)
    RequestParseFailed = 300,
    UnsupportedContent = 301,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,
    ConfigKeyMissing = 603,

    // Network errors (800-899)
    NetworkError = 800,
    ConnectionRefused = 801,
    SSLError = 803,
};

inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";

        case ErrorCode::UpstreamConnectionFailed: return "Failed to connect to upstream";
        case ErrorCode::UpstreamRateLimited: return "Upstream rate limit exceeded";
        case ErrorCode::UpstreamInvalidResponse: return "Invalid response from upstream";
        case ErrorCode::UpstreamApiKeyMissing: return "Upstream API key not configured";
        case ErrorCode::UpstreamUnavailable: return "Upstream unavailable";
        case ErrorCode::UpstreamStreamError: return "Upstream streaming error";

        case ErrorCode::RequestParseFailed: return "Failed to parse request";
        case ErrorCode::UnsupportedContent: return "Unsupported content";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";
        case ErrorCode::ConfigKeyMissing: return "Required configuration key missing";

        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionRefused: return "Connection refused";
        case ErrorCode::SSLError: return "SSL/TLS error";
    }
    return "Unknown error code";
}

inline bool is_fatal(ErrorCode code) {
    switch (code) {
        case ErrorCode::UpstreamApiKeyMissing:
        case ErrorCode::ConfigParseFailed:
        case ErrorCode::ConfigValidationFailed:
        case ErrorCode::ConfigKeyMissing:
            return true;
        default:
            return false;
    }
}

inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::Timeout:
        case ErrorCode::UpstreamConnectionFailed:
        case ErrorCode::UpstreamRateLimited:
        case ErrorCode::UpstreamUnavailable:
        case ErrorCode::NetworkError:
        case ErrorCode::ConnectionRefused:
            return true;
        default:
            return false;
    }
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Additional context (file path, field name, etc.)
    std::optional<std::string> source;   // Component that raised it

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    bool is_fatal() const { return proxypool::core::is_fatal(code); }
    bool is_retriable() const { return proxypool::core::is_retriable(code); }

    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

// Caller-facing error taxonomy
enum class ErrorCategory {
    Authentication,
    RateLimited,
    InvalidRequest,
    UpstreamUnavailable,
    Timeout,
    Internal,
    Cancelled  // caller went away; never delivered to anyone
};

inline std::string_view category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Authentication: return "authentication";
        case ErrorCategory::RateLimited: return "rate_limited";
        case ErrorCategory::InvalidRequest: return "invalid_request";
        case ErrorCategory::UpstreamUnavailable: return "upstream_unavailable";
        case ErrorCategory::Timeout: return "timeout";
        case ErrorCategory::Internal: return "internal";
        case ErrorCategory::Cancelled: return "cancelled";
    }
    return "internal";
}

// Error type name used in the caller protocol's error body
inline std::string_view category_wire_type(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Authentication: return "authentication_error";
        case ErrorCategory::RateLimited: return "rate_limit_error";
        case ErrorCategory::InvalidRequest: return "invalid_request_error";
        case ErrorCategory::UpstreamUnavailable: return "overloaded_error";
        case ErrorCategory::Timeout:
        case ErrorCategory::Internal:
        case ErrorCategory::Cancelled:
            return "api_error";
    }
    return "api_error";
}

inline int category_http_status(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Authentication: return 401;
        case ErrorCategory::RateLimited: return 429;
        case ErrorCategory::InvalidRequest: return 400;
        case ErrorCategory::UpstreamUnavailable: return 503;
        case ErrorCategory::Timeout: return 504;
        case ErrorCategory::Internal: return 500;
        case ErrorCategory::Cancelled: return 499;
    }
    return 500;
}

// A classified failure, ready to be shown to the caller
struct ErrorEnvelope {
    ErrorCategory category = ErrorCategory::Internal;
    std::string message;
    std::optional<int> upstream_status;

    // Retrying with another credential may help
    bool is_retriable() const {
        return category == ErrorCategory::RateLimited ||
               category == ErrorCategory::UpstreamUnavailable ||
               category == ErrorCategory::Timeout;
    }

    std::string to_string() const {
        std::string result = std::string(category_to_string(category)) + ": " + message;
        if (upstream_status) {
            result += " (upstream status " + std::to_string(*upstream_status) + ")";
        }
        return result;
    }
};

}  // namespace proxypool::core
