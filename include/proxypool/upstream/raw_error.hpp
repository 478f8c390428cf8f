#pragma once

#include <optional>
#include <string>

namespace proxypool::upstream {

enum class TransportFailure {
    None,           // the upstream answered; see status/body
    ConnectFailed,
    Timeout,
    Reset,
    Cancelled,
    Malformed       // the upstream answered with something we cannot read
};

inline const char* transport_failure_to_string(TransportFailure kind) {
    switch (kind) {
        case TransportFailure::None: return "none";
        case TransportFailure::ConnectFailed: return "connect_failed";
        case TransportFailure::Timeout: return "timeout";
        case TransportFailure::Reset: return "reset";
        case TransportFailure::Cancelled: return "cancelled";
        case TransportFailure::Malformed: return "malformed";
    }
    return "unknown";
}

// An upstream failure as observed, before classification
struct RawUpstreamError {
    std::optional<int> status;
    std::string body;
    TransportFailure transport = TransportFailure::None;
    std::string description;

    static RawUpstreamError http(int status, std::string body) {
        RawUpstreamError e;
        e.status = status;
        e.body = std::move(body);
        return e;
    }

    static RawUpstreamError transport_error(TransportFailure kind, std::string description) {
        RawUpstreamError e;
        e.transport = kind;
        e.description = std::move(description);
        return e;
    }

    std::string to_string() const {
        std::string result = transport_failure_to_string(transport);
        if (status) {
            result += " status=" + std::to_string(*status);
        }
        if (!description.empty()) {
            result += " " + description;
        }
        return result;
    }
};

}  // namespace proxypool::upstream
