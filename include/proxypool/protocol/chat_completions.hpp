#pragma once

#include "proxypool/core/result.hpp"
#include "proxypool/core/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace proxypool::protocol {

using namespace proxypool::core;

// ---------------------------------------------------------------------------
// Upstream wire format ("Chat-Completions API")
// ---------------------------------------------------------------------------

struct TextPart {
    std::string text;
};

struct ImageUrlPart {
    std::string url;  // http(s) URL or data: URL
};

using ContentPart = std::variant<TextPart, ImageUrlPart>;

// Flat string, list of typed parts, or absent (assistant turn with only tool calls)
using UpstreamContent = std::variant<std::monostate, std::string, std::vector<ContentPart>>;

struct ToolCallPayload {
    std::string id;
    std::string name;
    std::string arguments;  // JSON text, passed through verbatim
};

struct UpstreamMessage {
    Role role = Role::User;
    UpstreamContent content;
    std::vector<ToolCallPayload> tool_calls;
    std::optional<std::string> tool_call_id;  // role == Tool

    Json to_json() const;
};

struct FunctionDeclaration {
    std::string name;
    std::string description;
    Json parameters = Json::object();
};

struct UpstreamRequest {
    std::string model;
    std::vector<UpstreamMessage> messages;
    int max_tokens = 0;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::vector<std::string> stop;
    bool stream = false;
    bool include_usage = false;  // stream_options.include_usage
    std::vector<FunctionDeclaration> tools;
    Json tool_choice;  // null when absent

    Json to_json() const;
};

struct UpstreamUsage {
    int prompt_tokens = 0;
    int completion_tokens = 0;
};

struct UpstreamResponse {
    std::string id;
    std::string model;
    Role role = Role::Assistant;
    std::vector<ContentPart> content;  // text parts in order; a flat string becomes one part
    std::vector<ToolCallPayload> tool_calls;
    std::optional<std::string> finish_reason;
    std::optional<UpstreamUsage> usage;

    // Reads the first choice. A body carrying an "error" object is an error.
    static Result<UpstreamResponse, Error> from_json(const Json& j);
};

struct ToolCallDelta {
    int index = 0;
    std::optional<std::string> id;
    std::optional<std::string> name;
    std::string arguments;  // fragment
};

// One incremental delta from a streamed upstream response
struct UpstreamChunk {
    std::optional<std::string> role;
    std::optional<std::string> content;
    std::vector<ToolCallDelta> tool_calls;
    std::optional<std::string> finish_reason;
    std::optional<UpstreamUsage> usage;

    bool is_empty() const {
        return !role && !content && tool_calls.empty() && !finish_reason && !usage;
    }

    // Parses one SSE data payload. A payload carrying an "error" object is an error.
    static Result<UpstreamChunk, Error> from_json(const Json& j);
};

// Replays a complete response as the deltas a streamed one would have produced
std::vector<UpstreamChunk> response_as_chunks(const UpstreamResponse& response);

// Extract the human-readable message from an upstream error body, if any
std::optional<std::string> extract_error_message(const Json& j);

}  // namespace proxypool::protocol
