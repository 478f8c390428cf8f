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
// Caller wire format ("Messages API")
// ---------------------------------------------------------------------------

struct TextBlock {
    std::string text;
};

// Image reference: either inline base64 data or a URL
struct ImageBlock {
    std::string media_type;
    std::string data;
    std::string url;

    bool is_url() const { return !url.empty(); }
};

struct ToolUseBlock {
    std::string id;
    std::string name;
    Json input = Json::object();
};

struct ToolResultBlock {
    std::string tool_use_id;
    std::string content;  // flattened to text
    bool is_error = false;
};

// Block kinds this proxy does not translate; kept so nothing is silently lost
struct UnknownBlock {
    std::string type;
    Json raw;
};

using ContentBlock = std::variant<TextBlock, ImageBlock, ToolUseBlock, ToolResultBlock, UnknownBlock>;

struct CanonicalMessage {
    Role role = Role::User;
    std::vector<ContentBlock> content;
};

struct ToolDefinition {
    std::string name;
    std::string description;
    Json input_schema = Json::object();
};

struct ToolChoice {
    enum class Mode { Auto, Any, Tool, None };
    Mode mode = Mode::Auto;
    std::string name;  // Mode::Tool only
};

struct CanonicalRequest {
    std::string model;
    int max_tokens = 0;
    std::vector<CanonicalMessage> messages;
    std::vector<std::string> system;  // text blocks, in order
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<int> top_k;
    std::vector<std::string> stop_sequences;
    bool stream = false;
    std::vector<ToolDefinition> tools;
    std::optional<ToolChoice> tool_choice;
    Json metadata;
};

struct CanonicalResponse {
    std::string id;
    std::string model;
    std::vector<ContentBlock> content;
    StopReason stop_reason = StopReason::EndTurn;
    TokenUsage usage;

    Json to_json() const;
};

// Parse an inbound POST /v1/messages body. Malformed content is rejected here,
// before any upstream call is attempted.
Result<CanonicalRequest, Error> parse_messages_request(const Json& body);

// Parse a POST /v1/messages/count_tokens body (no max_tokens required)
Result<CanonicalRequest, Error> parse_count_tokens_request(const Json& body);

Json content_block_to_json(const ContentBlock& block);

// Caller-protocol error body: {"type":"error","error":{"type":...,"message":...}}
Json error_body(const ErrorEnvelope& envelope);

}  // namespace proxypool::protocol
