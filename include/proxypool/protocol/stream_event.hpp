#pragma once

#include "proxypool/core/errors.hpp"
#include "proxypool/core/types.hpp"

#include <string>
#include <variant>

namespace proxypool::protocol {

using namespace proxypool::core;

// Caller-protocol streaming events, in the order the protocol requires:
// message_start, (content_block_start, content_block_delta*, content_block_stop)*,
// message_delta, message_stop. `error` replaces the remainder of the stream.

struct MessageStartEvent {
    std::string id;
    std::string model;
    TokenUsage usage;
};

enum class BlockKind { Text, ToolUse };

struct ContentBlockStartEvent {
    int index = 0;
    BlockKind kind = BlockKind::Text;
    std::string tool_id;    // ToolUse only
    std::string tool_name;  // ToolUse only
};

enum class DeltaKind { Text, InputJson };

struct ContentBlockDeltaEvent {
    int index = 0;
    DeltaKind kind = DeltaKind::Text;
    std::string payload;  // text or partial JSON fragment
};

struct ContentBlockStopEvent {
    int index = 0;
};

struct MessageDeltaEvent {
    StopReason stop_reason = StopReason::EndTurn;
    TokenUsage usage;
};

struct MessageStopEvent {};

struct ErrorEvent {
    ErrorEnvelope error;
};

struct PingEvent {};

using StreamEvent = std::variant<
    MessageStartEvent,
    ContentBlockStartEvent,
    ContentBlockDeltaEvent,
    ContentBlockStopEvent,
    MessageDeltaEvent,
    MessageStopEvent,
    ErrorEvent,
    PingEvent>;

std::string event_name(const StreamEvent& event);

Json event_payload(const StreamEvent& event);

// Server-sent-event framing: "event: <name>\ndata: <json>\n\n"
std::string to_sse(const StreamEvent& event);

}  // namespace proxypool::protocol
