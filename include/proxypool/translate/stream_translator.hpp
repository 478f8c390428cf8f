#pragma once

#include "proxypool/protocol/chat_completions.hpp"
#include "proxypool/protocol/stream_event.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace proxypool::translate {

using namespace proxypool::core;
using namespace proxypool::protocol;

enum class StreamState {
    Idle,
    MessageStarted,
    BlockOpen,
    MessageStopping,
    Done,
    Cancelled,
    Failed
};

std::string stream_state_to_string(StreamState state);

// Streaming state machine: upstream deltas in, caller-protocol events out.
//
// Every call returns the events to emit, in order. Once the machine reaches a
// terminal state (Done, Cancelled, Failed) every further call returns nothing.
//
// Not thread-safe; one instance belongs to one streaming call.
class StreamTranslator {
public:
    StreamTranslator(std::string requested_model, int estimated_input_tokens);

    std::vector<StreamEvent> on_chunk(const UpstreamChunk& chunk);

    // Upstream exhausted. Closes the open block, synthesizes a stop reason if
    // none arrived, then emits message_delta (if still pending) and message_stop.
    std::vector<StreamEvent> finish();

    // Upstream failed. Emits one error event and ends the stream.
    std::vector<StreamEvent> fail(const ErrorEnvelope& error);

    // Caller went away. Nothing more is emitted, not even message_stop.
    void cancel();

    StreamState state() const { return state_; }
    bool started() const { return started_; }
    bool is_terminal() const;
    const std::string& message_id() const { return message_id_; }

    // Usage as it would be reported right now
    TokenUsage current_usage() const;

private:
    enum class OpenKind { None, Text, ToolUse };

    std::string model_;
    std::string message_id_;
    int estimated_input_tokens_;

    StreamState state_ = StreamState::Idle;
    bool started_ = false;

    int next_block_index_ = 0;
    int open_block_index_ = -1;
    OpenKind open_kind_ = OpenKind::None;
    int open_tool_call_ = -1;      // upstream tool-call index of the open block
    std::set<int> seen_tool_calls_;

    std::optional<StopReason> stop_reason_;
    bool message_delta_sent_ = false;
    std::optional<UpstreamUsage> usage_;
    size_t output_chars_ = 0;

    void start_message(std::vector<StreamEvent>& out);
    void close_block(std::vector<StreamEvent>& out);
    void emit_text(const std::string& text, std::vector<StreamEvent>& out);
    void emit_tool_call(const ToolCallDelta& delta, std::vector<StreamEvent>& out);
    void emit_message_delta(std::vector<StreamEvent>& out);
};

}  // namespace proxypool::translate
