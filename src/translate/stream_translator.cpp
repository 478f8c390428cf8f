#include "proxypool/translate/stream_translator.hpp"
#include "proxypool/core/uuid.hpp"
#include "proxypool/translate/response_translator.hpp"
#include "proxypool/translate/token_estimator.hpp"

#include <spdlog/spdlog.h>

namespace proxypool::translate {

std::string stream_state_to_string(StreamState state) {
    switch (state) {
        case StreamState::Idle: return "idle";
        case StreamState::MessageStarted: return "message_started";
        case StreamState::BlockOpen: return "block_open";
        case StreamState::MessageStopping: return "message_stopping";
        case StreamState::Done: return "done";
        case StreamState::Cancelled: return "cancelled";
        case StreamState::Failed: return "failed";
    }
    return "unknown";
}

StreamTranslator::StreamTranslator(std::string requested_model, int estimated_input_tokens)
    : model_(std::move(requested_model))
    , message_id_(generate_message_id())
    , estimated_input_tokens_(estimated_input_tokens)
{
}

bool StreamTranslator::is_terminal() const {
    return state_ == StreamState::Done
        || state_ == StreamState::Cancelled
        || state_ == StreamState::Failed;
}

TokenUsage StreamTranslator::current_usage() const {
    TokenUsage usage;
    if (usage_) {
        usage.input_tokens = usage_->prompt_tokens;
        usage.output_tokens = usage_->completion_tokens;
    } else {
        usage.input_tokens = estimated_input_tokens_;
        usage.output_tokens = TokenEstimator::from_chars(output_chars_);
        usage.estimated = true;
    }
    return usage;
}

void StreamTranslator::start_message(std::vector<StreamEvent>& out) {
    if (started_) {
        return;
    }
    started_ = true;
    state_ = StreamState::MessageStarted;
    out.push_back(MessageStartEvent{message_id_, model_, TokenUsage{}});
    out.push_back(PingEvent{});
}

void StreamTranslator::close_block(std::vector<StreamEvent>& out) {
    if (open_kind_ == OpenKind::None) {
        return;
    }
    out.push_back(ContentBlockStopEvent{open_block_index_});
    open_kind_ = OpenKind::None;
    open_block_index_ = -1;
    open_tool_call_ = -1;
    state_ = StreamState::MessageStarted;
}

void StreamTranslator::emit_text(const std::string& text, std::vector<StreamEvent>& out) {
    if (open_kind_ != OpenKind::Text) {
        close_block(out);
        open_block_index_ = next_block_index_++;
        open_kind_ = OpenKind::Text;
        state_ = StreamState::BlockOpen;
        out.push_back(ContentBlockStartEvent{open_block_index_, BlockKind::Text, "", ""});
    }
    output_chars_ += text.size();
    out.push_back(ContentBlockDeltaEvent{open_block_index_, DeltaKind::Text, text});
}

void StreamTranslator::emit_tool_call(const ToolCallDelta& delta, std::vector<StreamEvent>& out) {
    bool continues_open = open_kind_ == OpenKind::ToolUse && open_tool_call_ == delta.index;

    if (!continues_open) {
        if (seen_tool_calls_.count(delta.index) > 0) {
            spdlog::warn("Dropping fragment for closed tool call {} ({} bytes)",
                         delta.index, delta.arguments.size());
            return;
        }

        close_block(out);
        seen_tool_calls_.insert(delta.index);
        open_block_index_ = next_block_index_++;
        open_kind_ = OpenKind::ToolUse;
        open_tool_call_ = delta.index;
        state_ = StreamState::BlockOpen;

        std::string id = delta.id && !delta.id->empty() ? *delta.id : generate_tool_use_id();
        out.push_back(ContentBlockStartEvent{
            open_block_index_, BlockKind::ToolUse, std::move(id), delta.name.value_or("")});
    }

    if (!delta.arguments.empty()) {
        output_chars_ += delta.arguments.size();
        out.push_back(ContentBlockDeltaEvent{open_block_index_, DeltaKind::InputJson, delta.arguments});
    }
}

void StreamTranslator::emit_message_delta(std::vector<StreamEvent>& out) {
    if (message_delta_sent_) {
        return;
    }
    message_delta_sent_ = true;
    out.push_back(MessageDeltaEvent{stop_reason_.value_or(StopReason::EndTurn), current_usage()});
}

std::vector<StreamEvent> StreamTranslator::on_chunk(const UpstreamChunk& chunk) {
    std::vector<StreamEvent> out;
    if (is_terminal()) {
        return out;
    }

    if (chunk.usage) {
        usage_ = chunk.usage;
    }

    if (state_ == StreamState::MessageStopping) {
        // Only a trailing usage report is meaningful after the finish reason
        if (chunk.usage) {
            emit_message_delta(out);
        } else if (chunk.content || !chunk.tool_calls.empty()) {
            spdlog::debug("Ignoring content after finish reason");
        }
        return out;
    }

    bool has_text = chunk.content && !chunk.content->empty();
    bool has_tools = !chunk.tool_calls.empty();

    if (chunk.role || has_text || has_tools || chunk.finish_reason) {
        start_message(out);
    }

    if (has_text) {
        emit_text(*chunk.content, out);
    }

    for (const auto& delta : chunk.tool_calls) {
        emit_tool_call(delta, out);
    }

    if (chunk.finish_reason) {
        close_block(out);
        stop_reason_ = map_finish_reason(chunk.finish_reason);
        state_ = StreamState::MessageStopping;
        if (usage_) {
            emit_message_delta(out);
        }
    }

    return out;
}

std::vector<StreamEvent> StreamTranslator::finish() {
    std::vector<StreamEvent> out;
    if (is_terminal()) {
        return out;
    }

    start_message(out);
    close_block(out);
    if (!stop_reason_) {
        stop_reason_ = map_finish_reason(std::string("stop"));
    }
    emit_message_delta(out);
    out.push_back(MessageStopEvent{});
    state_ = StreamState::Done;
    return out;
}

std::vector<StreamEvent> StreamTranslator::fail(const ErrorEnvelope& error) {
    std::vector<StreamEvent> out;
    if (is_terminal()) {
        return out;
    }
    out.push_back(ErrorEvent{error});
    state_ = StreamState::Failed;
    return out;
}

void StreamTranslator::cancel() {
    if (is_terminal()) {
        return;
    }
    state_ = StreamState::Cancelled;
}

}  // namespace proxypool::translate
