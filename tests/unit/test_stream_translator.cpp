#include <catch2/catch_test_macros.hpp>
#include "proxypool/translate/stream_translator.hpp"

using namespace proxypool::translate;

namespace {

UpstreamChunk chunk(const char* text) {
    auto result = UpstreamChunk::from_json(Json::parse(text));
    REQUIRE(result.is_ok());
    return std::move(result).value();
}

void append(std::vector<StreamEvent>& all, std::vector<StreamEvent> more) {
    for (auto& e : more) {
        all.push_back(std::move(e));
    }
}

std::vector<std::string> names(const std::vector<StreamEvent>& events) {
    std::vector<std::string> out;
    for (const auto& e : events) {
        out.push_back(event_name(e));
    }
    return out;
}

// Every block that starts also stops, indices increase, nothing follows message_stop
void check_ordering(const std::vector<StreamEvent>& events) {
    REQUIRE_FALSE(events.empty());
    REQUIRE(event_name(events.front()) == "message_start");
    REQUIRE(event_name(events.back()) == "message_stop");

    int open = -1;
    int last_index = -1;
    int message_deltas = 0;
    for (const auto& e : events) {
        if (const auto* start = std::get_if<ContentBlockStartEvent>(&e)) {
            REQUIRE(open == -1);
            REQUIRE(start->index == last_index + 1);
            open = last_index = start->index;
        } else if (const auto* delta = std::get_if<ContentBlockDeltaEvent>(&e)) {
            REQUIRE(delta->index == open);
        } else if (const auto* stop = std::get_if<ContentBlockStopEvent>(&e)) {
            REQUIRE(stop->index == open);
            open = -1;
        } else if (std::holds_alternative<MessageDeltaEvent>(e)) {
            REQUIRE(open == -1);
            ++message_deltas;
        }
    }
    REQUIRE(open == -1);
    REQUIRE(message_deltas == 1);
}

}  // namespace

TEST_CASE("Text stream produces the full event sequence", "[translate][stream]") {
    StreamTranslator machine("claude", 10);
    std::vector<StreamEvent> events;

    append(events, machine.on_chunk(chunk(R"({"choices":[{"delta":{"role":"assistant"}}]})")));
    REQUIRE(machine.state() == StreamState::MessageStarted);
    append(events, machine.on_chunk(chunk(R"({"choices":[{"delta":{"content":"Hel"}}]})")));
    REQUIRE(machine.state() == StreamState::BlockOpen);
    append(events, machine.on_chunk(chunk(R"({"choices":[{"delta":{"content":"lo"}}]})")));
    append(events, machine.on_chunk(chunk(R"({"choices":[{"delta":{},"finish_reason":"stop"}]})")));
    REQUIRE(machine.state() == StreamState::MessageStopping);
    append(events, machine.on_chunk(chunk(R"({"choices":[],"usage":{"prompt_tokens":5,"completion_tokens":2}})")));
    append(events, machine.finish());

    REQUIRE(machine.state() == StreamState::Done);
    REQUIRE(names(events) == std::vector<std::string>{
        "message_start", "ping",
        "content_block_start", "content_block_delta", "content_block_delta", "content_block_stop",
        "message_delta", "message_stop"});
    check_ordering(events);

    const auto& start = std::get<MessageStartEvent>(events[0]);
    REQUIRE(start.id == machine.message_id());
    REQUIRE(start.model == "claude");

    const auto& delta = std::get<MessageDeltaEvent>(events[6]);
    REQUIRE(delta.stop_reason == StopReason::EndTurn);
    REQUIRE(delta.usage.input_tokens == 5);
    REQUIRE(delta.usage.output_tokens == 2);
    REQUIRE_FALSE(delta.usage.estimated);
}

TEST_CASE("Tool argument fragments concatenate to the original JSON", "[translate][stream]") {
    StreamTranslator machine("claude", 0);
    std::vector<StreamEvent> events;

    append(events, machine.on_chunk(chunk(R"({"choices":[{"delta":{"role":"assistant","content":"Sure."}}]})")));
    append(events, machine.on_chunk(chunk(
        R"({"choices":[{"delta":{"tool_calls":[{"index":0,"id":"call_1","function":{"name":"f","arguments":""}}]}}]})")));
    append(events, machine.on_chunk(chunk(
        R"({"choices":[{"delta":{"tool_calls":[{"index":0,"function":{"arguments":"{\"a\":"}}]}}]})")));
    append(events, machine.on_chunk(chunk(
        R"({"choices":[{"delta":{"tool_calls":[{"index":0,"function":{"arguments":"1}"}}]}}]})")));
    append(events, machine.on_chunk(chunk(R"({"choices":[{"delta":{},"finish_reason":"tool_calls"}]})")));
    append(events, machine.finish());

    check_ordering(events);

    std::string arguments;
    const ContentBlockStartEvent* tool_start = nullptr;
    for (const auto& e : events) {
        if (const auto* start = std::get_if<ContentBlockStartEvent>(&e)) {
            if (start->kind == BlockKind::ToolUse) tool_start = start;
        }
        if (const auto* delta = std::get_if<ContentBlockDeltaEvent>(&e)) {
            if (delta->kind == DeltaKind::InputJson) arguments += delta->payload;
        }
    }

    REQUIRE(tool_start != nullptr);
    REQUIRE(tool_start->index == 1);
    REQUIRE(tool_start->tool_id == "call_1");
    REQUIRE(tool_start->tool_name == "f");
    REQUIRE(arguments == "{\"a\":1}");
    REQUIRE(Json::parse(arguments) == Json{{"a", 1}});

    const auto& message_delta = std::get<MessageDeltaEvent>(events[events.size() - 2]);
    REQUIRE(message_delta.stop_reason == StopReason::ToolUse);
}

TEST_CASE("Parallel tool calls open one block each", "[translate][stream]") {
    StreamTranslator machine("claude", 0);
    std::vector<StreamEvent> events;

    append(events, machine.on_chunk(chunk(
        R"({"choices":[{"delta":{"tool_calls":[{"index":0,"id":"a","function":{"name":"f","arguments":"{}"}}]}}]})")));
    append(events, machine.on_chunk(chunk(
        R"({"choices":[{"delta":{"tool_calls":[{"index":1,"id":"b","function":{"name":"g","arguments":"{}"}}]}}]})")));
    // Late fragment for a block that is already closed
    append(events, machine.on_chunk(chunk(
        R"({"choices":[{"delta":{"tool_calls":[{"index":0,"function":{"arguments":"x"}}]}}]})")));
    append(events, machine.finish());

    check_ordering(events);
    int tool_blocks = 0;
    for (const auto& e : events) {
        if (std::holds_alternative<ContentBlockStartEvent>(e)) ++tool_blocks;
        if (const auto* delta = std::get_if<ContentBlockDeltaEvent>(&e)) {
            REQUIRE(delta->payload != "x");
        }
    }
    REQUIRE(tool_blocks == 2);
}

TEST_CASE("Truncated stream without usage reports an estimate", "[translate][stream]") {
    StreamTranslator machine("claude", 12);
    std::vector<StreamEvent> events;

    append(events, machine.on_chunk(chunk(R"({"choices":[{"delta":{"role":"assistant","content":"abcdefgh"}}]})")));
    append(events, machine.on_chunk(chunk(R"({"choices":[{"delta":{},"finish_reason":"length"}]})")));
    // No usage yet, so message_delta waits for finish()
    REQUIRE(names(events).back() == "content_block_stop");
    append(events, machine.finish());

    check_ordering(events);
    const auto& delta = std::get<MessageDeltaEvent>(events[events.size() - 2]);
    REQUIRE(delta.stop_reason == StopReason::MaxTokens);
    REQUIRE(delta.usage.estimated);
    REQUIRE(delta.usage.input_tokens == 12);
    REQUIRE(delta.usage.output_tokens == 2);
}

TEST_CASE("Stream that ends without a finish reason is closed cleanly", "[translate][stream]") {
    StreamTranslator machine("claude", 0);
    std::vector<StreamEvent> events;

    append(events, machine.on_chunk(chunk(R"({"choices":[{"delta":{"content":"partial"}}]})")));
    append(events, machine.finish());

    check_ordering(events);
    REQUIRE(std::get<MessageDeltaEvent>(events[events.size() - 2]).stop_reason == StopReason::EndTurn);
}

TEST_CASE("Upstream with no content still yields a well-formed stream", "[translate][stream]") {
    StreamTranslator machine("claude", 0);
    auto events = machine.finish();

    REQUIRE(names(events) == std::vector<std::string>{"message_start", "ping", "message_delta", "message_stop"});
    REQUIRE(machine.finish().empty());
}

TEST_CASE("Empty deltas do not start the message", "[translate][stream]") {
    StreamTranslator machine("claude", 0);
    REQUIRE(machine.on_chunk(chunk(R"({"choices":[{"delta":{}}]})")).empty());
    REQUIRE(machine.on_chunk(chunk(R"({"choices":[{"delta":{"content":""}}]})")).empty());
    REQUIRE_FALSE(machine.started());
    REQUIRE(machine.state() == StreamState::Idle);
}

TEST_CASE("Cancelled machine emits nothing further", "[translate][stream]") {
    StreamTranslator machine("claude", 0);
    REQUIRE_FALSE(machine.on_chunk(chunk(R"({"choices":[{"delta":{"content":"hi"}}]})")).empty());

    machine.cancel();
    REQUIRE(machine.state() == StreamState::Cancelled);
    REQUIRE(machine.is_terminal());
    REQUIRE(machine.on_chunk(chunk(R"({"choices":[{"delta":{"content":"more"}}]})")).empty());
    REQUIRE(machine.finish().empty());
    REQUIRE(machine.fail(ErrorEnvelope{}).empty());
}

TEST_CASE("Failure before any output is a single error event", "[translate][stream]") {
    StreamTranslator machine("claude", 0);

    ErrorEnvelope error;
    error.category = ErrorCategory::RateLimited;
    error.message = "slow down";
    auto events = machine.fail(error);

    REQUIRE(events.size() == 1);
    const auto& event = std::get<ErrorEvent>(events[0]);
    REQUIRE(event.error.category == ErrorCategory::RateLimited);
    REQUIRE(event_payload(events[0])["error"]["type"] == "rate_limit_error");
    REQUIRE(machine.state() == StreamState::Failed);
    REQUIRE(machine.finish().empty());
}
