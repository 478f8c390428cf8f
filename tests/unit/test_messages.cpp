#include <catch2/catch_test_macros.hpp>
#include "proxypool/protocol/messages.hpp"
#include "proxypool/protocol/stream_event.hpp"

using namespace proxypool::protocol;

TEST_CASE("Parse a minimal request", "[protocol]") {
    Json body = Json::parse(R"({
        "model": "claude-3-5-sonnet",
        "max_tokens": 256,
        "messages": [{"role": "user", "content": "Hello"}]
    })");

    auto result = parse_messages_request(body);
    REQUIRE(result.is_ok());

    const auto& req = result.value();
    REQUIRE(req.model == "claude-3-5-sonnet");
    REQUIRE(req.max_tokens == 256);
    REQUIRE_FALSE(req.stream);
    REQUIRE(req.messages.size() == 1);
    REQUIRE(req.messages[0].role == Role::User);
    REQUIRE(std::get<TextBlock>(req.messages[0].content[0]).text == "Hello");
}

TEST_CASE("Parse system blocks, tools and tool_choice", "[protocol]") {
    Json body = Json::parse(R"({
        "model": "m",
        "max_tokens": 100,
        "stream": true,
        "system": [{"type": "text", "text": "Be brief."}, {"type": "text", "text": "Be kind."}],
        "messages": [
            {"role": "user", "content": [
                {"type": "text", "text": "Look"},
                {"type": "image", "source": {"type": "base64", "media_type": "image/jpeg", "data": "AAAA"}}
            ]},
            {"role": "assistant", "content": [
                {"type": "tool_use", "id": "toolu_1", "name": "lookup", "input": {"q": "x"}}
            ]},
            {"role": "user", "content": [
                {"type": "tool_result", "tool_use_id": "toolu_1",
                 "content": [{"type": "text", "text": "line 1"}, {"type": "text", "text": "line 2"}]},
                {"type": "thinking", "thinking": "hmm"}
            ]}
        ],
        "tools": [{"name": "lookup", "description": "Find", "input_schema": {"type": "object"}}],
        "tool_choice": {"type": "tool", "name": "lookup"},
        "top_k": 5
    })");

    auto result = parse_messages_request(body);
    REQUIRE(result.is_ok());

    const auto& req = result.value();
    REQUIRE(req.stream);
    REQUIRE(req.system == std::vector<std::string>{"Be brief.", "Be kind."});
    REQUIRE(req.top_k == 5);

    const auto& image = std::get<ImageBlock>(req.messages[0].content[1]);
    REQUIRE(image.media_type == "image/jpeg");
    REQUIRE_FALSE(image.is_url());

    const auto& tool_use = std::get<ToolUseBlock>(req.messages[1].content[0]);
    REQUIRE(tool_use.input["q"] == "x");

    const auto& tool_result = std::get<ToolResultBlock>(req.messages[2].content[0]);
    REQUIRE(tool_result.content == "line 1\nline 2");
    REQUIRE(std::holds_alternative<UnknownBlock>(req.messages[2].content[1]));

    REQUIRE(req.tools.size() == 1);
    REQUIRE(req.tool_choice);
    REQUIRE(req.tool_choice->mode == ToolChoice::Mode::Tool);
    REQUIRE(req.tool_choice->name == "lookup");
}

TEST_CASE("Malformed requests are rejected with the offending field", "[protocol]") {
    SECTION("missing model") {
        auto result = parse_messages_request(Json{{"max_tokens", 1}, {"messages", Json::array()}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::RequestParseFailed);
        REQUIRE(result.error().context == "model");
    }
    SECTION("missing max_tokens") {
        auto result = parse_messages_request(Json{{"model", "m"}, {"messages", Json::array()}});
        REQUIRE(result.is_err());
        REQUIRE(result.error().context == "max_tokens");
    }
    SECTION("unknown role") {
        Json body = Json::parse(
            R"({"model": "m", "max_tokens": 1, "messages": [{"role": "robot", "content": "hi"}]})");
        auto result = parse_messages_request(body);
        REQUIRE(result.is_err());
        REQUIRE(result.error().context == "messages[0].role");
    }
    SECTION("non-object block") {
        Json body = Json::parse(
            R"({"model": "m", "max_tokens": 1, "messages": [{"role": "user", "content": [42]}]})");
        auto result = parse_messages_request(body);
        REQUIRE(result.is_err());
        REQUIRE(result.error().context == "messages[0].content[0]");
    }
}

TEST_CASE("count_tokens does not need max_tokens", "[protocol]") {
    Json body = Json::parse(R"({"model": "m", "messages": [{"role": "user", "content": "hi"}]})");
    REQUIRE(parse_count_tokens_request(body).is_ok());
    REQUIRE(parse_messages_request(body).is_err());
}

TEST_CASE("Error body uses the caller error types", "[protocol]") {
    ErrorEnvelope envelope;
    envelope.category = ErrorCategory::UpstreamUnavailable;
    envelope.message = "down";

    Json body = error_body(envelope);
    REQUIRE(body["type"] == "error");
    REQUIRE(body["error"]["type"] == "overloaded_error");
    REQUIRE(body["error"]["message"] == "down");
}

TEST_CASE("Stream events frame as server-sent events", "[protocol]") {
    StreamEvent start = MessageStartEvent{"msg_1", "claude", TokenUsage{}};
    std::string frame = to_sse(start);

    REQUIRE(frame.rfind("event: message_start\ndata: ", 0) == 0);
    REQUIRE(frame.substr(frame.size() - 2) == "\n\n");

    Json payload = event_payload(start);
    REQUIRE(payload["type"] == "message_start");
    REQUIRE(payload["message"]["id"] == "msg_1");
    REQUIRE(payload["message"]["usage"]["input_tokens"] == 0);

    Json delta = event_payload(ContentBlockDeltaEvent{2, DeltaKind::InputJson, "{\"a\":"});
    REQUIRE(delta["index"] == 2);
    REQUIRE(delta["delta"]["type"] == "input_json_delta");
    REQUIRE(delta["delta"]["partial_json"] == "{\"a\":");

    Json tool_start = event_payload(ContentBlockStartEvent{1, BlockKind::ToolUse, "toolu_x", "lookup"});
    REQUIRE(tool_start["content_block"]["type"] == "tool_use");
    REQUIRE(tool_start["content_block"]["name"] == "lookup");
    REQUIRE(tool_start["content_block"]["input"].empty());
}
