#include "proxypool/protocol/chat_completions.hpp"

namespace proxypool::protocol {

namespace {

Json part_to_json(const ContentPart& part) {
    if (const auto* text = std::get_if<TextPart>(&part)) {
        return Json{{"type", "text"}, {"text", text->text}};
    }
    const auto& image = std::get<ImageUrlPart>(part);
    return Json{{"type", "image_url"}, {"image_url", {{"url", image.url}}}};
}

std::optional<UpstreamUsage> parse_usage(const Json& j) {
    if (!j.contains("usage") || !j["usage"].is_object()) {
        return std::nullopt;
    }
    const Json& usage = j["usage"];
    UpstreamUsage u;
    u.prompt_tokens = usage.value("prompt_tokens", 0);
    u.completion_tokens = usage.value("completion_tokens", 0);
    return u;
}

std::optional<std::string> string_field(const Json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

}  // namespace

Json UpstreamMessage::to_json() const {
    Json j{{"role", std::string(role_to_string(role))}};

    if (const auto* text = std::get_if<std::string>(&content)) {
        j["content"] = *text;
    } else if (const auto* parts = std::get_if<std::vector<ContentPart>>(&content)) {
        Json arr = Json::array();
        for (const auto& part : *parts) {
            arr.push_back(part_to_json(part));
        }
        j["content"] = arr;
    } else {
        j["content"] = nullptr;
    }

    if (!tool_calls.empty()) {
        Json calls = Json::array();
        for (const auto& tc : tool_calls) {
            calls.push_back(Json{
                {"id", tc.id},
                {"type", "function"},
                {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
            });
        }
        j["tool_calls"] = calls;
    }

    if (tool_call_id) {
        j["tool_call_id"] = *tool_call_id;
    }

    return j;
}

Json UpstreamRequest::to_json() const {
    Json j;
    j["model"] = model;

    Json msgs = Json::array();
    for (const auto& m : messages) {
        msgs.push_back(m.to_json());
    }
    j["messages"] = msgs;
    j["max_tokens"] = max_tokens;
    j["stream"] = stream;

    if (stream && include_usage) {
        j["stream_options"] = Json{{"include_usage", true}};
    }
    if (temperature) {
        j["temperature"] = *temperature;
    }
    if (top_p) {
        j["top_p"] = *top_p;
    }
    if (!stop.empty()) {
        j["stop"] = stop;
    }

    if (!tools.empty()) {
        Json arr = Json::array();
        for (const auto& t : tools) {
            arr.push_back(Json{
                {"type", "function"},
                {"function", {
                    {"name", t.name},
                    {"description", t.description},
                    {"parameters", t.parameters}
                }}
            });
        }
        j["tools"] = arr;
    }
    if (!tool_choice.is_null()) {
        j["tool_choice"] = tool_choice;
    }

    return j;
}

std::optional<std::string> extract_error_message(const Json& j) {
    if (!j.is_object() || !j.contains("error") || j["error"].is_null()) {
        return std::nullopt;
    }
    const Json& err = j["error"];
    if (err.is_string()) {
        return err.get<std::string>();
    }
    if (err.is_object()) {
        if (auto msg = string_field(err, "message")) {
            return msg;
        }
        return err.dump();
    }
    return err.dump();
}

Result<UpstreamResponse, Error> UpstreamResponse::from_json(const Json& j) {
    try {
        if (auto message = extract_error_message(j)) {
            return Result<UpstreamResponse, Error>::err(
                ErrorCode::UpstreamInvalidResponse, *message, "error body");
        }

        if (!j.is_object() || !j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
            return Result<UpstreamResponse, Error>::err(
                ErrorCode::UpstreamInvalidResponse, "Upstream response has no choices");
        }

        UpstreamResponse response;
        response.id = j.value("id", "");
        response.model = j.value("model", "");
        response.usage = parse_usage(j);

        const Json& choice = j["choices"][0];
        response.finish_reason = string_field(choice, "finish_reason");

        const Json& msg = choice.contains("message") ? choice["message"] : Json::object();
        if (auto role = role_from_string(msg.value("role", "assistant"))) {
            response.role = *role;
        }

        if (msg.contains("content")) {
            const Json& content = msg["content"];
            if (content.is_string()) {
                response.content.push_back(TextPart{content.get<std::string>()});
            } else if (content.is_array()) {
                for (const auto& part : content) {
                    if (part.is_object() && part.value("type", "") == "text") {
                        response.content.push_back(TextPart{part.value("text", "")});
                    }
                }
            }
        }

        if (msg.contains("tool_calls") && msg["tool_calls"].is_array()) {
            for (const auto& tc : msg["tool_calls"]) {
                ToolCallPayload call;
                call.id = tc.value("id", "");
                const Json& fn = tc.contains("function") ? tc["function"] : Json::object();
                call.name = fn.value("name", "");
                if (fn.contains("arguments")) {
                    call.arguments = fn["arguments"].is_string() ? fn["arguments"].get<std::string>()
                                                                 : fn["arguments"].dump();
                }
                response.tool_calls.push_back(std::move(call));
            }
        } else if (msg.contains("function_call") && msg["function_call"].is_object()) {
            // Legacy single function call
            const Json& fn = msg["function_call"];
            ToolCallPayload call;
            call.name = fn.value("name", "");
            call.arguments = fn.value("arguments", "");
            response.tool_calls.push_back(std::move(call));
        }

        return Result<UpstreamResponse, Error>::ok(std::move(response));

    } catch (const Json::exception& e) {
        return Result<UpstreamResponse, Error>::err(
            ErrorCode::UpstreamInvalidResponse,
            std::string("JSON parse error: ") + e.what()
        );
    }
}

Result<UpstreamChunk, Error> UpstreamChunk::from_json(const Json& j) {
    try {
        if (auto message = extract_error_message(j)) {
            return Result<UpstreamChunk, Error>::err(
                ErrorCode::UpstreamStreamError, *message, "error chunk");
        }

        UpstreamChunk chunk;
        chunk.usage = parse_usage(j);

        if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
            return Result<UpstreamChunk, Error>::ok(std::move(chunk));
        }

        const Json& choice = j["choices"][0];
        chunk.finish_reason = string_field(choice, "finish_reason");

        if (!choice.contains("delta") || !choice["delta"].is_object()) {
            return Result<UpstreamChunk, Error>::ok(std::move(chunk));
        }

        const Json& delta = choice["delta"];
        chunk.role = string_field(delta, "role");
        chunk.content = string_field(delta, "content");

        if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
            for (const auto& tc : delta["tool_calls"]) {
                ToolCallDelta d;
                d.index = tc.value("index", 0);
                d.id = string_field(tc, "id");
                if (tc.contains("function") && tc["function"].is_object()) {
                    const Json& fn = tc["function"];
                    d.name = string_field(fn, "name");
                    if (auto args = string_field(fn, "arguments")) {
                        d.arguments = *args;
                    }
                }
                chunk.tool_calls.push_back(std::move(d));
            }
        } else if (delta.contains("function_call") && delta["function_call"].is_object()) {
            const Json& fn = delta["function_call"];
            ToolCallDelta d;
            d.name = string_field(fn, "name");
            if (auto args = string_field(fn, "arguments")) {
                d.arguments = *args;
            }
            chunk.tool_calls.push_back(std::move(d));
        }

        return Result<UpstreamChunk, Error>::ok(std::move(chunk));

    } catch (const Json::exception& e) {
        return Result<UpstreamChunk, Error>::err(
            ErrorCode::UpstreamInvalidResponse,
            std::string("JSON parse error: ") + e.what()
        );
    }
}

std::vector<UpstreamChunk> response_as_chunks(const UpstreamResponse& response) {
    std::vector<UpstreamChunk> chunks;

    UpstreamChunk head;
    head.role = std::string(role_to_string(response.role));
    std::string text;
    for (const auto& part : response.content) {
        if (const auto* t = std::get_if<TextPart>(&part)) {
            text += t->text;
        }
    }
    if (!text.empty()) {
        head.content = std::move(text);
    }
    chunks.push_back(std::move(head));

    for (size_t i = 0; i < response.tool_calls.size(); ++i) {
        const auto& call = response.tool_calls[i];
        UpstreamChunk chunk;
        ToolCallDelta delta;
        delta.index = static_cast<int>(i);
        if (!call.id.empty()) {
            delta.id = call.id;
        }
        delta.name = call.name;
        delta.arguments = call.arguments;
        chunk.tool_calls.push_back(std::move(delta));
        chunks.push_back(std::move(chunk));
    }

    if (response.finish_reason || response.usage) {
        UpstreamChunk tail;
        tail.finish_reason = response.finish_reason;
        tail.usage = response.usage;
        chunks.push_back(std::move(tail));
    }
    return chunks;
}

}  // namespace proxypool::protocol
