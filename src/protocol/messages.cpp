#include "proxypool/protocol/messages.hpp"

#include <cstdint>
#include <limits>

namespace proxypool::protocol {

namespace {

using ParseResult = Result<CanonicalRequest, Error>;

Error parse_error(std::string message, std::string field) {
    return Error{ErrorCode::RequestParseFailed, std::move(message), std::move(field)};
}

// JSON integers are 64-bit; saturate into int instead of wrapping
int saturate_int(const Json& value) {
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        return v > static_cast<uint64_t>(std::numeric_limits<int>::max())
            ? std::numeric_limits<int>::max()
            : static_cast<int>(v);
    }
    int64_t v = value.get<int64_t>();
    if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (v < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(v);
}

// Tool-result content may be a string or a list of blocks; flatten to text
std::string flatten_tool_result(const Json& content) {
    if (content.is_null()) {
        return "";
    }
    if (content.is_string()) {
        return content.get<std::string>();
    }
    if (content.is_array()) {
        std::string text;
        for (const auto& part : content) {
            std::string piece;
            if (part.is_string()) {
                piece = part.get<std::string>();
            } else if (part.is_object() && part.value("type", "") == "text") {
                piece = part.value("text", "");
            } else if (part.is_object() && part.value("type", "") == "image") {
                piece = "[image]";
            } else {
                piece = part.dump();
            }
            if (!text.empty()) text += "\n";
            text += piece;
        }
        return text;
    }
    return content.dump();
}

std::optional<Error> parse_block(const Json& j, const std::string& path, ContentBlock& out) {
    if (!j.is_object()) {
        return parse_error("Content block must be an object", path);
    }

    std::string type = j.value("type", "");

    if (type == "text") {
        if (!j.contains("text") || !j["text"].is_string()) {
            return parse_error("Text block requires a string 'text'", path);
        }
        out = TextBlock{j["text"].get<std::string>()};
    } else if (type == "image") {
        const Json& source = j.contains("source") ? j["source"] : Json::object();
        if (!source.is_object()) {
            return parse_error("Image block requires a 'source' object", path);
        }
        ImageBlock image;
        if (source.value("type", "") == "url") {
            image.url = source.value("url", "");
        } else {
            image.media_type = source.value("media_type", "image/png");
            image.data = source.value("data", "");
        }
        if (image.url.empty() && image.data.empty()) {
            return parse_error("Image block has no data or url", path);
        }
        out = std::move(image);
    } else if (type == "tool_use") {
        ToolUseBlock tool;
        tool.id = j.value("id", "");
        tool.name = j.value("name", "");
        if (tool.name.empty()) {
            return parse_error("tool_use block requires a 'name'", path);
        }
        if (j.contains("input") && !j["input"].is_null()) {
            tool.input = j["input"];
        }
        out = std::move(tool);
    } else if (type == "tool_result") {
        ToolResultBlock result;
        result.tool_use_id = j.value("tool_use_id", "");
        if (result.tool_use_id.empty()) {
            return parse_error("tool_result block requires a 'tool_use_id'", path);
        }
        result.content = flatten_tool_result(j.contains("content") ? j["content"] : Json());
        result.is_error = j.value("is_error", false);
        out = std::move(result);
    } else {
        out = UnknownBlock{type, j};
    }

    return std::nullopt;
}

std::optional<Error> parse_content(const Json& content, const std::string& path,
                                   std::vector<ContentBlock>& out) {
    if (content.is_string()) {
        out.push_back(TextBlock{content.get<std::string>()});
        return std::nullopt;
    }
    if (content.is_null()) {
        return std::nullopt;
    }
    if (!content.is_array()) {
        return parse_error("Message content must be a string or an array of blocks", path);
    }

    for (size_t i = 0; i < content.size(); ++i) {
        ContentBlock block;
        if (auto err = parse_block(content[i], path + "[" + std::to_string(i) + "]", block)) {
            return err;
        }
        out.push_back(std::move(block));
    }
    return std::nullopt;
}

std::optional<Error> parse_system(const Json& system, std::vector<std::string>& out) {
    if (system.is_null()) {
        return std::nullopt;
    }
    if (system.is_string()) {
        out.push_back(system.get<std::string>());
        return std::nullopt;
    }
    if (!system.is_array()) {
        return parse_error("'system' must be a string or an array of text blocks", "system");
    }
    for (const auto& block : system) {
        if (block.is_object() && block.value("type", "text") == "text" && block.contains("text")) {
            out.push_back(block["text"].get<std::string>());
        } else if (block.is_string()) {
            out.push_back(block.get<std::string>());
        }
    }
    return std::nullopt;
}

std::optional<Error> parse_messages(const Json& body, std::vector<CanonicalMessage>& out) {
    if (!body.contains("messages") || !body["messages"].is_array()) {
        return parse_error("'messages' must be an array", "messages");
    }

    const Json& messages = body["messages"];
    for (size_t i = 0; i < messages.size(); ++i) {
        const Json& m = messages[i];
        std::string path = "messages[" + std::to_string(i) + "]";
        if (!m.is_object()) {
            return parse_error("Message must be an object", path);
        }

        auto role = role_from_string(m.value("role", ""));
        if (!role || *role == Role::Tool) {
            return parse_error("Message role must be 'user', 'assistant' or 'system'", path + ".role");
        }

        CanonicalMessage message;
        message.role = *role;
        if (auto err = parse_content(m.contains("content") ? m["content"] : Json(), path + ".content",
                                     message.content)) {
            return err;
        }
        out.push_back(std::move(message));
    }
    return std::nullopt;
}

std::optional<Error> parse_tools(const Json& body, CanonicalRequest& req) {
    if (body.contains("tools") && !body["tools"].is_null()) {
        if (!body["tools"].is_array()) {
            return parse_error("'tools' must be an array", "tools");
        }
        for (size_t i = 0; i < body["tools"].size(); ++i) {
            const Json& t = body["tools"][i];
            if (!t.is_object() || t.value("name", "").empty()) {
                return parse_error("Tool declaration requires a 'name'", "tools[" + std::to_string(i) + "]");
            }
            ToolDefinition def;
            def.name = t["name"].get<std::string>();
            def.description = t.value("description", "");
            if (t.contains("input_schema") && t["input_schema"].is_object()) {
                def.input_schema = t["input_schema"];
            }
            req.tools.push_back(std::move(def));
        }
    }

    if (body.contains("tool_choice") && body["tool_choice"].is_object()) {
        const Json& tc = body["tool_choice"];
        std::string type = tc.value("type", "auto");
        ToolChoice choice;
        if (type == "auto") {
            choice.mode = ToolChoice::Mode::Auto;
        } else if (type == "any") {
            choice.mode = ToolChoice::Mode::Any;
        } else if (type == "none") {
            choice.mode = ToolChoice::Mode::None;
        } else if (type == "tool") {
            choice.mode = ToolChoice::Mode::Tool;
            choice.name = tc.value("name", "");
            if (choice.name.empty()) {
                return parse_error("tool_choice of type 'tool' requires a 'name'", "tool_choice");
            }
        } else {
            return parse_error("Unknown tool_choice type '" + type + "'", "tool_choice");
        }
        req.tool_choice = choice;
    }
    return std::nullopt;
}

ParseResult parse_common(const Json& body, bool require_max_tokens) {
    if (!body.is_object()) {
        return ParseResult::err(parse_error("Request body must be a JSON object", "body"));
    }

    CanonicalRequest req;

    if (!body.contains("model") || !body["model"].is_string() || body["model"].get<std::string>().empty()) {
        return ParseResult::err(parse_error("'model' is required", "model"));
    }
    req.model = body["model"].get<std::string>();

    if (require_max_tokens) {
        if (!body.contains("max_tokens") || !body["max_tokens"].is_number_integer()) {
            return ParseResult::err(parse_error("'max_tokens' must be an integer", "max_tokens"));
        }
        req.max_tokens = saturate_int(body["max_tokens"]);
    }

    if (auto err = parse_system(body.contains("system") ? body["system"] : Json(), req.system)) {
        return ParseResult::err(*err);
    }
    if (auto err = parse_messages(body, req.messages)) {
        return ParseResult::err(*err);
    }
    if (auto err = parse_tools(body, req)) {
        return ParseResult::err(*err);
    }

    return ParseResult::ok(std::move(req));
}

}  // namespace

Result<CanonicalRequest, Error> parse_messages_request(const Json& body) {
    try {
        auto parsed = parse_common(body, true);
        if (parsed.is_err()) {
            return parsed;
        }

        CanonicalRequest req = std::move(parsed).value();

        if (body.contains("temperature") && body["temperature"].is_number()) {
            req.temperature = body["temperature"].get<double>();
        }
        if (body.contains("top_p") && body["top_p"].is_number()) {
            req.top_p = body["top_p"].get<double>();
        }
        if (body.contains("top_k") && body["top_k"].is_number_integer()) {
            req.top_k = saturate_int(body["top_k"]);
        }
        if (body.contains("stop_sequences") && body["stop_sequences"].is_array()) {
            for (const auto& s : body["stop_sequences"]) {
                if (s.is_string()) req.stop_sequences.push_back(s.get<std::string>());
            }
        }
        req.stream = body.value("stream", false);
        if (body.contains("metadata")) {
            req.metadata = body["metadata"];
        }

        return ParseResult::ok(std::move(req));

    } catch (const Json::exception& e) {
        return ParseResult::err(Error{ErrorCode::RequestParseFailed, e.what()});
    }
}

Result<CanonicalRequest, Error> parse_count_tokens_request(const Json& body) {
    try {
        return parse_common(body, false);
    } catch (const Json::exception& e) {
        return ParseResult::err(Error{ErrorCode::RequestParseFailed, e.what()});
    }
}

Json content_block_to_json(const ContentBlock& block) {
    struct Visitor {
        Json operator()(const TextBlock& b) const {
            return Json{{"type", "text"}, {"text", b.text}};
        }
        Json operator()(const ImageBlock& b) const {
            if (b.is_url()) {
                return Json{{"type", "image"}, {"source", {{"type", "url"}, {"url", b.url}}}};
            }
            return Json{{"type", "image"},
                        {"source", {{"type", "base64"}, {"media_type", b.media_type}, {"data", b.data}}}};
        }
        Json operator()(const ToolUseBlock& b) const {
            return Json{{"type", "tool_use"}, {"id", b.id}, {"name", b.name}, {"input", b.input}};
        }
        Json operator()(const ToolResultBlock& b) const {
            return Json{{"type", "tool_result"}, {"tool_use_id", b.tool_use_id},
                        {"content", b.content}, {"is_error", b.is_error}};
        }
        Json operator()(const UnknownBlock& b) const {
            return b.raw;
        }
    };
    return std::visit(Visitor{}, block);
}

Json CanonicalResponse::to_json() const {
    Json blocks = Json::array();
    for (const auto& block : content) {
        blocks.push_back(content_block_to_json(block));
    }

    return Json{
        {"id", id},
        {"type", "message"},
        {"role", "assistant"},
        {"model", model},
        {"content", blocks},
        {"stop_reason", std::string(stop_reason_to_string(stop_reason))},
        {"stop_sequence", nullptr},
        {"usage", usage.to_json()}
    };
}

Json error_body(const ErrorEnvelope& envelope) {
    return Json{
        {"type", "error"},
        {"error", {
            {"type", std::string(category_wire_type(envelope.category))},
            {"message", envelope.message}
        }}
    };
}

}  // namespace proxypool::protocol
