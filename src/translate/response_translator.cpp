#include "proxypool/translate/response_translator.hpp"
#include "proxypool/core/uuid.hpp"
#include "proxypool/translate/token_estimator.hpp"

namespace proxypool::translate {

StopReason map_finish_reason(const std::optional<std::string>& finish_reason) {
    if (!finish_reason) {
        return StopReason::EndTurn;
    }
    const std::string& reason = *finish_reason;
    if (reason == "stop") return StopReason::EndTurn;
    if (reason == "length") return StopReason::MaxTokens;
    if (reason == "tool_calls" || reason == "function_call") return StopReason::ToolUse;
    if (reason == "content_filter") return StopReason::StopSequence;
    return StopReason::EndTurn;
}

Json parse_tool_arguments(const std::string& arguments) {
    if (arguments.empty()) {
        return Json::object();
    }
    Json parsed = Json::parse(arguments, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Json{{"raw_arguments", arguments}};
    }
    return parsed;
}

CanonicalResponse translate_response(const UpstreamResponse& upstream,
                                     const std::string& requested_model,
                                     int estimated_input_tokens) {
    CanonicalResponse response;
    response.id = generate_message_id();
    response.model = requested_model;

    size_t output_chars = 0;

    for (const auto& part : upstream.content) {
        if (const auto* text = std::get_if<TextPart>(&part)) {
            // An empty string next to tool calls carries nothing
            if (text->text.empty() && !upstream.tool_calls.empty()) {
                continue;
            }
            output_chars += text->text.size();
            response.content.push_back(TextBlock{text->text});
        }
    }

    for (const auto& call : upstream.tool_calls) {
        ToolUseBlock block;
        block.id = call.id.empty() ? generate_tool_use_id() : call.id;
        block.name = call.name;
        block.input = parse_tool_arguments(call.arguments);
        output_chars += call.arguments.size();
        response.content.push_back(std::move(block));
    }

    if (response.content.empty()) {
        response.content.push_back(TextBlock{""});
    }

    response.stop_reason = map_finish_reason(upstream.finish_reason);

    if (upstream.usage) {
        response.usage.input_tokens = upstream.usage->prompt_tokens;
        response.usage.output_tokens = upstream.usage->completion_tokens;
    } else {
        response.usage.input_tokens = estimated_input_tokens;
        response.usage.output_tokens = TokenEstimator::from_chars(output_chars);
        response.usage.estimated = true;
    }

    return response;
}

}  // namespace proxypool::translate
