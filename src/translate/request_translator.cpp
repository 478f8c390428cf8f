#include "proxypool/translate/request_translator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace proxypool::translate {

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string image_url(const ImageBlock& image) {
    if (image.is_url()) {
        return image.url;
    }
    return "data:" + image.media_type + ";base64," + image.data;
}

Json translate_tool_choice(const ToolChoice& choice) {
    switch (choice.mode) {
        case ToolChoice::Mode::Auto: return "auto";
        case ToolChoice::Mode::Any: return "required";
        case ToolChoice::Mode::None: return "none";
        case ToolChoice::Mode::Tool:
            return Json{{"type", "function"}, {"function", {{"name", choice.name}}}};
    }
    return "auto";
}

}  // namespace

RequestTranslator::RequestTranslator(TranslationLimits limits)
    : limits_(limits)
{
}

int RequestTranslator::clamp_max_tokens(int requested) const {
    return std::clamp(requested, limits_.min_tokens, limits_.max_tokens);
}

void RequestTranslator::append_message(const CanonicalMessage& message,
                                       std::vector<UpstreamMessage>& out) const {
    std::vector<UpstreamMessage> tool_messages;
    std::vector<std::string> texts;
    std::vector<ContentPart> parts;  // text and images, in order
    std::vector<ToolCallPayload> tool_calls;
    bool has_image = false;

    for (const auto& block : message.content) {
        if (const auto* text = std::get_if<TextBlock>(&block)) {
            texts.push_back(text->text);
            parts.push_back(TextPart{text->text});
        } else if (const auto* image = std::get_if<ImageBlock>(&block)) {
            if (message.role == Role::Assistant) {
                spdlog::debug("Dropping image block in assistant message");
                continue;
            }
            has_image = true;
            parts.push_back(ImageUrlPart{image_url(*image)});
        } else if (const auto* tool_use = std::get_if<ToolUseBlock>(&block)) {
            if (message.role != Role::Assistant) {
                spdlog::debug("Dropping tool_use block '{}' outside an assistant message", tool_use->name);
                continue;
            }
            tool_calls.push_back(ToolCallPayload{tool_use->id, tool_use->name, tool_use->input.dump()});
        } else if (const auto* result = std::get_if<ToolResultBlock>(&block)) {
            UpstreamMessage tool;
            tool.role = Role::Tool;
            tool.content = result->is_error ? "Error: " + result->content : result->content;
            tool.tool_call_id = result->tool_use_id;
            tool_messages.push_back(std::move(tool));
        } else {
            const auto& unknown = std::get<UnknownBlock>(block);
            spdlog::debug("Dropping unsupported content block type '{}'", unknown.type);
        }
    }

    // Tool results first: the upstream expects them right after the
    // assistant turn that issued the calls
    for (auto& tool : tool_messages) {
        out.push_back(std::move(tool));
    }

    bool has_rest = !texts.empty() || has_image || !tool_calls.empty();
    if (!has_rest && !tool_messages.empty()) {
        return;
    }

    UpstreamMessage msg;
    msg.role = message.role;

    if (has_image) {
        msg.content = std::move(parts);
    } else if (!texts.empty()) {
        msg.content = join(texts, "\n");
    } else if (tool_calls.empty()) {
        msg.content = std::string();
    }

    msg.tool_calls = std::move(tool_calls);
    out.push_back(std::move(msg));
}

UpstreamRequest RequestTranslator::translate(const CanonicalRequest& request,
                                             const std::string& target_model) const {
    UpstreamRequest upstream;
    upstream.model = target_model;
    upstream.max_tokens = clamp_max_tokens(request.max_tokens);
    upstream.temperature = request.temperature;
    upstream.top_p = request.top_p;
    upstream.stop = request.stop_sequences;
    upstream.stream = request.stream;
    upstream.include_usage = request.stream && limits_.request_stream_usage;

    if (!request.system.empty()) {
        UpstreamMessage system;
        system.role = Role::System;
        system.content = join(request.system, "\n\n");
        upstream.messages.push_back(std::move(system));
    }

    for (const auto& message : request.messages) {
        append_message(message, upstream.messages);
    }

    for (const auto& tool : request.tools) {
        upstream.tools.push_back(FunctionDeclaration{tool.name, tool.description, tool.input_schema});
    }

    if (request.tool_choice) {
        upstream.tool_choice = translate_tool_choice(*request.tool_choice);
    }

    if (request.top_k) {
        spdlog::debug("Dropping top_k={} (no upstream equivalent)", *request.top_k);
    }

    return upstream;
}

}  // namespace proxypool::translate
