#include "proxypool/translate/token_estimator.hpp"

#include <algorithm>

namespace proxypool::translate {

int TokenEstimator::from_chars(size_t chars) {
    if (chars == 0) {
        return 0;
    }
    return std::max(1, static_cast<int>(chars / kCharsPerToken));
}

int TokenEstimator::estimate_tokens(const std::string& text) {
    return from_chars(text.size());
}

size_t TokenEstimator::count_chars(const CanonicalRequest& request) {
    size_t chars = 0;

    for (const auto& text : request.system) {
        chars += text.size();
    }

    struct Counter {
        size_t operator()(const TextBlock& b) const { return b.text.size(); }
        size_t operator()(const ImageBlock&) const { return 0; }
        size_t operator()(const ToolUseBlock& b) const { return b.name.size() + b.input.dump().size(); }
        size_t operator()(const ToolResultBlock& b) const { return b.content.size(); }
        size_t operator()(const UnknownBlock&) const { return 0; }
    };

    for (const auto& message : request.messages) {
        for (const auto& block : message.content) {
            chars += std::visit(Counter{}, block);
        }
    }

    for (const auto& tool : request.tools) {
        chars += tool.name.size() + tool.description.size() + tool.input_schema.dump().size();
    }

    return chars;
}

int TokenEstimator::estimate_input(const CanonicalRequest& request) {
    return from_chars(count_chars(request));
}

}  // namespace proxypool::translate
