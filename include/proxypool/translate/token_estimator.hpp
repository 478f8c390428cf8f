#pragma once

#include "proxypool/protocol/messages.hpp"

#include <string>

namespace proxypool::translate {

using namespace proxypool::core;
using namespace proxypool::protocol;

// Approximate token counting: about 4 characters per token. Not exact, and
// every count produced here is reported with TokenUsage::estimated set.
class TokenEstimator {
public:
    static constexpr int kCharsPerToken = 4;

    // 0 characters -> 0 tokens, otherwise at least 1
    static int from_chars(size_t chars);

    static int estimate_tokens(const std::string& text);

    // System text, message text, tool results, tool inputs and tool declarations
    static int estimate_input(const CanonicalRequest& request);

    static size_t count_chars(const CanonicalRequest& request);
};

}  // namespace proxypool::translate
