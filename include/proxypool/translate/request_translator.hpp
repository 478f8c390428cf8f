#pragma once

#include "proxypool/protocol/chat_completions.hpp"
#include "proxypool/protocol/messages.hpp"

#include <string>

namespace proxypool::translate {

using namespace proxypool::core;
using namespace proxypool::protocol;

struct TranslationLimits {
    int min_tokens = 100;
    int max_tokens = 4096;
    bool request_stream_usage = true;
};

// Caller-format request -> upstream-format request.
//
// Total: constructs the upstream side has no equivalent for are dropped or
// mapped best-effort, never rejected. Rejection of malformed input happens in
// parse_messages_request, before a translator is involved.
class RequestTranslator {
public:
    explicit RequestTranslator(TranslationLimits limits);

    UpstreamRequest translate(const CanonicalRequest& request, const std::string& target_model) const;

    int clamp_max_tokens(int requested) const;

private:
    TranslationLimits limits_;

    void append_message(const CanonicalMessage& message, std::vector<UpstreamMessage>& out) const;
};

}  // namespace proxypool::translate
