#pragma once

#include "proxypool/protocol/chat_completions.hpp"
#include "proxypool/protocol/messages.hpp"

#include <optional>
#include <string>

namespace proxypool::translate {

using namespace proxypool::core;
using namespace proxypool::protocol;

// stop -> end_turn, length -> max_tokens, tool_calls/function_call -> tool_use,
// content_filter -> stop_sequence, anything else -> end_turn
StopReason map_finish_reason(const std::optional<std::string>& finish_reason);

// Parse tool-call arguments; text that is not a JSON object is kept as
// {"raw_arguments": "<text>"}
Json parse_tool_arguments(const std::string& arguments);

// Upstream unary response -> caller response, in one pass.
// `requested_model` is the caller's model name; `estimated_input_tokens`
// fills usage when the upstream reports none.
CanonicalResponse translate_response(const UpstreamResponse& upstream,
                                     const std::string& requested_model,
                                     int estimated_input_tokens);

}  // namespace proxypool::translate
