#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace proxypool::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

using RequestId = std::string;
using ModelId = std::string;

// Message roles across both wire formats
enum class Role {
    System,
    User,
    Assistant,
    Tool
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

inline std::optional<Role> role_from_string(std::string_view str) {
    if (str == "system") return Role::System;
    if (str == "user") return Role::User;
    if (str == "assistant") return Role::Assistant;
    if (str == "tool") return Role::Tool;
    return std::nullopt;
}

// Stop reason in the caller protocol
enum class StopReason {
    EndTurn,
    MaxTokens,
    ToolUse,
    StopSequence
};

inline std::string_view stop_reason_to_string(StopReason reason) {
    switch (reason) {
        case StopReason::EndTurn: return "end_turn";
        case StopReason::MaxTokens: return "max_tokens";
        case StopReason::ToolUse: return "tool_use";
        case StopReason::StopSequence: return "stop_sequence";
    }
    return "end_turn";
}

// Token usage. `estimated` marks counts that came from the character
// heuristic rather than from the upstream.
struct TokenUsage {
    int input_tokens = 0;
    int output_tokens = 0;
    bool estimated = false;

    int total() const { return input_tokens + output_tokens; }

    Json to_json() const {
        return Json{
            {"input_tokens", input_tokens},
            {"output_tokens", output_tokens}
        };
    }
};

}  // namespace proxypool::core
