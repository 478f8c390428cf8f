#include "proxypool/protocol/stream_event.hpp"
#include "proxypool/protocol/messages.hpp"

namespace proxypool::protocol {

namespace {

struct NameVisitor {
    std::string operator()(const MessageStartEvent&) const { return "message_start"; }
    std::string operator()(const ContentBlockStartEvent&) const { return "content_block_start"; }
    std::string operator()(const ContentBlockDeltaEvent&) const { return "content_block_delta"; }
    std::string operator()(const ContentBlockStopEvent&) const { return "content_block_stop"; }
    std::string operator()(const MessageDeltaEvent&) const { return "message_delta"; }
    std::string operator()(const MessageStopEvent&) const { return "message_stop"; }
    std::string operator()(const ErrorEvent&) const { return "error"; }
    std::string operator()(const PingEvent&) const { return "ping"; }
};

struct PayloadVisitor {
    Json operator()(const MessageStartEvent& e) const {
        return Json{
            {"type", "message_start"},
            {"message", {
                {"id", e.id},
                {"type", "message"},
                {"role", "assistant"},
                {"model", e.model},
                {"content", Json::array()},
                {"stop_reason", nullptr},
                {"stop_sequence", nullptr},
                {"usage", e.usage.to_json()}
            }}
        };
    }

    Json operator()(const ContentBlockStartEvent& e) const {
        Json block;
        if (e.kind == BlockKind::Text) {
            block = Json{{"type", "text"}, {"text", ""}};
        } else {
            block = Json{{"type", "tool_use"}, {"id", e.tool_id}, {"name", e.tool_name},
                         {"input", Json::object()}};
        }
        return Json{{"type", "content_block_start"}, {"index", e.index}, {"content_block", block}};
    }

    Json operator()(const ContentBlockDeltaEvent& e) const {
        Json delta;
        if (e.kind == DeltaKind::Text) {
            delta = Json{{"type", "text_delta"}, {"text", e.payload}};
        } else {
            delta = Json{{"type", "input_json_delta"}, {"partial_json", e.payload}};
        }
        return Json{{"type", "content_block_delta"}, {"index", e.index}, {"delta", delta}};
    }

    Json operator()(const ContentBlockStopEvent& e) const {
        return Json{{"type", "content_block_stop"}, {"index", e.index}};
    }

    Json operator()(const MessageDeltaEvent& e) const {
        return Json{
            {"type", "message_delta"},
            {"delta", {
                {"stop_reason", std::string(stop_reason_to_string(e.stop_reason))},
                {"stop_sequence", nullptr}
            }},
            {"usage", e.usage.to_json()}
        };
    }

    Json operator()(const MessageStopEvent&) const {
        return Json{{"type", "message_stop"}};
    }

    Json operator()(const ErrorEvent& e) const {
        return error_body(e.error);
    }

    Json operator()(const PingEvent&) const {
        return Json{{"type", "ping"}};
    }
};

}  // namespace

std::string event_name(const StreamEvent& event) {
    return std::visit(NameVisitor{}, event);
}

Json event_payload(const StreamEvent& event) {
    return std::visit(PayloadVisitor{}, event);
}

std::string to_sse(const StreamEvent& event) {
    // ensure_ascii off, replace invalid UTF-8 rather than throwing mid-stream
    std::string data = event_payload(event).dump(-1, ' ', false, Json::error_handler_t::replace);
    return "event: " + event_name(event) + "\ndata: " + data + "\n\n";
}

}  // namespace proxypool::protocol
