#include "proxypool/upstream/sse_decoder.hpp"

namespace proxypool::upstream {

std::vector<SseEvent> SseDecoder::feed(const char* data, size_t len) {
    std::vector<SseEvent> out;
    buffer_.append(data, len);

    size_t start = 0;
    while (true) {
        size_t nl = buffer_.find('\n', start);
        if (nl == std::string::npos) {
            break;
        }
        size_t end = nl;
        if (end > start && buffer_[end - 1] == '\r') {
            --end;
        }
        process_line(buffer_.substr(start, end - start), out);
        start = nl + 1;
    }
    buffer_.erase(0, start);
    return out;
}

std::vector<SseEvent> SseDecoder::flush() {
    std::vector<SseEvent> out;
    if (!buffer_.empty()) {
        std::string line = buffer_;
        buffer_.clear();
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        process_line(line, out);
    }
    dispatch(out);
    return out;
}

void SseDecoder::process_line(const std::string& line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        dispatch(out);
        return;
    }
    if (line[0] == ':') {
        return;  // comment / keep-alive
    }

    std::string field;
    std::string value;
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        field = line;
    } else {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') {
            value.erase(0, 1);
        }
    }

    if (field == "data") {
        if (has_data_) {
            data_ += '\n';
        }
        data_ += value;
        has_data_ = true;
    } else if (field == "event") {
        event_ = value;
    }
    // id / retry are not used by chat-completion backends
}

void SseDecoder::dispatch(std::vector<SseEvent>& out) {
    if (!has_data_) {
        event_.clear();
        return;
    }

    SseEvent ev;
    ev.event = std::move(event_);
    ev.data = std::move(data_);
    ev.done = ev.data == "[DONE]";
    if (ev.done) {
        saw_done_ = true;
    }
    out.push_back(std::move(ev));

    event_.clear();
    data_.clear();
    has_data_ = false;
}

}  // namespace proxypool::upstream
