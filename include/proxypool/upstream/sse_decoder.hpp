#pragma once

#include <string>
#include <vector>

namespace proxypool::upstream {

struct SseEvent {
    std::string event;  // empty when no "event:" field was sent
    std::string data;   // multiple data lines joined with '\n'
    bool done = false;  // data was the "[DONE]" sentinel
};

// Incremental server-sent-event parser. Bytes may be split anywhere,
// including inside a line or between '\r' and '\n'.
class SseDecoder {
public:
    std::vector<SseEvent> feed(const char* data, size_t len);
    std::vector<SseEvent> feed(const std::string& data) { return feed(data.data(), data.size()); }

    // Dispatch whatever is buffered as if the stream ended with a blank line
    std::vector<SseEvent> flush();

    bool saw_done() const { return saw_done_; }

private:
    std::string buffer_;
    std::string event_;
    std::string data_;
    bool has_data_ = false;
    bool saw_done_ = false;

    void process_line(const std::string& line, std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);
};

}  // namespace proxypool::upstream
