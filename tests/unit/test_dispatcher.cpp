#include <catch2/catch_test_macros.hpp>
#include "proxypool/dispatch/dispatcher.hpp"
#include "fake_upstream.hpp"

using namespace proxypool;
using namespace proxypool::dispatch;
using namespace proxypool::testing;

namespace {

std::unique_ptr<rotation::CredentialModelRotator> make_rotator() {
    return std::move(rotation::CredentialModelRotator::create({"sk-key-one", "sk-key-two"},
                                                              {"model-a", "model-b"})).value();
}

CanonicalRequest simple_request(bool stream = false) {
    auto parsed = protocol::parse_messages_request(Json::parse(R"({
        "model": "claude-3-5-sonnet", "max_tokens": 200,
        "messages": [{"role": "user", "content": "Hello there"}]
    })"));
    REQUIRE(parsed.is_ok());
    CanonicalRequest request = std::move(parsed).value();
    request.stream = stream;
    return request;
}

std::vector<std::string> names(const std::vector<StreamEvent>& events) {
    std::vector<std::string> out;
    for (const auto& e : events) {
        out.push_back(protocol::event_name(e));
    }
    return out;
}

}  // namespace

TEST_CASE("Unary call rotates credentials and models", "[dispatch]") {
    auto rotator = make_rotator();
    auto script = std::make_shared<FakeUpstream>();
    Dispatcher dispatcher(*rotator, fake_factory(script), DispatcherOptions{});

    for (int i = 0; i < 4; ++i) {
        auto result = dispatcher.complete(simple_request());
        REQUIRE(result.is_ok());
        REQUIRE(result.value().model == "claude-3-5-sonnet");
    }

    REQUIRE(script->keys_used == std::vector<std::string>{"sk-key-one", "sk-key-two", "sk-key-one", "sk-key-two"});
    REQUIRE(script->requests[0].model == "model-a");
    REQUIRE(script->requests[1].model == "model-a");
    REQUIRE(script->requests[2].model == "model-b");
    REQUIRE(script->requests[3].model == "model-b");
    REQUIRE_FALSE(script->requests[0].stream);
    REQUIRE(dispatcher.registry().active_count() == 0);
}

TEST_CASE("Passthrough model names skip the pool", "[dispatch]") {
    auto rotator = make_rotator();
    auto script = std::make_shared<FakeUpstream>();
    DispatcherOptions options;
    options.passthrough_prefixes = {"gpt-"};
    Dispatcher dispatcher(*rotator, fake_factory(script), options);

    auto request = simple_request();
    request.model = "gpt-4o";
    REQUIRE(dispatcher.complete(request).is_ok());
    REQUIRE(script->requests[0].model == "gpt-4o");
}

TEST_CASE("Disconnected caller does not consume a rotation slot", "[dispatch]") {
    auto rotator = make_rotator();
    auto script = std::make_shared<FakeUpstream>();
    Dispatcher dispatcher(*rotator, fake_factory(script), DispatcherOptions{});

    auto gone = dispatcher.complete(simple_request(), [] { return false; });
    REQUIRE(gone.is_err());
    REQUIRE(gone.error().category == ErrorCategory::Cancelled);
    REQUIRE(script->requests.empty());

    std::vector<StreamEvent> events;
    auto gone_stream = dispatcher.stream(simple_request(true),
                                         [&](const StreamEvent& e) { events.push_back(e); return true; },
                                         [] { return false; });
    REQUIRE(gone_stream.is_err());
    REQUIRE(events.empty());

    // The next real call still gets the first pair
    REQUIRE(dispatcher.complete(simple_request()).is_ok());
    REQUIRE(script->keys_used.front() == "sk-key-one");
    REQUIRE(script->requests.front().model == "model-a");
}

TEST_CASE("Upstream failures are classified and redacted", "[dispatch]") {
    auto rotator = make_rotator();
    auto script = std::make_shared<FakeUpstream>();
    script->completions.push_back(Result<UpstreamResponse, RawUpstreamError>::err(
        RawUpstreamError::http(401, R"({"error":{"message":"Incorrect API key provided: sk-key-one"}})")));
    Dispatcher dispatcher(*rotator, fake_factory(script), DispatcherOptions{});

    auto result = dispatcher.complete(simple_request());
    REQUIRE(result.is_err());
    REQUIRE(result.error().category == ErrorCategory::Authentication);
    REQUIRE(result.error().upstream_status == 401);
    REQUIRE(result.error().message.find("sk-key-one") == std::string::npos);
}

TEST_CASE("Streaming call emits the caller event sequence", "[dispatch][stream]") {
    auto rotator = make_rotator();
    auto script = std::make_shared<FakeUpstream>();
    script->chunks = {
        chunk_from(R"({"choices":[{"delta":{"role":"assistant"}}]})"),
        chunk_from(R"({"choices":[{"delta":{"content":"Hi"}}]})"),
        chunk_from(R"({"choices":[{"delta":{},"finish_reason":"stop"}]})"),
        chunk_from(R"({"choices":[],"usage":{"prompt_tokens":4,"completion_tokens":1}})"),
    };
    Dispatcher dispatcher(*rotator, fake_factory(script), DispatcherOptions{});

    std::vector<StreamEvent> events;
    auto result = dispatcher.stream(simple_request(true),
                                    [&](const StreamEvent& e) { events.push_back(e); return true; });

    REQUIRE(result.is_ok());
    REQUIRE(script->requests[0].stream);
    REQUIRE(script->requests[0].include_usage);
    REQUIRE(names(events) == std::vector<std::string>{
        "message_start", "ping", "content_block_start", "content_block_delta",
        "content_block_stop", "message_delta", "message_stop"});
    REQUIRE(dispatcher.registry().active_count() == 0);
}

TEST_CASE("Stream failure before any output is a single error event", "[dispatch][stream]") {
    auto rotator = make_rotator();
    auto script = std::make_shared<FakeUpstream>();
    script->stream_error = RawUpstreamError::http(429, R"({"error":"rate limit"})");
    Dispatcher dispatcher(*rotator, fake_factory(script), DispatcherOptions{});

    std::vector<StreamEvent> events;
    auto result = dispatcher.stream(simple_request(true),
                                    [&](const StreamEvent& e) { events.push_back(e); return true; });

    REQUIRE(result.is_err());
    REQUIRE(result.error().category == ErrorCategory::RateLimited);
    REQUIRE(names(events) == std::vector<std::string>{"error"});
}

TEST_CASE("Mid-stream failure ends with an error event", "[dispatch][stream]") {
    auto rotator = make_rotator();
    auto script = std::make_shared<FakeUpstream>();
    script->chunks = {chunk_from(R"({"choices":[{"delta":{"content":"Partial"}}]})")};
    script->stream_error = RawUpstreamError::transport_error(TransportFailure::Reset, "connection reset");
    Dispatcher dispatcher(*rotator, fake_factory(script), DispatcherOptions{});

    std::vector<StreamEvent> events;
    auto result = dispatcher.stream(simple_request(true),
                                    [&](const StreamEvent& e) { events.push_back(e); return true; });

    REQUIRE(result.is_err());
    REQUIRE(result.error().category == ErrorCategory::UpstreamUnavailable);
    REQUIRE(names(events).front() == "message_start");
    REQUIRE(names(events).back() == "error");
}

TEST_CASE("Cancelling an in-flight stream stops all output", "[dispatch][stream]") {
    auto rotator = make_rotator();
    auto script = std::make_shared<FakeUpstream>();
    script->chunks = {
        chunk_from(R"({"choices":[{"delta":{"content":"one"}}]})"),
        chunk_from(R"({"choices":[{"delta":{"content":"two"}}]})"),
        chunk_from(R"({"choices":[{"delta":{"content":"three"}}]})"),
    };
    Dispatcher dispatcher(*rotator, fake_factory(script), DispatcherOptions{});

    script->after_chunk = [&](size_t index) {
        if (index == 0) {
            auto ids = dispatcher.registry().active_ids();
            REQUIRE(ids.size() == 1);
            REQUIRE(dispatcher.cancel(ids[0]));
        }
    };

    std::vector<StreamEvent> events;
    auto result = dispatcher.stream(simple_request(true),
                                    [&](const StreamEvent& e) { events.push_back(e); return true; });

    REQUIRE(result.is_err());
    REQUIRE(result.error().category == ErrorCategory::Cancelled);
    REQUIRE(script->chunks_delivered == 1);
    for (const auto& e : events) {
        REQUIRE(protocol::event_name(e) != "message_stop");
        REQUIRE(protocol::event_name(e) != "error");
    }
    REQUIRE(dispatcher.registry().active_count() == 0);
    REQUIRE_FALSE(dispatcher.cancel("req_unknown"));
}

TEST_CASE("Sink refusing events abandons the upstream", "[dispatch][stream]") {
    auto rotator = make_rotator();
    auto script = std::make_shared<FakeUpstream>();
    script->chunks = {
        chunk_from(R"({"choices":[{"delta":{"content":"one"}}]})"),
        chunk_from(R"({"choices":[{"delta":{"content":"two"}}]})"),
    };
    Dispatcher dispatcher(*rotator, fake_factory(script), DispatcherOptions{});

    size_t accepted = 0;
    auto result = dispatcher.stream(simple_request(true), [&](const StreamEvent&) {
        return ++accepted <= 2;
    });

    REQUIRE(result.is_err());
    REQUIRE(result.error().category == ErrorCategory::Cancelled);
    REQUIRE(script->chunks_delivered == 0);
}

TEST_CASE("Cancel between events of one chunk stops the rest", "[dispatch][stream][cancel]") {
    auto rotator = make_rotator();
    auto script = std::make_shared<FakeUpstream>();
    script->chunks = {
        chunk_from(R"({"choices":[{"delta":{"role":"assistant","content":"one"}}]})"),
        chunk_from(R"({"choices":[{"delta":{"content":"two"}}]})"),
    };
    Dispatcher dispatcher(*rotator, fake_factory(script), DispatcherOptions{});

    std::vector<StreamEvent> events;
    auto result = dispatcher.stream(simple_request(true), [&](const StreamEvent& e) {
        events.push_back(e);
        if (events.size() == 1) {
            auto ids = dispatcher.registry().active_ids();
            if (ids.size() == 1) {
                dispatcher.cancel(ids[0]);
            }
        }
        return true;
    });

    REQUIRE(result.is_err());
    REQUIRE(result.error().category == ErrorCategory::Cancelled);
    REQUIRE(names(events) == std::vector<std::string>{"message_start"});
    REQUIRE(dispatcher.registry().active_count() == 0);
}
