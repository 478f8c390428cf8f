#include <catch2/catch_test_macros.hpp>
#include "proxypool/translate/error_classifier.hpp"

using namespace proxypool::translate;

TEST_CASE("Rate limit response keeps its status", "[translate][errors]") {
    ErrorClassifier classifier;
    ErrorEnvelope envelope = classifier.classify(RawUpstreamError::http(429, R"({"error":"rate limit"})"));

    REQUIRE(envelope.category == ErrorCategory::RateLimited);
    REQUIRE(envelope.upstream_status == 429);
    REQUIRE(envelope.message == "rate limit");
    REQUIRE(envelope.is_retriable());
}

TEST_CASE("HTTP status decides first", "[translate][errors]") {
    ErrorClassifier classifier;

    // Body text says "rate limit" but the status wins
    REQUIRE(classifier.classify(RawUpstreamError::http(401, "rate limit")).category
            == ErrorCategory::Authentication);
    REQUIRE(classifier.classify(RawUpstreamError::http(400, R"({"error":{"message":"bad field"}})")).category
            == ErrorCategory::InvalidRequest);
    REQUIRE(classifier.classify(RawUpstreamError::http(404, "")).category == ErrorCategory::InvalidRequest);
    REQUIRE(classifier.classify(RawUpstreamError::http(408, "")).category == ErrorCategory::Timeout);
    REQUIRE(classifier.classify(RawUpstreamError::http(502, "<html>")).category
            == ErrorCategory::UpstreamUnavailable);
    REQUIRE(classifier.classify(RawUpstreamError::http(503, "")).category
            == ErrorCategory::UpstreamUnavailable);
}

TEST_CASE("Transport failures", "[translate][errors]") {
    ErrorClassifier classifier;

    auto timeout = classifier.classify(RawUpstreamError::transport_error(TransportFailure::Timeout, "read timed out"));
    REQUIRE(timeout.category == ErrorCategory::Timeout);
    REQUIRE_FALSE(timeout.upstream_status);

    REQUIRE(classifier.classify(RawUpstreamError::transport_error(TransportFailure::ConnectFailed, "")).category
            == ErrorCategory::UpstreamUnavailable);
    REQUIRE(classifier.classify(RawUpstreamError::transport_error(TransportFailure::Reset, "")).category
            == ErrorCategory::UpstreamUnavailable);
    REQUIRE(classifier.classify(RawUpstreamError::transport_error(TransportFailure::Cancelled, "")).category
            == ErrorCategory::Cancelled);
}

TEST_CASE("Keywords classify status-less failures", "[translate][errors]") {
    ErrorClassifier classifier;
    auto classify_text = [&](const std::string& text) {
        return classifier.classify(RawUpstreamError::transport_error(TransportFailure::Malformed, text)).category;
    };

    REQUIRE(classify_text("Invalid API key supplied") == ErrorCategory::Authentication);
    REQUIRE(classify_text("You exceeded your current quota") == ErrorCategory::RateLimited);
    REQUIRE(classify_text("deadline exceeded") == ErrorCategory::Timeout);
    REQUIRE(classify_text("model is overloaded") == ErrorCategory::UpstreamUnavailable);
    REQUIRE(classify_text("maximum context length is 8192") == ErrorCategory::InvalidRequest);
    REQUIRE(classify_text("something odd happened") == ErrorCategory::Internal);
}

TEST_CASE("Empty detail falls back to a category message", "[translate][errors]") {
    ErrorClassifier classifier;
    auto envelope = classifier.classify(RawUpstreamError::http(503, ""));
    REQUIRE_FALSE(envelope.message.empty());
}

TEST_CASE("Secrets never leave the classifier", "[translate][errors]") {
    ErrorClassifier classifier(std::vector<std::string>{"ms-abc-secret-123", ""});

    auto envelope = classifier.classify(RawUpstreamError::http(
        401, R"({"error":{"message":"Key ms-abc-secret-123 is not valid"}})"));
    REQUIRE(envelope.message.find("ms-abc-secret-123") == std::string::npos);
    REQUIRE(envelope.message.find("[redacted]") != std::string::npos);

    REQUIRE(classifier.sanitize("header was Bearer abc.def-ghi") == "header was Bearer [redacted]");
    REQUIRE(classifier.sanitize("Incorrect API key provided: sk-proj1234567890")
            == "Incorrect API key provided: [redacted]");
    REQUIRE(classifier.sanitize("short sk-12 stays") == "short sk-12 stays");
}

TEST_CASE("Long messages are truncated on a character boundary", "[translate][errors]") {
    ErrorClassifier classifier;

    std::string long_text(600, 'x');
    REQUIRE(classifier.sanitize(long_text).size() == ErrorClassifier::kMaxMessageLength);

    std::string multibyte = std::string(ErrorClassifier::kMaxMessageLength - 1, 'a') + "\xC3\xA9" + "tail";
    std::string cut = classifier.sanitize(multibyte);
    REQUIRE(cut.size() == ErrorClassifier::kMaxMessageLength - 1);
    REQUIRE(cut.back() == 'a');
}
