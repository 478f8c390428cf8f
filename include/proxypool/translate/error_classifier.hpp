#pragma once

#include "proxypool/core/errors.hpp"
#include "proxypool/upstream/raw_error.hpp"

#include <string>
#include <vector>

namespace proxypool::translate {

using namespace proxypool::core;
using upstream::RawUpstreamError;
using upstream::TransportFailure;

// Maps a raw upstream failure onto the caller-facing taxonomy.
//
// Order: explicit HTTP status, then transport kind, then keyword matching on
// the body and description, then `internal`. Messages are redacted (known
// secrets, bearer tokens, key-shaped literals) and truncated before they
// leave the classifier.
class ErrorClassifier {
public:
    static constexpr size_t kMaxMessageLength = 500;

    ErrorClassifier() = default;
    explicit ErrorClassifier(std::vector<std::string> secrets);

    ErrorEnvelope classify(const RawUpstreamError& error) const;

    std::string sanitize(const std::string& message) const;

private:
    std::vector<std::string> secrets_;

    std::string describe(const RawUpstreamError& error) const;
};

}  // namespace proxypool::translate
