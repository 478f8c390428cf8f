#pragma once

#include "proxypool/core/config.hpp"
#include "proxypool/core/result.hpp"
#include "proxypool/rotation/credential_rotator.hpp"
#include "proxypool/upstream/raw_error.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace proxypool::probe {

using namespace proxypool::core;
using rotation::Credential;
using rotation::CredentialStatus;
using upstream::RawUpstreamError;

enum class ProbeOutcome {
    Valid,
    WrongPrefix,
    Unauthorized,
    HttpError,
    Timeout,
    NetworkError
};

std::string_view probe_outcome_to_string(ProbeOutcome outcome);

struct ProbeResult {
    size_t ordinal = 0;
    std::string key_preview;  // masked
    ProbeOutcome outcome = ProbeOutcome::NetworkError;
    std::optional<int> status;
    std::string message;

    bool valid() const { return outcome == ProbeOutcome::Valid; }

    Json to_json() const;
};

struct ProbeReport {
    std::vector<ProbeResult> results;  // in credential order
    std::string model;

    size_t total() const { return results.size(); }
    size_t valid_count() const;
    size_t invalid_count() const { return total() - valid_count(); }

    // "66.7%"
    std::string valid_rate() const;

    std::vector<CredentialStatus> statuses() const;
    std::vector<std::string> recommendations() const;

    Json to_json() const;
};

// Sends one probe body with one key. Swappable so tests need no network.
using ProbeTransport = std::function<Result<std::string, RawUpstreamError>(
    const std::string& api_key, const Json& body, int timeout_s)>;

// Classifies credentials as valid or invalid with a minimal real inference
// call (max_tokens 5). Probing is informational: it never changes what the
// rotator serves unless the caller applies the report.
class KeyProber {
public:
    KeyProber(ProbeConfig config, ProbeTransport transport);

    static ProbeTransport http_transport(const UpstreamConfig& config);

    static Json probe_body(const std::string& model);

    ProbeResult probe(const Credential& credential, const std::string& model) const;

    // All credentials, concurrently
    ProbeReport probe_all(const std::vector<Credential>& credentials, const std::string& model) const;

private:
    ProbeConfig config_;
    ProbeTransport transport_;
};

// Probe every credential, annotate the rotator and, unless configured to keep
// them, drop the invalid ones (never emptying the pool)
Result<ProbeReport, Error> run_probe(const KeyProber& prober,
                                     rotation::CredentialModelRotator& rotator,
                                     const ProbeConfig& config);

}  // namespace proxypool::probe
