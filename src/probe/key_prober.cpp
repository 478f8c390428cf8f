#include "proxypool/probe/key_prober.hpp"
#include "proxypool/core/logging.hpp"
#include "proxypool/core/thread_pool.hpp"
#include "proxypool/upstream/http_upstream_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <future>

namespace proxypool::probe {

namespace {

constexpr size_t kMaxProbeThreads = 8;

std::string truncate(const std::string& s, size_t max_len) {
    return s.size() <= max_len ? s : s.substr(0, max_len);
}

}  // namespace

std::string_view probe_outcome_to_string(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Valid: return "valid";
        case ProbeOutcome::WrongPrefix: return "wrong_prefix";
        case ProbeOutcome::Unauthorized: return "unauthorized";
        case ProbeOutcome::HttpError: return "http_error";
        case ProbeOutcome::Timeout: return "timeout";
        case ProbeOutcome::NetworkError: return "network_error";
    }
    return "network_error";
}

Json ProbeResult::to_json() const {
    Json j = {
        {"key_index", ordinal},
        {"key_preview", key_preview},
        {"valid", valid()},
        {"reason", std::string(probe_outcome_to_string(outcome))},
        {"message", message}
    };
    if (status) {
        j["status_code"] = *status;
    }
    return j;
}

size_t ProbeReport::valid_count() const {
    size_t n = 0;
    for (const auto& r : results) {
        if (r.valid()) ++n;
    }
    return n;
}

std::string ProbeReport::valid_rate() const {
    if (results.empty()) {
        return "0.0%";
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.1f%%",
                  100.0 * static_cast<double>(valid_count()) / static_cast<double>(total()));
    return buf;
}

std::vector<CredentialStatus> ProbeReport::statuses() const {
    std::vector<CredentialStatus> out;
    out.reserve(results.size());
    for (const auto& r : results) {
        out.push_back(r.valid() ? CredentialStatus::Valid : CredentialStatus::Invalid);
    }
    return out;
}

std::vector<std::string> ProbeReport::recommendations() const {
    std::vector<std::string> out;
    if (results.empty()) {
        out.push_back("No credentials configured");
        return out;
    }
    size_t valid = valid_count();
    if (valid == 0) {
        out.push_back("No credential passed the probe; check the keys and the upstream base URL");
    } else if (valid < total()) {
        out.push_back("Remove or replace the " + std::to_string(invalid_count()) + " invalid credential(s)");
    } else {
        out.push_back("All credentials are valid");
    }

    bool any_transient = false;
    for (const auto& r : results) {
        if (r.outcome == ProbeOutcome::Timeout || r.outcome == ProbeOutcome::NetworkError) {
            any_transient = true;
        }
    }
    if (any_transient) {
        out.push_back("Some probes failed on the network; re-run the probe before discarding keys");
    }
    return out;
}

Json ProbeReport::to_json() const {
    Json results_json = Json::array();
    for (const auto& r : results) {
        results_json.push_back(r.to_json());
    }
    return {
        {"status", "completed"},
        {"model", model},
        {"summary", {
            {"total_keys", total()},
            {"valid_keys", valid_count()},
            {"invalid_keys", invalid_count()},
            {"valid_rate", valid_rate()}
        }},
        {"results", results_json},
        {"recommendations", recommendations()}
    };
}

KeyProber::KeyProber(ProbeConfig config, ProbeTransport transport)
    : config_(std::move(config))
    , transport_(std::move(transport))
{
}

ProbeTransport KeyProber::http_transport(const UpstreamConfig& config) {
    upstream::UpstreamEndpoint endpoint = upstream::UpstreamEndpoint::from_config(config);
    return [endpoint](const std::string& api_key, const Json& body, int timeout_s) {
        upstream::HttpUpstreamClient client(endpoint, api_key);
        return client.post_raw(body, timeout_s);
    };
}

Json KeyProber::probe_body(const std::string& model) {
    return {
        {"model", model},
        {"messages", Json::array({{{"role", "user"}, {"content", "Hello"}}})},
        {"max_tokens", 5},
        {"temperature", 0.1}
    };
}

ProbeResult KeyProber::probe(const Credential& credential, const std::string& model) const {
    ProbeResult result;
    result.ordinal = credential.ordinal;
    result.key_preview = mask_secret(credential.secret);

    if (!config_.key_prefix.empty() && credential.secret.rfind(config_.key_prefix, 0) != 0) {
        result.outcome = ProbeOutcome::WrongPrefix;
        result.message = "Key does not start with '" + config_.key_prefix + "'";
        return result;
    }

    auto response = transport_(credential.secret, probe_body(model), config_.timeout_s);
    if (response.is_ok()) {
        result.outcome = ProbeOutcome::Valid;
        result.status = 200;
        result.message = "Key can perform inference";
        return result;
    }

    const RawUpstreamError& error = response.error();
    result.status = error.status;
    if (error.status) {
        if (*error.status == 401) {
            result.outcome = ProbeOutcome::Unauthorized;
            result.message = "Key is invalid, expired or revoked";
        } else {
            result.outcome = ProbeOutcome::HttpError;
            result.message = "HTTP " + std::to_string(*error.status) + ": " + truncate(error.body, 200);
        }
    } else if (error.transport == upstream::TransportFailure::Timeout) {
        result.outcome = ProbeOutcome::Timeout;
        result.message = "Probe timed out after " + std::to_string(config_.timeout_s) + "s";
    } else {
        result.outcome = ProbeOutcome::NetworkError;
        result.message = "Network error: " + error.description;
    }

    // Upstream text may quote the key back
    size_t pos = 0;
    while (!credential.secret.empty() &&
           (pos = result.message.find(credential.secret, pos)) != std::string::npos) {
        result.message.replace(pos, credential.secret.size(), result.key_preview);
        pos += result.key_preview.size();
    }
    return result;
}

ProbeReport KeyProber::probe_all(const std::vector<Credential>& credentials, const std::string& model) const {
    ProbeReport report;
    report.model = model;
    if (credentials.empty()) {
        return report;
    }

    ThreadPool pool(std::min(credentials.size(), kMaxProbeThreads));

    std::vector<std::future<ProbeResult>> futures;
    futures.reserve(credentials.size());
    for (const auto& credential : credentials) {
        futures.push_back(pool.submit([this, credential, model]() {
            return probe(credential, model);
        }));
    }

    // Collect results in order
    report.results.reserve(credentials.size());
    for (auto& future : futures) {
        report.results.push_back(future.get());
    }
    return report;
}

Result<ProbeReport, Error> run_probe(const KeyProber& prober,
                                     rotation::CredentialModelRotator& rotator,
                                     const ProbeConfig& config) {
    std::string model = config.model.empty() ? rotator.next_model() : config.model;
    auto credentials = rotator.credentials();

    spdlog::info("Probing {} credential(s) with model {}", credentials.size(), model);
    ProbeReport report = prober.probe_all(credentials, model);

    for (const auto& r : report.results) {
        if (r.valid()) {
            spdlog::info("  key#{} {}: valid", r.ordinal, r.key_preview);
        } else {
            spdlog::warn("  key#{} {}: {} ({})", r.ordinal, r.key_preview,
                         probe_outcome_to_string(r.outcome), r.message);
        }
    }
    spdlog::info("Probe finished: {}/{} valid ({})", report.valid_count(), report.total(), report.valid_rate());

    auto annotated = rotator.annotate(report.statuses());
    if (annotated.is_err()) {
        return Result<ProbeReport, Error>::err(annotated.error());
    }

    if (!config.keep_invalid_keys) {
        auto retained = rotator.retain_valid();
        if (retained.is_err()) {
            spdlog::error("{}", retained.error().to_string());
        }
    }

    return Result<ProbeReport, Error>::ok(std::move(report));
}

}  // namespace proxypool::probe
