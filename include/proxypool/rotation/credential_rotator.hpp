#pragma once

#include "proxypool/core/result.hpp"
#include "proxypool/core/types.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace proxypool::rotation {

using namespace proxypool::core;

// Upstream secret plus its position in the configured list
struct Credential {
    std::string secret;
    size_t ordinal = 0;
};

// Annotation written back by the probe subsystem
enum class CredentialStatus { Unknown, Valid, Invalid };

inline std::string_view credential_status_to_string(CredentialStatus status) {
    switch (status) {
        case CredentialStatus::Unknown: return "unknown";
        case CredentialStatus::Valid: return "valid";
        case CredentialStatus::Invalid: return "invalid";
    }
    return "unknown";
}

struct Selection {
    Credential credential;
    ModelId model;
};

// Owns the credential and model lists and the single rotation cursor.
//
// select() implements prioritized polling: credentials are the inner loop and
// models the outer loop, so the i-th selection (without interleaving) is
// (credentials[i % K], models[(i / K) % M]). The whole read-advance-wrap step
// runs under one mutex.
class CredentialModelRotator {
public:
    // Fails on an empty credential or model list
    static Result<std::unique_ptr<CredentialModelRotator>, Error> create(
        const std::vector<std::string>& secrets,
        const std::vector<std::string>& models);

    CredentialModelRotator(const CredentialModelRotator&) = delete;
    CredentialModelRotator& operator=(const CredentialModelRotator&) = delete;

    Selection select();

    // Pure round-robin over the models, independent of select()
    ModelId next_model();

    // Read-only snapshots
    std::vector<Credential> credentials() const;
    std::vector<CredentialStatus> statuses() const;
    std::vector<ModelId> models() const;
    size_t credential_count() const;

    // Replace the validity annotations; size must match the credential list
    Result<void, Error> annotate(const std::vector<CredentialStatus>& statuses);

    // Drop credentials annotated Invalid. Refuses to empty the pool.
    // Returns the number of credentials removed.
    Result<size_t, Error> retain_valid();

private:
    CredentialModelRotator(std::vector<Credential> credentials, std::vector<ModelId> models);

    struct Pool {
        std::vector<Credential> credentials;
        std::vector<CredentialStatus> statuses;
    };

    mutable std::mutex mutex_;
    std::shared_ptr<const Pool> pool_;
    const std::vector<ModelId> models_;

    size_t key_idx_ = 0;
    size_t model_idx_ = 0;

    std::atomic<size_t> round_robin_{0};

    std::shared_ptr<const Pool> snapshot() const;
};

}  // namespace proxypool::rotation
