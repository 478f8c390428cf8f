#include "proxypool/rotation/credential_rotator.hpp"

#include <spdlog/spdlog.h>

namespace proxypool::rotation {

Result<std::unique_ptr<CredentialModelRotator>, Error> CredentialModelRotator::create(
    const std::vector<std::string>& secrets,
    const std::vector<std::string>& models)
{
    using R = Result<std::unique_ptr<CredentialModelRotator>, Error>;

    if (secrets.empty()) {
        return R::err(ErrorCode::UpstreamApiKeyMissing, "No upstream credentials configured");
    }
    if (models.empty()) {
        return R::err(ErrorCode::ConfigValidationFailed, "No upstream models configured");
    }

    std::vector<Credential> credentials;
    credentials.reserve(secrets.size());
    for (size_t i = 0; i < secrets.size(); ++i) {
        credentials.push_back(Credential{secrets[i], i});
    }

    return R::ok(std::unique_ptr<CredentialModelRotator>(
        new CredentialModelRotator(std::move(credentials), models)));
}

CredentialModelRotator::CredentialModelRotator(std::vector<Credential> credentials,
                                               std::vector<ModelId> models)
    : models_(std::move(models))
{
    auto pool = std::make_shared<Pool>();
    pool->statuses.assign(credentials.size(), CredentialStatus::Unknown);
    pool->credentials = std::move(credentials);
    pool_ = std::move(pool);
}

Selection CredentialModelRotator::select() {
    std::lock_guard<std::mutex> lock(mutex_);

    Selection selection{pool_->credentials[key_idx_], models_[model_idx_]};

    ++key_idx_;
    if (key_idx_ >= pool_->credentials.size()) {
        key_idx_ = 0;
        model_idx_ = (model_idx_ + 1) % models_.size();
    }

    return selection;
}

ModelId CredentialModelRotator::next_model() {
    size_t slot = round_robin_.fetch_add(1, std::memory_order_relaxed);
    return models_[slot % models_.size()];
}

std::shared_ptr<const CredentialModelRotator::Pool> CredentialModelRotator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_;
}

std::vector<Credential> CredentialModelRotator::credentials() const {
    return snapshot()->credentials;
}

std::vector<CredentialStatus> CredentialModelRotator::statuses() const {
    return snapshot()->statuses;
}

std::vector<ModelId> CredentialModelRotator::models() const {
    return models_;
}

size_t CredentialModelRotator::credential_count() const {
    return snapshot()->credentials.size();
}

Result<void, Error> CredentialModelRotator::annotate(const std::vector<CredentialStatus>& statuses) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (statuses.size() != pool_->credentials.size()) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Annotation count does not match credential count",
            std::to_string(statuses.size()) + " != " + std::to_string(pool_->credentials.size())
        );
    }

    auto next = std::make_shared<Pool>(*pool_);
    next->statuses = statuses;
    pool_ = std::move(next);
    return Result<void, Error>::ok();
}

Result<size_t, Error> CredentialModelRotator::retain_valid() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto next = std::make_shared<Pool>();
    for (size_t i = 0; i < pool_->credentials.size(); ++i) {
        if (pool_->statuses[i] != CredentialStatus::Invalid) {
            next->credentials.push_back(pool_->credentials[i]);
            next->statuses.push_back(pool_->statuses[i]);
        }
    }

    if (next->credentials.empty()) {
        return Result<size_t, Error>::err(
            ErrorCode::InvalidState,
            "Every credential is invalid; keeping the full list"
        );
    }

    size_t removed = pool_->credentials.size() - next->credentials.size();
    if (removed > 0) {
        spdlog::warn("Removed {} invalid credential(s) from rotation, {} remain",
                     removed, next->credentials.size());
        pool_ = std::move(next);
        key_idx_ = 0;
        model_idx_ = 0;
    }
    return Result<size_t, Error>::ok(removed);
}

}  // namespace proxypool::rotation
