#pragma once

#include "credential_rotator.hpp"

#include <string>
#include <vector>

namespace proxypool::rotation {

// Decides which upstream model serves a caller's requested model name.
// Names that already address an upstream model (by prefix) pass through;
// everything else is served by the rotated model.
class ModelMapper {
public:
    ModelMapper(CredentialModelRotator& rotator, std::vector<std::string> passthrough_prefixes);

    bool is_passthrough(const std::string& requested) const;

    // Use `selected` (from CredentialModelRotator::select) unless the caller's
    // name passes through
    ModelId resolve(const std::string& requested, const ModelId& selected) const;

    // Same as resolve(), drawing from the round-robin selector instead
    ModelId map(const std::string& requested);

private:
    CredentialModelRotator& rotator_;
    std::vector<std::string> prefixes_;
};

}  // namespace proxypool::rotation
