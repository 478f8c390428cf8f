#include "proxypool/rotation/model_mapper.hpp"

namespace proxypool::rotation {

ModelMapper::ModelMapper(CredentialModelRotator& rotator, std::vector<std::string> passthrough_prefixes)
    : rotator_(rotator)
    , prefixes_(std::move(passthrough_prefixes))
{
}

bool ModelMapper::is_passthrough(const std::string& requested) const {
    for (const auto& prefix : prefixes_) {
        if (!prefix.empty() && requested.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

ModelId ModelMapper::resolve(const std::string& requested, const ModelId& selected) const {
    return is_passthrough(requested) ? requested : selected;
}

ModelId ModelMapper::map(const std::string& requested) {
    if (is_passthrough(requested)) {
        return requested;
    }
    return rotator_.next_model();
}

}  // namespace proxypool::rotation
