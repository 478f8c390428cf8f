#pragma once

#include "config.hpp"

#include <string>

namespace proxypool::core {

// Replace spdlog's default logger with a console (and optional file) logger
// at the configured level. Safe to call more than once.
Result<void, Error> init_logging(const ObservabilityConfig& config);

// Show only the first few characters of a secret
std::string mask_secret(const std::string& secret);

}  // namespace proxypool::core
