#include "proxypool/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <vector>

namespace proxypool::core {

Result<void, Error> init_logging(const ObservabilityConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        if (!config.log_path.empty()) {
            fs::path file = config.log_path;
            if (fs::is_directory(file) || !file.has_extension()) {
                fs::create_directories(file);
                file /= "proxypool.log";
            } else if (file.has_parent_path()) {
                fs::create_directories(file.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string(), false));
        }

        auto logger = std::make_shared<spdlog::logger>("proxypool", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);
        return Result<void, Error>::ok();

    } catch (const spdlog::spdlog_ex& e) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            std::string("Failed to initialize logging: ") + e.what(),
            config.log_path.string()
        );
    } catch (const fs::filesystem_error& e) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            std::string("Failed to create log directory: ") + e.what(),
            config.log_path.string()
        );
    }
}

std::string mask_secret(const std::string& secret) {
    size_t visible = std::min<size_t>(6, secret.size() / 3);
    return secret.substr(0, visible) + "...";
}

}  // namespace proxypool::core
