#include "cloudup/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace cloudup::logging {
namespace {

constexpr const char* kLoggerName = "cloudup";

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("CLOUDUP_LOG_LEVEL")) {
        return level;
    }
    return config.level.empty() ? std::string("info") : config.level;
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("CLOUDUP_LOG_PATTERN")) {
        return pattern;
    }
    return config.pattern.empty() ? LoggingConfig{}.pattern : config.pattern;
}

} // namespace

void initialize(const LoggingConfig& config) {
    spdlog::drop(kLoggerName);
    auto logger = spdlog::stdout_color_mt(kLoggerName);
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown() {
    spdlog::shutdown();
}

} // namespace cloudup::logging
