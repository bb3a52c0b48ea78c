#pragma once

#include <string>

namespace cloudup::logging {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
};

/**
 * @brief Install the process-wide "cloudup" spdlog logger
 *
 * CLOUDUP_LOG_LEVEL and CLOUDUP_LOG_PATTERN override the configured values.
 * Safe to call more than once; the previous logger is replaced.
 */
void initialize(const LoggingConfig& config);

void shutdown();

} // namespace cloudup::logging
