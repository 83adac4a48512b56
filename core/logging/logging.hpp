#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace pathgraph::logging {

/// Logger configuration. The level name follows spdlog
/// ("trace", "debug", "info", "warn", "error", "critical", "off").
struct LogConfig {
    std::string level = "warn";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
};

/// The shared "pathgraph" logger. Created on first use with a
/// stderr colour sink and the default LogConfig.
std::shared_ptr<spdlog::logger> logger();

/// Apply a configuration to the shared logger.
void configureLogging(const LogConfig& config);

/// Read PATHGRAPH_LOG_LEVEL and apply it if set to a known level.
/// Returns true when the variable was present and accepted.
bool configureLoggingFromEnv();

} // namespace pathgraph::logging
