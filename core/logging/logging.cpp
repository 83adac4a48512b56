#include "logging/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <mutex>

namespace pathgraph::logging {

namespace {

constexpr const char* kLoggerName = "pathgraph";
constexpr const char* kLevelEnvVar = "PATHGRAPH_LOG_LEVEL";

std::shared_ptr<spdlog::logger> createLogger() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) return existing;

    auto created = spdlog::stderr_color_mt(kLoggerName);
    LogConfig defaults;
    created->set_level(spdlog::level::from_str(defaults.level));
    created->set_pattern(defaults.pattern);
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] { instance = createLogger(); });
    return instance;
}

void configureLogging(const LogConfig& config) {
    auto log = logger();
    log->set_level(spdlog::level::from_str(config.level));
    log->set_pattern(config.pattern);
}

bool configureLoggingFromEnv() {
    const char* value = std::getenv(kLevelEnvVar);
    if (value == nullptr) return false;

    // from_str() maps unknown names to "off"; only accept real names.
    std::string name(value);
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        logger()->warn("ignoring unknown {} value '{}'", kLevelEnvVar, name);
        return false;
    }
    logger()->set_level(level);
    return true;
}

} // namespace pathgraph::logging
