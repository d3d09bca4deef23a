/**
 * @file logging.cpp
 * @brief Default logger configuration
 */

#include "tessera/core/logging.h"
#include <spdlog/spdlog.h>

namespace tessera::core {

namespace {

spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // anonymous namespace

void configure_logging(const LoggingConfig& config) {
    spdlog::level::level_enum level = parse_level(config.level);
    if (level == spdlog::level::info && config.level != "info") {
        SPDLOG_WARN("Unknown log level '{}', using info", config.level);
    }
    spdlog::set_level(level);

    if (!config.pattern.empty()) {
        spdlog::set_pattern(config.pattern);
    }
}

} // namespace tessera::core
