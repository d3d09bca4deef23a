#pragma once
/**
 * @file logging.h
 * @brief Logging configuration
 *
 * Tessera logs through spdlog's SPDLOG_* macros on the default logger.
 * This header only configures that logger.
 */

#include <string>

namespace tessera::core {

/**
 * @brief Logging settings
 */
struct LoggingConfig {
    /// One of trace, debug, info, warn, error, critical, off
    std::string level{"info"};

    /// spdlog pattern; empty keeps the library default
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};
};

/**
 * @brief Apply level and pattern to the default spdlog logger
 *
 * Unknown level names fall back to info.
 */
void configure_logging(const LoggingConfig& config);

} // namespace tessera::core
