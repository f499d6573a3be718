/**
 * @file logger.hpp
 * @brief Logging utilities wrapping spdlog
 */

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace lumen {

/**
 * @brief Initialize logging (call once at startup)
 *
 * @param appName Logger name shown in every line
 * @param level   Minimum level
 * @param logFile Optional rotating log file; empty for console only
 */
void initLogging(const std::string& appName,
                 spdlog::level::level_enum level = spdlog::level::info,
                 const std::string& logFile = {});

/// Get default logger (lazily created with console output)
std::shared_ptr<spdlog::logger> getLogger();

/// Set log level at runtime
void setLogLevel(spdlog::level::level_enum level);

/// Parse "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off"
spdlog::level::level_enum parseLogLevel(const std::string& name);

} // namespace lumen

#define LUMEN_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(lumen::getLogger(), __VA_ARGS__)
#define LUMEN_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(lumen::getLogger(), __VA_ARGS__)
#define LUMEN_LOG_INFO(...)     SPDLOG_LOGGER_INFO(lumen::getLogger(), __VA_ARGS__)
#define LUMEN_LOG_WARN(...)     SPDLOG_LOGGER_WARN(lumen::getLogger(), __VA_ARGS__)
#define LUMEN_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(lumen::getLogger(), __VA_ARGS__)
#define LUMEN_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(lumen::getLogger(), __VA_ARGS__)
