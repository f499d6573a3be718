/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include <lumen/core/logger.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <vector>

namespace lumen {

namespace {

constexpr size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> s_logger;

} // namespace

void initLogging(const std::string& appName, spdlog::level::level_enum level,
                 const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(level);
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, kMaxLogFileBytes, kMaxLogFiles);
            fileSink->set_level(level);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& ex) {
            // Console logging still works; report and carry on
            std::cerr << "Log file '" << logFile << "' unavailable: " << ex.what() << std::endl;
        }
    }

    s_logger = std::make_shared<spdlog::logger>(appName, sinks.begin(), sinks.end());
    s_logger->set_level(level);
    s_logger->set_pattern(kPattern);

    spdlog::set_default_logger(s_logger);
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (!s_logger) {
        initLogging("lumen");
    }
    return s_logger;
}

void setLogLevel(spdlog::level::level_enum level) {
    if (s_logger) {
        s_logger->set_level(level);
        for (auto& sink : s_logger->sinks()) {
            sink->set_level(level);
        }
    }
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    return spdlog::level::from_str(name);
}

} // namespace lumen
