// ============================================================================
// ALGOSTREAM - Logging Implementation
// ============================================================================

#include "algostream/utils/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace algostream::utils {

namespace {

constexpr const char* LOGGER_NAME = "algostream";

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

void Logger::init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size_mb * 1024 * 1024, config.max_files));
    }

    spdlog::drop(LOGGER_NAME);

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    } else {
        logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::milliseconds(config.flush_interval_ms));
}

void Logger::shutdown() {
    if (auto* logger = spdlog::default_logger_raw()) {
        logger->flush();
    }
    spdlog::shutdown();
}

}  // namespace algostream::utils
