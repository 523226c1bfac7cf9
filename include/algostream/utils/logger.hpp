#pragma once
// ============================================================================
// ALGOSTREAM - Logging
// ============================================================================
// Process-wide spdlog logger. Logging before init() goes to spdlog's
// default console logger.
// ============================================================================

#include <spdlog/spdlog.h>

#include <string>
#include <string_view>
#include <utility>

namespace algostream::utils {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, Off };

/// Case-insensitive level name; "warning" is accepted for Warn
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info);

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file;  // Rotating file sink beside stderr when set
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

    bool async = true;               // Frames are parsed on the I/O thread; keep sinks off it
    size_t queue_size = 8192;
    size_t flush_interval_ms = 100;

    size_t max_file_size_mb = 100;
    size_t max_files = 10;
};

class Logger {
public:
    Logger() = delete;

    /// Replace spdlog's default logger with one built from config
    static void init(const LogConfig& config);

    /// Flush and stop the async pool
    static void shutdown();

    template <typename... Args>
    static void write(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        spdlog::default_logger_raw()->log(level, fmt, std::forward<Args>(args)...);
    }
};

#define ALGOSTREAM_LOG(lvl, ...) ::algostream::utils::Logger::write(::spdlog::level::lvl, __VA_ARGS__)

#define LOG_TRACE(...) ALGOSTREAM_LOG(trace, __VA_ARGS__)
#define LOG_DEBUG(...) ALGOSTREAM_LOG(debug, __VA_ARGS__)
#define LOG_INFO(...) ALGOSTREAM_LOG(info, __VA_ARGS__)
#define LOG_WARN(...) ALGOSTREAM_LOG(warn, __VA_ARGS__)
#define LOG_ERROR(...) ALGOSTREAM_LOG(err, __VA_ARGS__)
#define LOG_CRITICAL(...) ALGOSTREAM_LOG(critical, __VA_ARGS__)

}  // namespace algostream::utils
