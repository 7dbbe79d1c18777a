#pragma once

/// @file logging.h
/// @brief tokenledger logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace tokenledger {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "tokenledger";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // Console output goes to stderr so stdout stays clean for report output
    bool console_to_stderr = true;

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "tokenledger.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Initialize the global logger with the given configuration
/// @param config Logging configuration
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
/// @return Shared pointer to the logger
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
/// @param level Log level to set
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off"), ignoring case
/// @return Parsed level, or kInfo for unrecognized names
LogLevel ParseLogLevel(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define TOKENLEDGER_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::tokenledger::GetLogger(), __VA_ARGS__)
#define TOKENLEDGER_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::tokenledger::GetLogger(), __VA_ARGS__)
#define TOKENLEDGER_LOG_INFO(...) SPDLOG_LOGGER_INFO(::tokenledger::GetLogger(), __VA_ARGS__)
#define TOKENLEDGER_LOG_WARN(...) SPDLOG_LOGGER_WARN(::tokenledger::GetLogger(), __VA_ARGS__)
#define TOKENLEDGER_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::tokenledger::GetLogger(), __VA_ARGS__)
#define TOKENLEDGER_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::tokenledger::GetLogger(), __VA_ARGS__)

}  // namespace tokenledger
