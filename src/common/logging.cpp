#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>

namespace tokenledger {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::once_flag g_init_flag;

}  // namespace

void InitLogging(const LogConfig& config) {
    std::call_once(g_init_flag, [&config]() {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (always enabled)
        spdlog::sink_ptr console_sink;
        if (config.console_to_stderr) {
            console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else {
            console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        }
        console_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
        sinks.push_back(console_sink);

        // File sink (optional)
        if (config.enable_file) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                config.max_file_size,
                config.max_files
            );
            file_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
            sinks.push_back(file_sink);
        }

        g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        g_logger->set_level(static_cast<spdlog::level::level_enum>(config.level));
        g_logger->set_pattern(config.pattern);

        spdlog::set_default_logger(g_logger);

        // Flush on warn and above
        g_logger->flush_on(spdlog::level::warn);
    });
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (!g_logger) {
        InitLogging();
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    if (g_logger) {
        const auto spd_level = static_cast<spdlog::level::level_enum>(level);
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(spd_level);
        }
        g_logger->set_level(spd_level);
    }
}

LogLevel ParseLogLevel(std::string_view level_name) {
    const std::string name = absl::AsciiStrToLower(level_name);
    if (name == "trace") return LogLevel::kTrace;
    if (name == "debug") return LogLevel::kDebug;
    if (name == "warn" || name == "warning") return LogLevel::kWarn;
    if (name == "error") return LogLevel::kError;
    if (name == "critical") return LogLevel::kCritical;
    if (name == "off") return LogLevel::kOff;
    return LogLevel::kInfo;
}

void FlushLogs() {
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace tokenledger
