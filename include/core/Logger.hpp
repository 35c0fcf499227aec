#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace basalt {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Console sink (with colors) plus an optional file sink. Codec code never
 * logs; the assembler, loaders and tools use the LOG_* macros below.
 */
class Logger {
public:
    /**
     * @brief Initialize the default logger
     * @param name Logger name (default: "Basalt")
     * @param logFile Path of the log file, empty for console only
     * @param level Minimum level emitted by every sink
     */
    static void init(const std::string& name = "Basalt",
                     const std::string& logFile = "",
                     spdlog::level::level_enum level = spdlog::level::info) {
        std::vector<spdlog::sink_ptr> sinks;

        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(level);
        sinks.push_back(consoleSink);

        if (!logFile.empty()) {
            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                logFile, true);  // true = truncate (clear file on open)
            fileSink->set_level(level);
            sinks.push_back(fileSink);
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");

        // Re-initialization replaces the previous logger of the same name
        spdlog::drop(name);
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
    }

    /**
     * @brief Parse a level name from configuration
     * @param text One of trace, debug, info, warn, error, critical, off
     * @return The spdlog level, or std::nullopt for an unknown name
     */
    static std::optional<spdlog::level::level_enum> parseLevel(const std::string& text) {
        if (text == "off") {
            return spdlog::level::off;
        }
        // from_str() maps unknown names to off
        auto level = spdlog::level::from_str(text);
        if (level == spdlog::level::off) {
            return std::nullopt;
        }
        return level;
    }

    /**
     * @brief Shutdown all loggers and flush buffers
     */
    static void shutdown() {
        spdlog::shutdown();
    }
};

// Convenience macros
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define LOG_TRACE(...)    spdlog::trace(__VA_ARGS__)
#define LOG_DEBUG(...)    spdlog::debug(__VA_ARGS__)
#define LOG_INFO(...)     spdlog::info(__VA_ARGS__)
#define LOG_WARN(...)     spdlog::warn(__VA_ARGS__)
#define LOG_ERROR(...)    spdlog::error(__VA_ARGS__)
#define LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace basalt
