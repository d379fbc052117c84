#pragma once

// Logging for tablegrid using spdlog
//
// Log levels (compile-time filtered via SPDLOG_ACTIVE_LEVEL):
//   - TRACE: Very verbose, per-window logging (e.g., every raw window record)
//   - DEBUG: Detailed debugging info (e.g., classification, slot decisions)
//   - INFO:  Normal operational messages (e.g., layout applied, config loaded)
//   - WARN:  Warning conditions
//   - ERROR: Error conditions
//
// Core components never reach for the default logger on their own: they take a
// std::shared_ptr<spdlog::logger> at construction and log through the
// SPDLOG_LOGGER_* macros. The LOG_* macros below are for the application shell.
//
// Usage:
//   LOG_INFO("Loaded {} configurations", count);
//   SPDLOG_LOGGER_DEBUG(logger_, "Detected window {:#x}", id);

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tablegrid::log {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

// Initialize logging - call once at startup
inline LoggerPtr init(spdlog::level::level_enum level = spdlog::level::info,
                      std::optional<std::string> const& file = std::nullopt)
{
    // Create console sink (stderr) with colors
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{ console_sink };

    // Optional file sink for persistent logs
    if (file && !file->empty())
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*file, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("tablegrid", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    // Set as default logger
    spdlog::set_default_logger(logger);
    return logger;
}

// Logger that discards everything, for tests and tools
inline LoggerPtr null_logger()
{
    return std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Resolve an injected logger, falling back to the process default
inline LoggerPtr or_default(LoggerPtr logger)
{
    return logger ? std::move(logger) : spdlog::default_logger();
}

// Shutdown logging - call at exit
inline void shutdown()
{
    spdlog::shutdown();
}

} // namespace tablegrid::log

// Convenience macros using spdlog's compile-time filtered macros
// These are zero-cost when level is below SPDLOG_ACTIVE_LEVEL

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
