#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace NixBlitz {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Install, Network, Process, State, System, Update };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Install:
            return "install";
        case LogChannel::Network:
            return "network";
        case LogChannel::Process:
            return "process";
        case LogChannel::State:
            return "state";
        case LogChannel::System:
            return "system";
        case LogChannel::Update:
            return "update";
    }
    return "";
}

/**
 * @brief Centralized logging channel management for the engine daemons.
 *
 * Every channel logger shares the same console and file sinks, so supervised build output
 * (the "process" channel) lands in the persistent log next to state and network messages.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for log file and pattern (e.g., "installer-engine")
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default");

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath> if not found.
     * @return true if config was loaded successfully, false if already initialized
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "process:debug" - Show every line of supervised build output
     *   "*:off,state:trace" - Disable all except state transitions
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    static void createChannelLoggers(spdlog::level::level_enum level);
    static void createDefaultLogger(
        const std::vector<spdlog::sink_ptr>& sinks, const std::string& componentName);

    /**
     * @brief Load JSON config from file, with .local override support.
     * Creates default config if file doesn't exist.
     */
    static nlohmann::json loadConfigFile(const std::string& configPath);

    static nlohmann::json defaultConfig();
    static bool createDefaultConfigFile(const std::string& path);
    static void applyConfig(const nlohmann::json& config, const std::string& componentName);

    static std::string channelPattern(
        const std::string& basePattern, const std::string& componentName);

    static void initializeLocked(
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& componentName);

    static std::atomic<bool> initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// Undefine any existing LOG_* macros (e.g., from libdatachannel).
#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(LoggingChannels::get(::NixBlitz::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(LoggingChannels::get(::NixBlitz::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(LoggingChannels::get(::NixBlitz::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(LoggingChannels::get(::NixBlitz::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(LoggingChannels::get(::NixBlitz::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace NixBlitz
