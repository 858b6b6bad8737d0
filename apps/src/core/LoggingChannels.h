#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace AgentEvo {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Cli, Config, Evolution, Feedback };

inline constexpr LogChannel ALL_LOG_CHANNELS[] = {
    LogChannel::Cli,
    LogChannel::Config,
    LogChannel::Evolution,
    LogChannel::Feedback,
};

const char* toString(LogChannel channel);

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Provides named loggers for each subsystem so one area can be traced without
 * flooding the output from the others.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared console and file sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for log file and pattern (e.g., "cli")
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default");

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>. Writes a default
     * config file when neither exists.
     * @return true if the config was applied, false if already initialized
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    /**
     * @brief Get a specific channel logger.
     */
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "evolution:debug"          - Trace generation steps
     *   "*:off,feedback:trace"     - Only feedback recording
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);

    /**
     * @brief Set the log level for a channel by name. Unknown names are reported and ignored.
     */
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    /**
     * @brief Drop all channel loggers so the next initialize() starts clean. Test helper.
     */
    static void shutdown();

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static nlohmann::json defaultConfig();
    static nlohmann::json loadConfigFile(const std::string& configPath);
    static bool createDefaultConfigFile(const std::string& path);
    static void applyConfig(const nlohmann::json& config, const std::string& componentName);
    static std::string buildPattern(const std::string& basePattern, const std::string& componentName);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

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

// clang-format off
#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::AgentEvo::LoggingChannels::get(::AgentEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::AgentEvo::LoggingChannels::get(::AgentEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::AgentEvo::LoggingChannels::get(::AgentEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::AgentEvo::LoggingChannels::get(::AgentEvo::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::AgentEvo::LoggingChannels::get(::AgentEvo::LogChannel::channel), __VA_ARGS__)

// Default logger (no channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)
// clang-format on

} // namespace AgentEvo
