#include "LoggingChannels.h"
#include "Assert.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

namespace AgentEvo {

namespace {
constexpr const char* kDefaultPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";
constexpr const char* kDefaultLogFile = "agentevo.log";

std::mutex& initMutex()
{
    static std::mutex mutex;
    return mutex;
}

std::string trim(const std::string& text)
{
    const size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}
} // namespace

const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Cli:
            return "cli";
        case LogChannel::Config:
            return "config";
        case LogChannel::Evolution:
            return "evolution";
        case LogChannel::Feedback:
            return "feedback";
    }
    AGENTEVO_ASSERT(false, "Unhandled LogChannel in switch");
    return "";
}

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    nlohmann::json config = defaultConfig();
    config["defaults"]["console_level"] = spdlog::level::to_string_view(consoleLevel).data();
    config["defaults"]["file_level"] = spdlog::level::to_string_view(fileLevel).data();
    applyConfig(config, componentName);

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized");
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    applyConfig(loadConfigFile(configPath), componentName);

    initialized_ = true;
    return true;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    bool needsInit = false;
    {
        std::lock_guard<std::mutex> lock(initMutex());
        needsInit = !initialized_;
    }
    if (needsInit) {
        initialize(spdlog::level::warn, spdlog::level::debug);
    }

    auto logger = spdlog::get(toString(channel));
    AGENTEVO_ASSERT(logger, "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);

        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            for (const LogChannel each : ALL_LOG_CHANNELS) {
                setChannelLevel(each, level);
            }
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    get(channel)->set_level(level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    for (const LogChannel each : ALL_LOG_CHANNELS) {
        if (channel == toString(each)) {
            setChannelLevel(each, level);
            return;
        }
    }
    spdlog::warn("Unknown log channel '{}'", channel);
}

void LoggingChannels::shutdown()
{
    std::lock_guard<std::mutex> lock(initMutex());
    for (const LogChannel each : ALL_LOG_CHANNELS) {
        spdlog::drop(toString(each));
    }
    sharedSinks_.clear();
    initialized_ = false;
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kDefaultPattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kDefaultLogFile },
                { "truncate", true },
                { "max_size_mb", 0 },
                { "max_files", 3 } } } } },
        { "channels",
          { { "cli", "info" }, { "config", "info" }, { "evolution", "info" }, { "feedback", "info" } } }
    };
}

bool LoggingChannels::createDefaultConfigFile(const std::string& path)
{
    try {
        std::ofstream configFile(path);
        if (!configFile.is_open()) {
            spdlog::error("Failed to create config file: {}", path);
            return false;
        }
        configFile << defaultConfig().dump(2) << std::endl;
        spdlog::info("Created default logging config file: {}", path);
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to write default config file {}: {}", path, e.what());
        return false;
    }
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::info("Logging config not found, creating default: {}", configPath);
        if (!createDefaultConfigFile(configPath)) {
            spdlog::warn("Could not create logging config file, using built-in defaults");
        }
        return defaultConfig();
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("Cannot open logging config file {}, using built-in defaults", pathToUse);
            return defaultConfig();
        }
        return nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error(
            "Failed to parse logging config {}: {}, using built-in defaults", pathToUse, e.what());
        return defaultConfig();
    }
    catch (const std::exception& e) {
        spdlog::error(
            "Error reading logging config {}: {}, using built-in defaults", pathToUse, e.what());
        return defaultConfig();
    }
}

std::string LoggingChannels::buildPattern(
    const std::string& basePattern, const std::string& componentName)
{
    if (componentName == "default" || componentName.empty()) {
        return basePattern;
    }

    // Inject component name after the timestamp.
    const size_t pos = basePattern.find("] ");
    if (pos == std::string::npos) {
        return "[" + componentName + "] " + basePattern;
    }
    return basePattern.substr(0, pos + 2) + "[" + componentName + "] "
        + basePattern.substr(pos + 2);
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    if (!config.is_object()) {
        spdlog::warn("Logging config is not a JSON object, using built-in defaults");
        applyConfig(defaultConfig(), componentName);
        return;
    }

    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string basePattern = kDefaultPattern;
    int flushIntervalMs = 1000;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config.at("defaults");
            consoleLevel = parseLevelString(defaults.value("console_level", "info"));
            fileLevel = parseLevelString(defaults.value("file_level", "debug"));
            basePattern = defaults.value("pattern", basePattern);
            flushIntervalMs = defaults.value("flush_interval_ms", flushIntervalMs);
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading logging defaults: {}, using built-in defaults", e.what());
    }

    const std::string pattern = buildPattern(basePattern, componentName);
    sharedSinks_.clear();

    try {
        const nlohmann::json sinks = config.value("sinks", nlohmann::json::object());

        const nlohmann::json console = sinks.value("console", nlohmann::json::object());
        if (console.value("enabled", true)) {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            sink->set_level(
                console.contains("level") ? parseLevelString(console.at("level").get<std::string>())
                                          : consoleLevel);
            sharedSinks_.push_back(sink);
        }

        const nlohmann::json file = sinks.value("file", nlohmann::json::object());
        if (file.value("enabled", false)) {
            const std::string path = file.value("path", std::string(kDefaultLogFile));
            const int maxSizeMb = file.value("max_size_mb", 0);
            spdlog::sink_ptr sink;
            if (maxSizeMb > 0) {
                sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path,
                    static_cast<size_t>(maxSizeMb) * 1024 * 1024,
                    static_cast<size_t>(file.value("max_files", 3)));
            }
            else {
                sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    path, file.value("truncate", true));
            }
            sink->set_level(
                file.contains("level") ? parseLevelString(file.at("level").get<std::string>())
                                       : fileLevel);
            sharedSinks_.push_back(sink);
        }
    }
    catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Failed to create log sinks: {}", e.what());
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading logging sinks: {}", e.what());
    }

    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    for (const LogChannel channel : ALL_LOG_CHANNELS) {
        createLogger(toString(channel), sharedSinks_, spdlog::level::info);
    }

    // Apply channel levels from config. Runs under initMutex(), so no setChannelLevel() here.
    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config.at("channels").items()) {
                const auto known = std::find_if(
                    std::begin(ALL_LOG_CHANNELS),
                    std::end(ALL_LOG_CHANNELS),
                    [&channel](LogChannel each) { return channel == toString(each); });
                if (known == std::end(ALL_LOG_CHANNELS)) {
                    spdlog::warn("Unknown log channel '{}' in config", channel);
                    continue;
                }
                spdlog::get(channel)->set_level(parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    // Default logger shares the sinks but omits the channel name.
    const std::string loggerName = componentName.empty() ? "default" : componentName;
    auto defaultLogger =
        std::make_shared<spdlog::logger>(loggerName, sharedSinks_.begin(), sharedSinks_.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    if (flushIntervalMs > 0) {
        spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));
    }
}

} // namespace AgentEvo
