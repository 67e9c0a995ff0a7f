#include "LoggingChannels.h"
#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

namespace NixBlitz {

std::atomic<bool> LoggingChannels::initialized_{ false };
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

namespace {

constexpr const char* kBasePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";
constexpr const char* kLogFile = "nixblitz.log";

constexpr std::array<LogChannel, 6> kAllChannels = {
    LogChannel::Install, LogChannel::Network, LogChannel::Process,
    LogChannel::State,   LogChannel::System,  LogChannel::Update,
};

std::mutex& initMutex()
{
    static std::mutex mutex;
    return mutex;
}

std::string trim(const std::string& value)
{
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

} // namespace

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex());
    initializeLocked(consoleLevel, fileLevel, componentName);
}

// Requires initMutex().
void LoggingChannels::initializeLocked(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    if (initialized_.load()) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(consoleLevel);

    // All components log to the same file (component prefix distinguishes them).
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
    file_sink->set_level(fileLevel);

    sharedSinks_ = { console_sink, file_sink };

    const std::string pattern = channelPattern(kBasePattern, componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::info);
    setChannelLevel(LogChannel::Process, spdlog::level::debug);
    setChannelLevel(LogChannel::State, spdlog::level::debug);

    createDefaultLogger(sharedSinks_, componentName);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_.store(true);
    SLOG_INFO("LoggingChannels initialized successfully");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_.load()) {
        std::lock_guard<std::mutex> lock(initMutex());
        if (!initialized_.load()) {
            initializeLocked(spdlog::level::info, spdlog::level::debug, "default");
        }
    }

    auto logger = spdlog::get(toString(channel));
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    // Parse format: "channel:level,channel2:level2"
    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);

        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            for (const auto c : kAllChannels) {
                setChannelLevel(c, level);
            }
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::createChannelLoggers(spdlog::level::level_enum level)
{
    for (const auto channel : kAllChannels) {
        const std::string name = toString(channel);
        spdlog::drop(name);
        auto logger =
            std::make_shared<spdlog::logger>(name, sharedSinks_.begin(), sharedSinks_.end());
        logger->set_level(level);
        spdlog::register_logger(logger);
    }
}

void LoggingChannels::createDefaultLogger(
    const std::vector<spdlog::sink_ptr>& sinks, const std::string& componentName)
{
    // Separate sinks for the default logger so its pattern doesn't affect channel loggers.
    std::vector<spdlog::sink_ptr> defaultSinks;
    for (const auto& sharedSink : sinks) {
        if (dynamic_cast<spdlog::sinks::stdout_color_sink_mt*>(sharedSink.get())) {
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_level(sharedSink->level());
            defaultSinks.push_back(sink);
        }
        else {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, false);
            sink->set_level(sharedSink->level());
            defaultSinks.push_back(sink);
        }
    }

    // Omits channel name to avoid redundancy.
    const std::string defaultPattern = componentName == "default"
        ? "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%^%l%$] [%s:%#] %v";
    for (auto& sink : defaultSinks) {
        sink->set_pattern(defaultPattern);
    }

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    auto default_logger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    default_logger->set_level(spdlog::level::info);

    spdlog::set_default_logger(default_logger);
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

std::string LoggingChannels::channelPattern(
    const std::string& basePattern, const std::string& componentName)
{
    if (componentName == "default") {
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

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex());
    if (initialized_.load()) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    applyConfig(loadConfigFile(configPath), componentName);

    initialized_.store(true);
    return true;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    // Installed appliances keep logs across restarts; development builds start fresh.
#ifdef NIXBLITZ_PRODUCTION_BUILD
    const std::string fileLevel = "info";
    const bool truncate = false;
    const std::string stateLevel = "info";
#else
    const std::string fileLevel = "debug";
    const bool truncate = true;
    const std::string stateLevel = "debug";
#endif

    return nlohmann::json{
        { "defaults",
          { { "console_level", "info" },
            { "file_level", fileLevel },
            { "pattern", kBasePattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", fileLevel },
                { "path", kLogFile },
                { "truncate", truncate },
                { "max_size_mb", 10 },
                { "max_files", 3 } } } } },
        { "channels",
          { { "install", "info" },
            { "network", "info" },
            { "process", "debug" },
            { "state", stateLevel },
            { "system", "info" },
            { "update", "info" } } }
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

    // Try .local version first.
    const std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
        spdlog::info("Using default config: {}", configPath);
    }
    else {
        spdlog::info("Config file not found, creating default: {}", configPath);
        if (!createDefaultConfigFile(configPath)) {
            spdlog::warn("Could not create config file, using built-in defaults");
        }
        return defaultConfig();
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("FATAL: Cannot open config file: {}", pathToUse);
            spdlog::error("Check file permissions or delete the file to regenerate defaults.");
            std::exit(1);
        }

        nlohmann::json config = nlohmann::json::parse(configFile);
        spdlog::info("Loaded logging config from {}", pathToUse);
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("FATAL: Failed to parse config file {}: {}", pathToUse, e.what());
        spdlog::error("Fix the JSON syntax or delete the file to regenerate defaults.");
        std::exit(1);
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    std::string pattern = channelPattern(kBasePattern, componentName);
    int flushIntervalMs = 1000;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            if (defaults.contains("pattern")) {
                pattern = channelPattern(defaults["pattern"].get<std::string>(), componentName);
            }
            flushIntervalMs = defaults.value("flush_interval_ms", 1000);
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading defaults from config: {}, using built-in defaults", e.what());
    }

    std::vector<spdlog::sink_ptr> sinks;

    try {
        const auto& sinksConfig = config.value("sinks", nlohmann::json::object());

        const auto consoleCfg = sinksConfig.value("console", nlohmann::json::object());
        if (consoleCfg.value("enabled", true)) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(parseLevelString(consoleCfg.value("level", "info")));
            sinks.push_back(console_sink);
        }

        const auto fileCfg = sinksConfig.value("file", nlohmann::json::object());
        if (fileCfg.value("enabled", true)) {
            const std::string path = fileCfg.value("path", kLogFile);

            // Use rotating sink if max_size_mb is specified, otherwise basic sink.
            std::shared_ptr<spdlog::sinks::sink> file_sink;
            if (fileCfg.contains("max_size_mb")) {
                const size_t maxSizeMB = fileCfg.value("max_size_mb", 10);
                const size_t maxFiles = fileCfg.value("max_files", 3);
                file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path, maxSizeMB * 1024 * 1024, maxFiles);
            }
            else {
                file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    path, fileCfg.value("truncate", true));
            }

            file_sink->set_level(parseLevelString(fileCfg.value("level", "debug")));
            sinks.push_back(file_sink);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
        file_sink->set_level(spdlog::level::debug);
        sinks = { console_sink, file_sink };
    }

    sharedSinks_ = sinks;
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::trace);

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    createDefaultLogger(sharedSinks_, componentName);

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));

    SLOG_INFO("LoggingChannels initialized from config successfully");
}

} // namespace NixBlitz
