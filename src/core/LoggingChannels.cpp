#include "LoggingChannels.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sstream>

namespace CarveSim {

namespace {

constexpr const char* DEFAULT_PATTERN = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
constexpr const char* DEFAULT_LOG_FILE = "carve-sim.log";
constexpr int DEFAULT_FLUSH_MS = 1000;

struct ChannelInfo {
    const char* name;
    spdlog::level::level_enum registerLevel;
};

// Core channels register wide open and are narrowed by config. Host
// channels stay at info unless asked.
constexpr std::array<ChannelInfo, LoggingChannels::CHANNEL_COUNT> CHANNELS = { {
    { "grid", spdlog::level::trace },
    { "collision", spdlog::level::trace },
    { "bounce", spdlog::level::trace },
    { "island", spdlog::level::trace },
    { "sim", spdlog::level::info },
    { "cli", spdlog::level::info },
} };

std::string trimmed(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

spdlog::sink_ptr makeConsoleSink(spdlog::level::level_enum level)
{
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_level(level);
    return sink;
}

// Rotating when max_size_mb is present, otherwise a plain (optionally truncated) file.
spdlog::sink_ptr makeFileSink(const nlohmann::json& fileCfg)
{
    const std::string path = fileCfg.value("path", DEFAULT_LOG_FILE);

    spdlog::sink_ptr sink;
    if (fileCfg.contains("max_size_mb")) {
        const size_t maxBytes = fileCfg.value("max_size_mb", size_t{ 100 }) * 1024 * 1024;
        const size_t maxFiles = fileCfg.value("max_files", size_t{ 3 });
        sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, maxBytes, maxFiles);
    }
    else {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            path, fileCfg.value("truncate", true));
    }
    sink->set_level(LoggingChannels::parseLevelString(fileCfg.value("level", "debug")));
    return sink;
}

void installDefaultLogger(
    const std::vector<spdlog::sink_ptr>& sinks, const std::string& pattern, int flushMs)
{
    auto logger = std::make_shared<spdlog::logger>("default", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);

    // Pattern last so every registered channel picks it up.
    spdlog::set_pattern(pattern);
    spdlog::flush_every(std::chrono::milliseconds(flushMs));
}

} // namespace

bool LoggingChannels::initialized_ = false;

const char* LoggingChannels::channelName(Channel channel)
{
    const auto index = static_cast<size_t>(channel);
    return index < CHANNELS.size() ? CHANNELS[index].name : "default";
}

void LoggingChannels::registerChannels(const std::vector<spdlog::sink_ptr>& sinks)
{
    for (const auto& channel : CHANNELS) {
        auto logger = std::make_shared<spdlog::logger>(channel.name, sinks.begin(), sinks.end());
        logger->set_level(channel.registerLevel);
        spdlog::register_logger(logger);
    }
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel, spdlog::level::level_enum fileLevel)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(DEFAULT_LOG_FILE, true);
    fileSink->set_level(fileLevel);
    const std::vector<spdlog::sink_ptr> sinks = { makeConsoleSink(consoleLevel), fileSink };

    registerChannels(sinks);
    installDefaultLogger(sinks, DEFAULT_PATTERN, DEFAULT_FLUSH_MS);

    initialized_ = true;
    spdlog::info("LoggingChannels initialized");
}

bool LoggingChannels::initializeFromConfig(const std::string& configPath)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    applyConfig(loadConfigFile(configPath));
    initialized_ = true;
    return true;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(Channel channel)
{
    return get(std::string(channelName(channel)));
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(const std::string& channel)
{
    auto logger = spdlog::get(channel);
    return logger ? logger : spdlog::default_logger();
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trimmed(item);
        if (item.empty()) {
            continue;
        }

        const size_t colon = item.find(':');
        if (colon == std::string::npos) {
            spdlog::warn("Invalid channel override (missing colon): {}", item);
            continue;
        }

        const std::string channel = trimmed(item.substr(0, colon));
        const auto level = parseLevelString(trimmed(item.substr(colon + 1)));

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Channel '{}' not found, cannot set level", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Channel '{}' set to {}", channel, spdlog::level::to_string_view(level));
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;

    // from_str() maps anything it does not know to off; treat that as a typo.
    const auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
    return level;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    nlohmann::json channels = nlohmann::json::object();
    for (const auto& channel : CHANNELS) {
        channels[channel.name] = "info";
    }

    return {
        { "defaults",
          { { "pattern", DEFAULT_PATTERN }, { "flush_interval_ms", DEFAULT_FLUSH_MS } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", DEFAULT_LOG_FILE },
                { "truncate", true } } } } },
        { "channels", channels },
    };
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    const std::string localPath = configPath + ".local";
    std::string path;

    if (fs::exists(localPath)) {
        path = localPath;
        spdlog::info("Using local logging config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        path = configPath;
    }
    else {
        std::ofstream out(configPath);
        if (out.is_open()) {
            out << defaultConfig().dump(2) << std::endl;
            spdlog::info("Created default logging config: {}", configPath);
        }
        else {
            spdlog::warn("Could not create {}, using built-in logging defaults", configPath);
        }
        return defaultConfig();
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        spdlog::error("Cannot open logging config {}, using built-in defaults", path);
        return defaultConfig();
    }

    try {
        return nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse logging config {}: {} (using defaults)", path, e.what());
        return defaultConfig();
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config)
{
    std::string pattern = DEFAULT_PATTERN;
    int flushMs = DEFAULT_FLUSH_MS;
    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            pattern = defaults.value("pattern", pattern);
            flushMs = defaults.value("flush_interval_ms", flushMs);
        }

        const auto sinksCfg = config.value("sinks", nlohmann::json::object());
        if (sinksCfg.contains("console") && sinksCfg["console"].value("enabled", true)) {
            sinks.push_back(
                makeConsoleSink(parseLevelString(sinksCfg["console"].value("level", "info"))));
        }
        if (sinksCfg.contains("file") && sinksCfg["file"].value("enabled", true)) {
            sinks.push_back(makeFileSink(sinksCfg["file"]));
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Bad logging config: {}, falling back to console only", e.what());
        pattern = DEFAULT_PATTERN;
        flushMs = DEFAULT_FLUSH_MS;
        sinks.clear();
    }

    if (sinks.empty()) {
        sinks.push_back(makeConsoleSink(spdlog::level::info));
    }

    registerChannels(sinks);

    try {
        const auto levels = config.value("channels", nlohmann::json::object());
        for (const auto& [channel, level] : levels.items()) {
            setChannelLevel(channel, parseLevelString(level.get<std::string>()));
        }
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::warn("Bad channel levels in logging config: {}", e.what());
    }

    installDefaultLogger(sinks, pattern, flushMs);
    spdlog::info("LoggingChannels initialized from config");
}

} // namespace CarveSim
