#pragma once

#include <array>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace CarveSim {

/**
 * @brief Named spdlog loggers, one per carving subsystem.
 *
 * Every channel writes to the same sinks; levels are set per channel so
 * per-ball collision chatter can be turned up without drowning in island
 * or driver output. Before initialization (unit tests) every accessor
 * returns spdlog's default logger.
 */
class LoggingChannels {
public:
    enum class Channel { Grid = 0, Collision, Bounce, Island, Sim, Cli };

    static constexpr size_t CHANNEL_COUNT = 6;

    static const char* channelName(Channel channel);

    /**
     * @brief Console plus truncating carve-sim.log sinks, no config file.
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug);

    /**
     * @brief Initialize from JSON. `<configPath>.local` wins over `configPath`;
     * a missing file is created with defaults; a malformed one is reported
     * and the built-in defaults are used.
     * @return false if logging was already initialized.
     */
    static bool initializeFromConfig(const std::string& configPath = "logging-config.json");

    static std::shared_ptr<spdlog::logger> get(Channel channel);
    static std::shared_ptr<spdlog::logger> get(const std::string& channel);

    /**
     * @brief Apply "channel:level" overrides, comma separated. "*" names
     * every channel. Example: "*:off,island:debug".
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    // Unknown names log a warning and map to info.
    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    // Built-in configuration, written out when no config file exists.
    static nlohmann::json defaultConfig();

    static std::shared_ptr<spdlog::logger> grid() { return get(Channel::Grid); }
    static std::shared_ptr<spdlog::logger> collision() { return get(Channel::Collision); }
    static std::shared_ptr<spdlog::logger> bounce() { return get(Channel::Bounce); }
    static std::shared_ptr<spdlog::logger> island() { return get(Channel::Island); }
    static std::shared_ptr<spdlog::logger> sim() { return get(Channel::Sim); }
    static std::shared_ptr<spdlog::logger> cli() { return get(Channel::Cli); }

private:
    static void registerChannels(const std::vector<spdlog::sink_ptr>& sinks);
    static nlohmann::json loadConfigFile(const std::string& configPath);
    static void applyConfig(const nlohmann::json& config);

    static bool initialized_;
};

} // namespace CarveSim
