#include "SimulationConfig.h"

#include <cmath>
#include <fstream>
#include <sstream>

namespace CarveSim {

/**
 * @brief Get default simulation config.
 *
 * Kept in a .cpp file so tuning defaults does not rebuild every includer.
 */
SimulationConfig getDefaultSimulationConfig()
{
    return SimulationConfig{ .ball_count = 30,
                             .deviation_angle_degrees = 15.0,
                             .movement_speed_multiplier = 1.0,
                             .padding = 3,
                             .base_speed = 0.5,
                             .ball_diameter = 0.5,
                             .max_initial_balls = 50,
                             .max_safe_distance = 0.5,
                             .sub_stepping_enabled = true,
                             .smart_bounce_enabled = true,
                             .ray_max_distance = 25.0,
                             .bounce_jitter = 0.025,
                             .seed = 0 };
}

namespace {

// Fastest ball is MAX_BASE_SPEED * 5 cells per frame; at MIN_SAFE_DISTANCE
// that stays below CollisionEngine::MAX_SUB_STEPS.
constexpr double MAX_BASE_SPEED = 10.0;
constexpr double MIN_SAFE_DISTANCE = 0.01;

ConfigError outOfRange(const std::string& field, double value, double lo, double hi)
{
    std::ostringstream msg;
    msg << field << " must be in [" << lo << ", " << hi << "], got " << value;
    return ConfigError{ msg.str() };
}

ConfigError notPositive(const std::string& field, double value)
{
    std::ostringstream msg;
    msg << field << " must be positive, got " << value;
    return ConfigError{ msg.str() };
}

} // namespace

Result<std::monostate, ConfigError> validateSimulationConfig(const SimulationConfig& config)
{
    using R = Result<std::monostate, ConfigError>;

    if (config.ball_count < 1 || config.ball_count > 100) {
        return R::error(outOfRange("ball_count", config.ball_count, 1, 100));
    }
    if (!(config.deviation_angle_degrees >= 1.0 && config.deviation_angle_degrees <= 45.0)) {
        return R::error(
            outOfRange("deviation_angle_degrees", config.deviation_angle_degrees, 1, 45));
    }
    if (!(config.movement_speed_multiplier >= 0.1 && config.movement_speed_multiplier <= 5.0)) {
        return R::error(
            outOfRange("movement_speed_multiplier", config.movement_speed_multiplier, 0.1, 5.0));
    }
    if (config.padding < 0) {
        return R::error(ConfigError{ "padding must be non-negative" });
    }
    if (!(config.base_speed > 0.0 && config.base_speed <= MAX_BASE_SPEED)) {
        return R::error(outOfRange("base_speed", config.base_speed, 0, MAX_BASE_SPEED));
    }
    if (!(config.ball_diameter > 0.0) || !std::isfinite(config.ball_diameter)) {
        return R::error(notPositive("ball_diameter", config.ball_diameter));
    }
    if (config.max_initial_balls < 1) {
        return R::error(notPositive("max_initial_balls", config.max_initial_balls));
    }
    if (!(config.max_safe_distance >= MIN_SAFE_DISTANCE && config.max_safe_distance <= 0.5)) {
        return R::error(
            outOfRange("max_safe_distance", config.max_safe_distance, MIN_SAFE_DISTANCE, 0.5));
    }
    if (!(config.ray_max_distance > 0.0) || !std::isfinite(config.ray_max_distance)) {
        return R::error(notPositive("ray_max_distance", config.ray_max_distance));
    }
    if (!(config.bounce_jitter >= 0.0)) {
        return R::error(ConfigError{ "bounce_jitter must be non-negative" });
    }

    return R::okay();
}

Result<SimulationConfig, ConfigError> parseSimulationConfig(const std::string& jsonText)
{
    using R = Result<SimulationConfig, ConfigError>;

    SimulationConfig config = getDefaultSimulationConfig();
    try {
        auto j = nlohmann::json::parse(jsonText);
        if (!j.is_object()) {
            return R::error(ConfigError{ "Config JSON must be an object" });
        }
        config = ReflectSerializer::merge_json(getDefaultSimulationConfig(), j);
    }
    catch (const nlohmann::json::exception& e) {
        return R::error(ConfigError{ std::string("Invalid config JSON: ") + e.what() });
    }

    auto valid = validateSimulationConfig(config);
    if (valid.isError()) {
        return R::error(valid.errorValue());
    }
    return R::okay(config);
}

Result<SimulationConfig, ConfigError> loadSimulationConfig(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<SimulationConfig, ConfigError>::error(
            ConfigError{ "Cannot open config file: " + path });
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseSimulationConfig(buffer.str());
}

} // namespace CarveSim
