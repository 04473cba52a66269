#pragma once

#include "Errors.h"
#include "ReflectSerializer.h"
#include "Result.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace CarveSim {

/**
 * @brief Carving run parameters.
 *
 * Automatically serializable via ReflectSerializer. Use
 * getDefaultSimulationConfig() for default values; they live in
 * SimulationConfig.cpp to reduce recompilation.
 *
 * Distances are in cells, speeds in cells per frame.
 */
struct SimulationConfig {
    int ball_count;                   // Target live population, [1, 100].
    double deviation_angle_degrees;   // Bounce search half-width, [1, 45].
    double movement_speed_multiplier; // Scales base_speed, [0.1, 5.0].
    int padding;                      // EdgeBoundary rings around the bitmap.
    double base_speed;
    double ball_diameter;
    int max_initial_balls; // Cap for the first spawn wave.
    double max_safe_distance; // Longest unchecked sub-step.
    bool sub_stepping_enabled;
    bool smart_bounce_enabled;
    double ray_max_distance; // Bounce planner look-ahead.
    double bounce_jitter;    // Used by plain reflection when smart bounce is off.
    uint32_t seed;           // 0 picks a nondeterministic seed.
};

SimulationConfig getDefaultSimulationConfig();

/**
 * @brief Check every field against its documented bounds.
 */
Result<std::monostate, ConfigError> validateSimulationConfig(const SimulationConfig& config);

/**
 * @brief Parse JSON over the defaults, then validate. Unknown keys are ignored.
 */
Result<SimulationConfig, ConfigError> parseSimulationConfig(const std::string& jsonText);

/**
 * @brief Load and validate a JSON config file.
 */
Result<SimulationConfig, ConfigError> loadSimulationConfig(const std::string& path);

/**
 * ADL functions for automatic JSON conversion.
 */
inline void to_json(nlohmann::json& j, const SimulationConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, SimulationConfig& config)
{
    config = ReflectSerializer::from_json<SimulationConfig>(j);
}

} // namespace CarveSim
