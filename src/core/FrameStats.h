#pragma once

#include "ReflectSerializer.h"

#include <cstdint>
#include <nlohmann/json.hpp>

namespace CarveSim {

/**
 * @brief Aggregate counters for one advanced frame.
 */
struct FrameStats {
    uint32_t frame = 0;
    uint32_t ballsUpdated = 0; // Active balls stepped this frame.
    uint32_t ballsCarved = 0;
    uint32_t ballsBounced = 0; // Bounces without a carve.
    uint32_t ballsFaulted = 0;
    uint32_t ballsExited = 0;
    uint32_t ballsStranded = 0; // Retired from inside an island.
    uint32_t ballsSpawned = 0;
    uint32_t activeBalls = 0; // After culling and top-up.
    uint32_t carveableRemaining = 0;
    uint32_t islandsCompleted = 0; // Completed during this frame.
};

inline void to_json(nlohmann::json& j, const FrameStats& stats)
{
    j = ReflectSerializer::to_json(stats);
}

} // namespace CarveSim
