#pragma once

#include "CellState.h"
#include "PresentationLayer.h"
#include "ReflectSerializer.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

namespace CarveSim {

class Ball;
class Grid;

struct CellView {
    int x;
    int y;
    CellState state;
    OverlayTag overlay;
};

struct BallView {
    uint32_t id;
    double x;
    double y;
    double diameter;
    bool isActive;
};

/**
 * @brief Everything a renderer needs for one frame. Taken at frame end, so
 * cells and balls are mutually consistent.
 */
struct RenderSnapshot {
    int width;
    int height;
    int padding;
    uint32_t frame;
    std::vector<CellView> cells;
    std::vector<BallView> balls;
};

/**
 * @param presentation Optional overlay source; overlays read as None without it.
 */
RenderSnapshot makeRenderSnapshot(
    const Grid& grid,
    const std::vector<Ball>& balls,
    uint32_t frame,
    const PresentationLayer* presentation = nullptr);

inline void to_json(nlohmann::json& j, const CellView& view)
{
    j = ReflectSerializer::to_json(view);
}

inline void to_json(nlohmann::json& j, const BallView& view)
{
    j = ReflectSerializer::to_json(view);
}

inline void to_json(nlohmann::json& j, const RenderSnapshot& snapshot)
{
    j = ReflectSerializer::to_json(snapshot);
}

} // namespace CarveSim
