#pragma once

#include "CellState.h"
#include "Geometry.h"
#include "GridCalculatorBase.h"
#include "Vector2.h"

#include <optional>
#include <random>

namespace CarveSim {

class Grid;
struct SimulationConfig;

struct RayHit {
    Vector2i cell;
    CellState state = CellState::CarveableBackground;
    Vector2d point;
    double distance = 0.0;
    SquareEdge edge = SquareEdge::Left;
};

struct RayCast {
    Vector2d start;
    double angle = 0.0;
    double maxDistance = 0.0;
    std::optional<RayHit> firstHit;
};

struct BounceAngle {
    double angle = 0.0;           // Radians, grid space.
    bool isOptimal = false;       // True when the ray search found a carveable target.
    double deviationDegrees = 0.0; // Signed offset from the perfect reflection.
    std::optional<Vector2i> target;
};

/**
 * @brief Picks post-collision directions that aim at unfinished work.
 *
 * Starting at the perfect specular reflection, candidate angles fan out in
 * 1° steps (+d before -d) up to the configured deviation. The first one
 * whose ray meets a CarveableBackground cell first wins. If none does, a
 * uniformly random angle inside the deviation window is returned instead.
 */
class BouncePlanner : public GridCalculatorBase {
public:
    BouncePlanner() = default;

    /**
     * @brief Walk the grid along a ray (Amanatides-Woo traversal).
     *
     * The start cell is skipped. Traversal stops at the first collidable
     * cell, on leaving the grid, or past maxDistance.
     *
     * @throws RayCastError on non-finite input or maxDistance <= 0.
     */
    RayCast castRay(const Grid& grid, const Vector2d& start, double angle, double maxDistance)
        const;

    /**
     * @brief Choose the outgoing direction after striking a surface.
     * @param position Ball position after collision resolution.
     * @param velocity Incoming velocity.
     * @param normal Unit surface normal at the hit.
     */
    BounceAngle findOptimalBounceAngle(
        const Grid& grid,
        const Vector2d& position,
        const Vector2d& velocity,
        const Vector2d& normal,
        const SimulationConfig& config,
        std::mt19937& rng) const;
};

} // namespace CarveSim
