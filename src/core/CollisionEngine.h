#pragma once

#include "BouncePlanner.h"
#include "CellState.h"
#include "Errors.h"
#include "Geometry.h"
#include "GridCalculatorBase.h"
#include "Result.h"
#include "Vector2.h"

#include <cstdint>
#include <optional>
#include <random>

namespace CarveSim {

class Ball;
class Grid;
struct SimulationConfig;

enum class CollisionAction : uint8_t {
    None = 0, // Pass through.
    Carve,    // Carve the cell, then bounce.
    Bounce,   // Bounce only.
};

/**
 * @brief Transient description of one predicted impact. Lives for a single
 * sub-step.
 */
struct CollisionResult {
    bool hasCollision = false;
    Vector2i cell;
    CellState cellState = CellState::CarveableBackground;
    Vector2d collisionPoint;
    Vector2d normal;
    SquareEdge edge = SquareEdge::Left;
    bool shouldCarve = false;
    bool shouldBounce = false;
};

enum class BallStepKind : uint8_t {
    Moved = 0, // Travelled the whole frame without contact.
    Carved,    // Hit and carved a background cell.
    Bounced,   // Hit a protected or boundary cell.
    Exited,    // Left the grid; deactivated.
    Inactive,  // Was already inactive; nothing to do.
};

struct BallStepOutcome {
    BallStepKind kind = BallStepKind::Moved;
    int subSteps = 0; // Sub-steps actually executed this frame.
    std::optional<CollisionResult> collision;
    bool optimalBounce = false;
};

/**
 * @brief Per-ball, per-frame motion with tunneling-safe sub-stepping.
 *
 * A frame's displacement longer than max_safe_distance is cut into
 * ceil(distance / max_safe_distance) equal sub-steps. Before each sub-step
 * the candidate cell is checked; if it is collidable the segment to it is
 * cast against the collidable cells around the ball, and the nearest hit is
 * resolved to hit + normal * RESOLVE_EPSILON. The first collision or a grid
 * exit ends the ball's frame.
 */
class CollisionEngine : public GridCalculatorBase {
public:
    CollisionEngine() = default;

    /**
     * @brief What a ball entering (x, y) should do.
     */
    static CollisionAction classify(const Grid& grid, int x, int y);

    static constexpr int MAX_SUB_STEPS = 8192;

    /**
     * @brief Number of sub-steps for a frame displacement of `velocity`.
     * Saturates at MAX_SUB_STEPS + 1, which advanceBall() reports as a fault.
     */
    static int computeSubSteps(const Vector2d& velocity, const SimulationConfig& config);

    /**
     * @brief Nearest impact of the segment `from -> to` against the collidable
     * cells of the 3×3 block around `from`. Cells containing `from` are skipped.
     */
    std::optional<CollisionResult> predictCollision(
        const Grid& grid, const Vector2d& from, const Vector2d& to) const;

    /**
     * @brief Advance one ball by one frame.
     *
     * Geometry and grid failures are returned as SimFault rather than thrown;
     * the caller decides what to do with the ball.
     */
    Result<BallStepOutcome, SimFault> advanceBall(
        Ball& ball, Grid& grid, const SimulationConfig& config, std::mt19937& rng) const;

    const BouncePlanner& getBouncePlanner() const { return planner_; }

private:
    CollisionResult fallbackCollision(
        const Grid& grid, const Vector2i& cell, const Vector2d& from, const Vector2d& step) const;

    // Carve and/or redirect. Returns true when the bounce planner found a target.
    bool respond(
        Ball& ball,
        Grid& grid,
        const CollisionResult& collision,
        const SimulationConfig& config,
        std::mt19937& rng) const;

    BouncePlanner planner_;
};

} // namespace CarveSim
