#include "CollisionEngine.h"
#include "Ball.h"
#include "Grid.h"
#include "LoggingChannels.h"
#include "SimulationConfig.h"

#include <cmath>

namespace CarveSim {

CollisionAction CollisionEngine::classify(const Grid& grid, int x, int y)
{
    if (!grid.isCollidable(x, y)) {
        return CollisionAction::None;
    }
    return grid.cellUnchecked(x, y).isCarveable() ? CollisionAction::Carve
                                                  : CollisionAction::Bounce;
}

int CollisionEngine::computeSubSteps(const Vector2d& velocity, const SimulationConfig& config)
{
    const double distance = velocity.mag();
    // Non-finite motion takes a single step so advanceBall() reports the fault.
    if (!config.sub_stepping_enabled || !std::isfinite(distance)
        || distance <= config.max_safe_distance) {
        return 1;
    }
    const double steps = std::ceil(distance / config.max_safe_distance);
    return steps > MAX_SUB_STEPS ? MAX_SUB_STEPS + 1 : static_cast<int>(steps);
}

std::optional<CollisionResult> CollisionEngine::predictCollision(
    const Grid& grid, const Vector2d& from, const Vector2d& to) const
{
    const Vector2i current = cellOf(from);

    std::optional<CollisionResult> nearest;
    double nearestT = 0.0;

    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            const int nx = current.x + dx;
            const int ny = current.y + dy;
            if (!grid.isCollidable(nx, ny)) {
                continue;
            }

            const SquareBounds square = SquareBounds::forCell(nx, ny);
            if (square.contains(from)) {
                continue;
            }

            auto hit = intersectRaySquare(from, to, square);
            if (!hit || (nearest && hit->t >= nearestT)) {
                continue;
            }

            const CollisionAction action = classify(grid, nx, ny);
            CollisionResult result;
            result.hasCollision = true;
            result.cell = { nx, ny };
            result.cellState = grid.cellUnchecked(nx, ny).state;
            result.collisionPoint = hit->point;
            result.normal = hit->normal;
            result.edge = hit->edge;
            result.shouldCarve = action == CollisionAction::Carve;
            result.shouldBounce = action != CollisionAction::None;

            nearest = result;
            nearestT = hit->t;
        }
    }

    return nearest;
}

CollisionResult CollisionEngine::fallbackCollision(
    const Grid& grid, const Vector2i& cell, const Vector2d& from, const Vector2d& step) const
{
    // Axis normal opposing the dominant component of motion.
    CollisionResult result;
    result.hasCollision = true;
    result.cell = cell;
    result.cellState = getCellAt(grid, cell.x, cell.y).state;
    result.collisionPoint = from;
    if (std::abs(step.x) >= std::abs(step.y)) {
        result.normal = { step.x > 0.0 ? -1.0 : 1.0, 0.0 };
        result.edge = step.x > 0.0 ? SquareEdge::Left : SquareEdge::Right;
    }
    else {
        result.normal = { 0.0, step.y > 0.0 ? -1.0 : 1.0 };
        result.edge = step.y > 0.0 ? SquareEdge::Top : SquareEdge::Bottom;
    }

    const CollisionAction action = classify(grid, cell.x, cell.y);
    result.shouldCarve = action == CollisionAction::Carve;
    result.shouldBounce = action != CollisionAction::None;
    return result;
}

Result<BallStepOutcome, SimFault> CollisionEngine::advanceBall(
    Ball& ball, Grid& grid, const SimulationConfig& config, std::mt19937& rng) const
{
    using R = Result<BallStepOutcome, SimFault>;

    BallStepOutcome outcome;
    if (!ball.isActive()) {
        outcome.kind = BallStepKind::Inactive;
        return R::okay(outcome);
    }

    try {
        const int subSteps = computeSubSteps(ball.getVelocity(), config);
        if (subSteps > MAX_SUB_STEPS) {
            return R::error(SimFault{ "Ball " + std::to_string(ball.getId()) + " moves "
                                      + std::to_string(ball.getVelocity().mag())
                                      + " cells per frame, too fast to sub-step" });
        }
        const Vector2d step = ball.getVelocity() * (1.0 / subSteps);

        for (int i = 0; i < subSteps; ++i) {
            const Vector2d from = ball.getPosition();
            const Vector2d candidate = from + step;
            if (!candidate.isFinite()) {
                return R::error(SimFault{ "Ball " + std::to_string(ball.getId())
                                          + " produced a non-finite position" });
            }

            outcome.subSteps = i + 1;
            const Vector2i target = cellOf(candidate);

            if (!isValidCell(grid, target.x, target.y)) {
                ball.deactivate();
                outcome.kind = BallStepKind::Exited;
                LoggingChannels::collision()->debug(
                    "Ball {} left the grid at {}", ball.getId(), candidate.toString());
                return R::okay(outcome);
            }

            if (target != cellOf(from) && grid.isCollidable(target.x, target.y)) {
                auto predicted = predictCollision(grid, from, candidate);
                const CollisionResult collision =
                    predicted ? *predicted : fallbackCollision(grid, target, from, step);

                if (!predicted) {
                    LoggingChannels::collision()->debug(
                        "Ball {}: no exact intersection into ({}, {}), using axis normal",
                        ball.getId(),
                        target.x,
                        target.y);
                }

                ball.setPosition(collision.collisionPoint + collision.normal * RESOLVE_EPSILON);

                LoggingChannels::collision()->trace(
                    "Ball {} hit {} cell ({}, {}) on {} edge, sub-step {}/{}",
                    ball.getId(),
                    getCellStateName(collision.cellState),
                    collision.cell.x,
                    collision.cell.y,
                    getSquareEdgeName(collision.edge),
                    i + 1,
                    subSteps);

                outcome.optimalBounce = respond(ball, grid, collision, config, rng);
                outcome.kind = collision.shouldCarve ? BallStepKind::Carved : BallStepKind::Bounced;
                outcome.collision = collision;
                return R::okay(outcome);
            }

            ball.setPosition(candidate);
        }
    }
    catch (const std::exception& e) {
        return R::error(SimFault{ "Ball " + std::to_string(ball.getId()) + ": " + e.what() });
    }

    outcome.kind = BallStepKind::Moved;
    return R::okay(outcome);
}

bool CollisionEngine::respond(
    Ball& ball,
    Grid& grid,
    const CollisionResult& collision,
    const SimulationConfig& config,
    std::mt19937& rng) const
{
    if (collision.shouldCarve) {
        auto carved = grid.trySetState(collision.cell.x, collision.cell.y, CellState::CarvedOpen);
        if (carved.isError()) {
            throw carved.errorValue();
        }
    }

    if (!config.smart_bounce_enabled) {
        ball.setVelocity(reflect(ball.getVelocity(), collision.normal, config.bounce_jitter, rng));
        return false;
    }

    const BounceAngle bounce = planner_.findOptimalBounceAngle(
        grid, ball.getPosition(), ball.getVelocity(), collision.normal, config, rng);
    ball.setDirection(bounce.angle);
    return bounce.isOptimal;
}

} // namespace CarveSim
