#include "BouncePlanner.h"
#include "Errors.h"
#include "Grid.h"
#include "LoggingChannels.h"
#include "SimulationConfig.h"

#include <cmath>
#include <limits>

namespace CarveSim {

RayCast BouncePlanner::castRay(
    const Grid& grid, const Vector2d& start, double angle, double maxDistance) const
{
    if (!start.isFinite() || !std::isfinite(angle)) {
        throw RayCastError("castRay: non-finite start or angle");
    }
    if (!(maxDistance > 0.0) || !std::isfinite(maxDistance)) {
        throw RayCastError("castRay: maxDistance must be positive");
    }

    RayCast ray{ start, angle, maxDistance, std::nullopt };

    Vector2i cell = cellOf(start);
    if (!isValidCell(grid, cell.x, cell.y)) {
        return ray;
    }

    const Vector2d dir = Vector2d::fromAngle(angle);
    constexpr double inf = std::numeric_limits<double>::infinity();

    const int stepX = dir.x > 0.0 ? 1 : (dir.x < 0.0 ? -1 : 0);
    const int stepY = dir.y > 0.0 ? 1 : (dir.y < 0.0 ? -1 : 0);

    // Distance along the ray to cross one full cell on each axis.
    const double tDeltaX = stepX != 0 ? std::abs(1.0 / dir.x) : inf;
    const double tDeltaY = stepY != 0 ? std::abs(1.0 / dir.y) : inf;

    // Distance along the ray to the first vertical/horizontal cell boundary.
    double tMaxX = inf;
    if (stepX > 0) tMaxX = (cell.x + 1 - start.x) / dir.x;
    else if (stepX < 0) tMaxX = (start.x - cell.x) / -dir.x;

    double tMaxY = inf;
    if (stepY > 0) tMaxY = (cell.y + 1 - start.y) / dir.y;
    else if (stepY < 0) tMaxY = (start.y - cell.y) / -dir.y;

    while (true) {
        double t;
        SquareEdge entered;
        if (tMaxX < tMaxY) {
            t = tMaxX;
            cell.x += stepX;
            tMaxX += tDeltaX;
            entered = stepX > 0 ? SquareEdge::Left : SquareEdge::Right;
        }
        else {
            t = tMaxY;
            cell.y += stepY;
            tMaxY += tDeltaY;
            entered = stepY > 0 ? SquareEdge::Top : SquareEdge::Bottom;
        }

        if (t > maxDistance || !isValidCell(grid, cell.x, cell.y)) {
            return ray;
        }

        if (!grid.isCollidable(cell.x, cell.y)) {
            continue;
        }

        RayHit hit{ cell, grid.cellUnchecked(cell.x, cell.y).state, start + dir * t, t, entered };

        // Prefer the kernel's classification so corners agree with collisions.
        const Vector2d rayEnd = start + dir * maxDistance;
        auto exact = intersectRaySquare(start, rayEnd, SquareBounds::forCell(cell.x, cell.y));
        if (exact) {
            hit.point = exact->point;
            hit.distance = exact->t * maxDistance;
            hit.edge = exact->edge;
        }

        ray.firstHit = hit;
        return ray;
    }
}

BounceAngle BouncePlanner::findOptimalBounceAngle(
    const Grid& grid,
    const Vector2d& position,
    const Vector2d& velocity,
    const Vector2d& normal,
    const SimulationConfig& config,
    std::mt19937& rng) const
{
    const Vector2d perfect = reflect(velocity, normal);
    const double perfectAngle = perfect.angle();
    const int maxDeviation = static_cast<int>(std::floor(config.deviation_angle_degrees));

    for (int d = 0; d <= maxDeviation; ++d) {
        for (const int sign : { 1, -1 }) {
            if (d == 0 && sign < 0) {
                continue;
            }

            const double deviation = static_cast<double>(sign * d);
            const double candidate = perfectAngle + degreesToRadians(deviation);
            const RayCast ray = castRay(grid, position, candidate, config.ray_max_distance);

            if (ray.firstHit && ray.firstHit->state == CellState::CarveableBackground) {
                LoggingChannels::bounce()->trace(
                    "Optimal bounce at {:+.0f} deg toward ({}, {})",
                    deviation,
                    ray.firstHit->cell.x,
                    ray.firstHit->cell.y);
                return BounceAngle{ candidate, true, deviation, ray.firstHit->cell };
            }
        }
    }

    std::uniform_real_distribution<double> dist(
        -config.deviation_angle_degrees, config.deviation_angle_degrees);
    const double deviation = dist(rng);

    LoggingChannels::bounce()->trace(
        "No carveable target within {} deg, random bounce at {:+.1f} deg",
        config.deviation_angle_degrees,
        deviation);

    const double fallback = perfectAngle + degreesToRadians(deviation);
    return BounceAngle{ fallback, false, deviation, std::nullopt };
}

} // namespace CarveSim
