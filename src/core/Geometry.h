#pragma once

#include "Vector2.h"

#include <cstdint>
#include <optional>
#include <random>

namespace CarveSim {

/**
 * \file
 * Geometry kernel: segment vs axis-aligned square intersection and
 * specular reflection. Grid space has y growing downward.
 */

enum class SquareEdge : uint8_t { Left = 0, Right, Top, Bottom, Corner };

const char* getSquareEdgeName(SquareEdge edge);

struct SquareBounds {
    double x = 0.0; // Left.
    double y = 0.0; // Top.
    double size = 1.0;

    double left() const { return x; }
    double right() const { return x + size; }
    double top() const { return y; }
    double bottom() const { return y + size; }
    Vector2d center() const { return { x + size * 0.5, y + size * 0.5 }; }

    bool contains(const Vector2d& p) const
    {
        return p.x >= left() && p.x < right() && p.y >= top() && p.y < bottom();
    }

    static SquareBounds forCell(int cellX, int cellY)
    {
        return { static_cast<double>(cellX), static_cast<double>(cellY), 1.0 };
    }
};

struct Intersection {
    Vector2d point;
    double t = 0.0; // Parametric position along the segment, [0, 1].
    SquareEdge edge = SquareEdge::Left;
    Vector2d normal; // Unit, pointing out of the square.
};

// Relative tolerance (times square size) for classifying a hit as a corner.
static constexpr double CORNER_EPSILON = 1e-6;

/**
 * @brief Intersect the segment rayStart -> rayEnd with a square's edges.
 *
 * Keeps the hit with the smallest t in [0, 1]. Hits within CORNER_EPSILON of
 * a corner are tagged Corner and get the normalized centre-to-hit normal.
 * Pure and deterministic.
 *
 * @throws RayCastError on non-finite input or a non-positive square size.
 */
std::optional<Intersection> intersectRaySquare(
    const Vector2d& rayStart, const Vector2d& rayEnd, const SquareBounds& square);

/**
 * @brief Specular reflection v - 2(v.n)n plus uniform jitter.
 *
 * Each component gets an independent draw from [-jitter/2, jitter/2).
 * A jitter of zero never touches the generator.
 *
 * @throws CollisionError on a zero or non-finite normal or velocity.
 */
Vector2d reflect(
    const Vector2d& velocity, const Vector2d& normal, double jitter, std::mt19937& rng);

// Jitter-free reflection.
Vector2d reflect(const Vector2d& velocity, const Vector2d& normal);

double degreesToRadians(double degrees);
double radiansToDegrees(double radians);

} // namespace CarveSim
