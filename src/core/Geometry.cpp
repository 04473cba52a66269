#include "Geometry.h"
#include "Errors.h"

#include <array>
#include <cmath>
#include <numbers>

namespace CarveSim {

static const std::array<const char*, 5> SQUARE_EDGE_NAMES = {
    { "left", "right", "top", "bottom", "corner" }
};

const char* getSquareEdgeName(SquareEdge edge)
{
    const auto index = static_cast<size_t>(edge);
    if (index >= SQUARE_EDGE_NAMES.size()) {
        return "unknown";
    }
    return SQUARE_EDGE_NAMES[index];
}

std::optional<Intersection> intersectRaySquare(
    const Vector2d& rayStart, const Vector2d& rayEnd, const SquareBounds& square)
{
    if (!rayStart.isFinite() || !rayEnd.isFinite()) {
        throw RayCastError(
            "intersectRaySquare: non-finite ray " + rayStart.toString() + " -> "
            + rayEnd.toString());
    }
    if (!std::isfinite(square.x) || !std::isfinite(square.y) || !(square.size > 0.0)) {
        throw RayCastError(
            "intersectRaySquare: invalid square size " + std::to_string(square.size));
    }

    const Vector2d d = rayEnd - rayStart;
    const double tolerance = CORNER_EPSILON * square.size;

    std::optional<Intersection> best;
    auto consider = [&](double t, const Vector2d& point, SquareEdge edge, const Vector2d& normal) {
        if (t < 0.0 || t > 1.0) return;
        if (!best || t < best->t) {
            best = Intersection{ point, t, edge, normal };
        }
    };

    // Vertical edges.
    if (d.x != 0.0) {
        for (const bool isLeft : { true, false }) {
            const double edgeX = isLeft ? square.left() : square.right();
            const double t = (edgeX - rayStart.x) / d.x;
            const double y = rayStart.y + t * d.y;
            if (y >= square.top() - tolerance && y <= square.bottom() + tolerance) {
                consider(
                    t,
                    { edgeX, y },
                    isLeft ? SquareEdge::Left : SquareEdge::Right,
                    { isLeft ? -1.0 : 1.0, 0.0 });
            }
        }
    }

    // Horizontal edges.
    if (d.y != 0.0) {
        for (const bool isTop : { true, false }) {
            const double edgeY = isTop ? square.top() : square.bottom();
            const double t = (edgeY - rayStart.y) / d.y;
            const double x = rayStart.x + t * d.x;
            if (x >= square.left() - tolerance && x <= square.right() + tolerance) {
                consider(
                    t,
                    { x, edgeY },
                    isTop ? SquareEdge::Top : SquareEdge::Bottom,
                    { 0.0, isTop ? -1.0 : 1.0 });
            }
        }
    }

    if (!best) {
        return std::nullopt;
    }

    // Corner hits reflect diagonally away from the centre.
    const Vector2d& p = best->point;
    const bool nearVertical = std::abs(p.x - square.left()) <= tolerance
        || std::abs(p.x - square.right()) <= tolerance;
    const bool nearHorizontal = std::abs(p.y - square.top()) <= tolerance
        || std::abs(p.y - square.bottom()) <= tolerance;
    if (nearVertical && nearHorizontal) {
        best->edge = SquareEdge::Corner;
        best->normal = (p - square.center()).normalize();
    }

    return best;
}

Vector2d reflect(const Vector2d& velocity, const Vector2d& normal, double jitter, std::mt19937& rng)
{
    Vector2d reflected = reflect(velocity, normal);

    if (jitter > 0.0) {
        std::uniform_real_distribution<double> dist(-0.5, 0.5);
        reflected.x += dist(rng) * jitter;
        reflected.y += dist(rng) * jitter;
    }
    return reflected;
}

Vector2d reflect(const Vector2d& velocity, const Vector2d& normal)
{
    if (!velocity.isFinite()) {
        throw CollisionError("reflect: non-finite velocity " + velocity.toString());
    }
    if (!normal.isFinite() || normal.magnitudeSquared() == 0.0) {
        throw CollisionError("reflect: invalid normal " + normal.toString());
    }
    return velocity.reflect(normal);
}

double degreesToRadians(double degrees)
{
    return degrees * std::numbers::pi / 180.0;
}

double radiansToDegrees(double radians)
{
    return radians * 180.0 / std::numbers::pi;
}

} // namespace CarveSim
