#include "Ball.h"
#include "Errors.h"

#include <cmath>
#include <nlohmann/json.hpp>

namespace CarveSim {

Ball::Ball(uint32_t id, const Vector2d& position, const Vector2d& velocity, double diameter)
    : id_(id), position_(position), velocity_(velocity), diameter_(diameter)
{
    if (!position.isFinite()) {
        throw BallError("Ball " + std::to_string(id) + ": non-finite position "
                        + position.toString());
    }
    if (!velocity.isFinite()) {
        throw BallError("Ball " + std::to_string(id) + ": non-finite velocity "
                        + velocity.toString());
    }
    if (!(diameter > 0.0) || !std::isfinite(diameter)) {
        throw BallError("Ball " + std::to_string(id) + ": diameter must be positive, got "
                        + std::to_string(diameter));
    }
}

void Ball::setDirection(double radians)
{
    velocity_ = Vector2d::fromAngle(radians, getSpeed());
}

Vector2i Ball::cell() const
{
    return { static_cast<int>(std::floor(position_.x)), static_cast<int>(std::floor(position_.y)) };
}

void to_json(nlohmann::json& j, const Ball& ball)
{
    j = nlohmann::json{ { "id", ball.getId() },
                        { "x", ball.getPosition().x },
                        { "y", ball.getPosition().y },
                        { "diameter", ball.getDiameter() },
                        { "isActive", ball.isActive() } };
}

} // namespace CarveSim
