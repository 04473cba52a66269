#pragma once

#include "Vector2.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace CarveSim {

/**
 * @brief A carving ball. Position is in continuous grid units (cell (i, j)
 * covers [i, i+1) x [j, j+1)); velocity is in cells per frame.
 *
 * Collision tests use the centre point only; `diameter` is for drawing.
 */
class Ball {
public:
    /**
     * @throws BallError on non-finite position or velocity, or non-positive diameter.
     */
    Ball(uint32_t id, const Vector2d& position, const Vector2d& velocity, double diameter);

    uint32_t getId() const { return id_; }

    const Vector2d& getPosition() const { return position_; }
    void setPosition(const Vector2d& position) { position_ = position; }

    const Vector2d& getVelocity() const { return velocity_; }
    void setVelocity(const Vector2d& velocity) { velocity_ = velocity; }

    // Point the velocity along `radians` while keeping the current speed.
    void setDirection(double radians);

    double getSpeed() const { return velocity_.mag(); }
    double getDiameter() const { return diameter_; }

    bool isActive() const { return active_; }
    void deactivate() { active_ = false; }

    // Cell containing the ball centre.
    Vector2i cell() const;

private:
    uint32_t id_;
    Vector2d position_;
    Vector2d velocity_;
    double diameter_;
    bool active_ = true;
};

void to_json(nlohmann::json& j, const Ball& ball);

} // namespace CarveSim
