#pragma once

#include <stdexcept>
#include <string>

namespace CarveSim {

/**
 * \file
 * Error taxonomy for the carving core.
 *
 * Construction-time failures throw one of the exception types below and
 * surface to the caller. Expected runtime failures travel as plain error
 * values inside Result<T, E>.
 */

// Malformed grid input or an illegal cell state transition.
class GridError : public std::runtime_error {
public:
    explicit GridError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid kinematic parameters at ball construction.
class BallError : public std::runtime_error {
public:
    explicit BallError(const std::string& message) : std::runtime_error(message) {}
};

// Out-of-domain input to collision response math.
class CollisionError : public std::runtime_error {
public:
    explicit CollisionError(const std::string& message) : std::runtime_error(message) {}
};

// Out-of-domain input to ray/square routines.
class RayCastError : public std::runtime_error {
public:
    explicit RayCastError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Per-ball runtime fault. The driver deactivates the ball and the
 * frame continues for everyone else.
 */
struct SimFault {
    std::string message;
};

struct ConfigError {
    std::string message;
};

struct BitmapError {
    std::string message;
};

} // namespace CarveSim
