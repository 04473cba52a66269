#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace CarveSim {

/**
 * @brief 2D vector in grid space. Vector2i addresses cells, Vector2d carries
 * ball positions and velocities in fractional cell units.
 *
 * y grows downward, so a positive angle turns clockwise on screen.
 */
template <typename T>
struct Vector2 {
    T x = T{};
    T y = T{};

    T dot(const Vector2& other) const { return x * other.x + y * other.y; }

    T magnitudeSquared() const { return x * x + y * y; }

    double mag() const { return std::sqrt(static_cast<double>(magnitudeSquared())); }

    std::string toString() const
    {
        return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
    }

    Vector2 operator+(const Vector2& other) const { return { x + other.x, y + other.y }; }
    Vector2 operator-(const Vector2& other) const { return { x - other.x, y - other.y }; }
    Vector2 operator-() const { return { -x, -y }; }
    Vector2 operator*(T scalar) const { return { x * scalar, y * scalar }; }

    Vector2 operator/(T scalar) const
    {
        if (scalar == T{ 0 }) {
            throw std::runtime_error("Vector2::operator/: Division by zero");
        }
        return { x / scalar, y / scalar };
    }

    bool operator==(const Vector2& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vector2& other) const { return !(*this == other); }

    // Floating-point only below.

    template <typename U = T>
    std::enable_if_t<std::is_floating_point_v<U>, bool> isFinite() const
    {
        return std::isfinite(x) && std::isfinite(y);
    }

    // Unit vector, or the zero vector unchanged.
    template <typename U = T>
    std::enable_if_t<std::is_floating_point_v<U>, Vector2> normalize() const
    {
        const T length = static_cast<T>(mag());
        return length > T{ 0 } ? Vector2{ x / length, y / length } : *this;
    }

    // Specular reflection about `normal`, which need not be unit length.
    template <typename U = T>
    std::enable_if_t<std::is_floating_point_v<U>, Vector2> reflect(const Vector2& normal) const
    {
        const Vector2 n = normal.normalize();
        return *this - n * (T{ 2 } * dot(n));
    }

    // Radians from the positive x-axis.
    template <typename U = T>
    std::enable_if_t<std::is_floating_point_v<U>, T> angle() const
    {
        return std::atan2(y, x);
    }

    template <typename U = T>
    static std::enable_if_t<std::is_floating_point_v<U>, Vector2> fromAngle(
        T radians, T magnitude = T{ 1 })
    {
        return { std::cos(radians) * magnitude, std::sin(radians) * magnitude };
    }
};

using Vector2d = Vector2<double>;
using Vector2i = Vector2<int>;

template <typename T>
inline Vector2<T> operator*(T scalar, const Vector2<T>& v)
{
    return v * scalar;
}

template <typename T>
inline void to_json(nlohmann::json& j, const Vector2<T>& v)
{
    j = nlohmann::json{ { "x", v.x }, { "y", v.y } };
}

template <typename T>
inline void from_json(const nlohmann::json& j, Vector2<T>& v)
{
    v.x = j.at("x").template get<T>();
    v.y = j.at("y").template get<T>();
}

} // namespace CarveSim

// Grid coordinates key the overlay map and diagram ball sets.
template <typename T>
struct std::hash<CarveSim::Vector2<T>> {
    std::size_t operator()(const CarveSim::Vector2<T>& v) const noexcept
    {
        const std::size_t h = std::hash<T>{}(v.x);
        return h ^ (std::hash<T>{}(v.y) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};
