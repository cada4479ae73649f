#ifndef SECTIONPATH_MATH_VEC2_HPP
#define SECTIONPATH_MATH_VEC2_HPP

#include "angles.hpp"
#include <cmath>
#include <cstddef>

namespace sectionpath {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    // Arithmetic operators
    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator/(double scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr Vec2 operator-() const {
        return {-x, -y};
    }

    constexpr Vec2& operator+=(const Vec2& other) {
        x += other.x; y += other.y;
        return *this;
    }

    constexpr Vec2& operator-=(const Vec2& other) {
        x -= other.x; y -= other.y;
        return *this;
    }

    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // z component of the 3D cross product
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Counter-clockwise rotation about the origin
    Vec2 rotated(double angle_deg) const {
        double a = deg_to_rad(angle_deg);
        double c = std::cos(a);
        double s = std::sin(a);
        return {x * c - y * s, x * s + y * c};
    }

    Vec2 rotated_about(const Vec2& origin, double angle_deg) const {
        return origin + (*this - origin).rotated(angle_deg);
    }

    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }

    bool approx_equal(const Vec2& other, double tolerance = 1e-9) const {
        return std::abs(x - other.x) <= tolerance && std::abs(y - other.y) <= tolerance;
    }
};

// Points and displacements share the representation
using Point2D = Vec2;

constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

// Unit vector pointing along angle_deg, counter-clockwise from +x
inline Vec2 direction(double angle_deg) {
    double a = deg_to_rad(angle_deg);
    return {std::cos(a), std::sin(a)};
}

}  // namespace sectionpath

#endif // SECTIONPATH_MATH_VEC2_HPP
