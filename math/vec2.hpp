#ifndef WASHIWRAP_MATH_VEC2_HPP
#define WASHIWRAP_MATH_VEC2_HPP

#include <cmath>

namespace washiwrap {

// Point or direction in the unfolding plane (mm)
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

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

    // z component of the 3D cross product; > 0 when other is counter-clockwise
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    // Rotated +90 degrees
    constexpr Vec2 perp() const {
        return {-y, x};
    }

    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    Vec2 normalized() const {
        double len = length();
        if (len > 0.0) {
            return *this / len;
        }
        return {0.0, 0.0};
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

// Signed area of the triangle (a, b, c) times two; > 0 for a left turn
constexpr double orient(const Vec2& a, const Vec2& b, const Vec2& c) {
    return (b - a).cross(c - a);
}

}  // namespace washiwrap

#endif // WASHIWRAP_MATH_VEC2_HPP
