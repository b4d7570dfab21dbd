#ifndef WASHIWRAP_MATH_VEC3_HPP
#define WASHIWRAP_MATH_VEC3_HPP

#include <algorithm>
#include <cmath>
#include <vector>

namespace washiwrap {

// Point or direction in mesh space (mm). Double precision keeps hinge
// endpoints coincident after long chains of unfoldings.
struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(double scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3 operator-() const {
        return {-x, -y, -z};
    }

    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr Vec3& operator*=(double scalar) {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }

    constexpr Vec3& operator/=(double scalar) {
        x /= scalar; y /= scalar; z /= scalar;
        return *this;
    }

    constexpr double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    constexpr Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    constexpr double length_squared() const {
        return x * x + y * y + z * z;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    // Zero vector stays zero
    Vec3 normalized() const {
        double len = length();
        if (len > 0.0) {
            return *this / len;
        }
        return {};
    }

    double distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

constexpr Vec3 operator*(double scalar, const Vec3& v) {
    return v * scalar;
}

// Angle between two vectors in radians, 0 for degenerate input
inline double angle_between(const Vec3& a, const Vec3& b) {
    double denom = a.length() * b.length();
    if (denom <= 0.0) {
        return 0.0;
    }
    return std::acos(std::clamp(a.dot(b) / denom, -1.0, 1.0));
}

// Newell's method: twice the vector area of a closed loop. Its direction is
// the loop normal for any planar polygon, convex or not.
inline Vec3 newell_normal(const std::vector<Vec3>& loop) {
    Vec3 n;
    for (size_t i = 0; i < loop.size(); ++i) {
        const Vec3& a = loop[i];
        const Vec3& b = loop[(i + 1) % loop.size()];
        n.x += (a.y - b.y) * (a.z + b.z);
        n.y += (a.z - b.z) * (a.x + b.x);
        n.z += (a.x - b.x) * (a.y + b.y);
    }
    return n;
}

// Axis-aligned box grown point by point
struct Bounds3 {
    Vec3 lo;
    Vec3 hi;
    bool empty = true;

    void extend(const Vec3& p) {
        if (empty) {
            lo = hi = p;
            empty = false;
            return;
        }
        lo = {std::min(lo.x, p.x), std::min(lo.y, p.y), std::min(lo.z, p.z)};
        hi = {std::max(hi.x, p.x), std::max(hi.y, p.y), std::max(hi.z, p.z)};
    }

    // Length of the diagonal, 0 when empty
    double diagonal() const {
        return empty ? 0.0 : lo.distance_to(hi);
    }
};

namespace vec3 {
    constexpr Vec3 zero() { return {0.0, 0.0, 0.0}; }
    constexpr Vec3 unit_x() { return {1.0, 0.0, 0.0}; }
    constexpr Vec3 unit_y() { return {0.0, 1.0, 0.0}; }
    constexpr Vec3 unit_z() { return {0.0, 0.0, 1.0}; }
}

}  // namespace washiwrap

#endif // WASHIWRAP_MATH_VEC3_HPP
