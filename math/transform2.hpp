#ifndef WASHIWRAP_MATH_TRANSFORM2_HPP
#define WASHIWRAP_MATH_TRANSFORM2_HPP

#include "vec2.hpp"
#include <cmath>

namespace washiwrap {

// Rigid motion of the plane: p' = M * p + t with M orthonormal.
// det(M) = -1 marks a mirrored placement.
struct Transform2 {
    double m00 = 1.0, m01 = 0.0;
    double m10 = 0.0, m11 = 1.0;
    Vec2 translation;

    static Transform2 identity() { return Transform2{}; }

    static Transform2 rotation(double radians) {
        Transform2 t;
        double c = std::cos(radians);
        double s = std::sin(radians);
        t.m00 = c; t.m01 = -s;
        t.m10 = s; t.m11 = c;
        return t;
    }

    static Transform2 translate(const Vec2& offset) {
        Transform2 t;
        t.translation = offset;
        return t;
    }

    // Maps local segment (a0, b0) onto (a1, b1); both must have the same length.
    // With mirror set, the local frame is reflected across the segment first.
    static Transform2 align_segment(const Vec2& a0, const Vec2& b0,
                                    const Vec2& a1, const Vec2& b1,
                                    bool mirror) {
        Vec2 u0 = (b0 - a0).normalized();
        Vec2 u1 = (b1 - a1).normalized();
        Transform2 t;
        if (!mirror) {
            // Rotation taking u0 to u1
            double c = u0.dot(u1);
            double s = u0.cross(u1);
            t.m00 = c; t.m01 = -s;
            t.m10 = s; t.m11 = c;
        } else {
            // Reflection taking u0 to u1: columns map u0 -> u1, perp(u0) -> -perp(u1)
            Vec2 p0 = u0.perp();
            Vec2 p1 = -u1.perp();
            t.m00 = u1.x * u0.x + p1.x * p0.x;
            t.m01 = u1.x * u0.y + p1.x * p0.y;
            t.m10 = u1.y * u0.x + p1.y * p0.x;
            t.m11 = u1.y * u0.y + p1.y * p0.y;
        }
        t.translation = a1 - t.linear(a0);
        return t;
    }

    Vec2 linear(const Vec2& p) const {
        return {m00 * p.x + m01 * p.y, m10 * p.x + m11 * p.y};
    }

    Vec2 apply(const Vec2& p) const {
        return linear(p) + translation;
    }

    // (this * other)(p) == this->apply(other.apply(p))
    Transform2 compose(const Transform2& other) const {
        Transform2 r;
        r.m00 = m00 * other.m00 + m01 * other.m10;
        r.m01 = m00 * other.m01 + m01 * other.m11;
        r.m10 = m10 * other.m00 + m11 * other.m10;
        r.m11 = m10 * other.m01 + m11 * other.m11;
        r.translation = linear(other.translation) + translation;
        return r;
    }

    double determinant() const {
        return m00 * m11 - m01 * m10;
    }

    bool is_mirrored() const {
        return determinant() < 0.0;
    }
};

}  // namespace washiwrap

#endif // WASHIWRAP_MATH_TRANSFORM2_HPP
