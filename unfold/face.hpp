#ifndef WASHIWRAP_UNFOLD_FACE_HPP
#define WASHIWRAP_UNFOLD_FACE_HPP

#include <math/vec3.hpp>
#include <math/vec2.hpp>
#include <geometry/polygon2.hpp>
#include <cstdint>
#include <numbers>
#include <vector>

namespace washiwrap {

using FaceId = uint32_t;
using AdjacencyId = uint32_t;

constexpr FaceId kNoFace = static_cast<FaceId>(-1);
constexpr AdjacencyId kNoAdjacency = static_cast<AdjacencyId>(-1);

// One planar convex face as handed over by the mesh loader
struct FaceInput {
    std::vector<Vec3> points;   // Ordered boundary loop
    Vec3 normal;                // Outward normal; recomputed when zero
};

// A node of the adjacency graph.
// The local frame is isometric to the face plane: p = origin + x*axis_u + y*axis_v,
// with axis_v = normal x axis_u, so `local` is seen from outside the solid.
struct Face {
    FaceId id = 0;
    std::vector<Vec3> vertices;   // CCW around the outward normal
    Vec3 normal;

    Vec3 origin;
    Vec3 axis_u;
    Vec3 axis_v;
    Polygon2 local;               // vertices in the local frame, CCW
    double area = 0.0;

    Vec2 to_local(const Vec3& p) const {
        Vec3 d = p - origin;
        return {d.dot(axis_u), d.dot(axis_v)};
    }
};

// Undirected relation between two faces sharing one boundary segment
struct AdjacencyEdge {
    AdjacencyId id = 0;
    FaceId face_a = 0;
    FaceId face_b = 0;
    Vec3 p0;                      // Shared segment endpoints
    Vec3 p1;
    double dihedral_angle = 0.0;  // Interior angle between the faces, radians

    bool touches(FaceId f) const { return face_a == f || face_b == f; }
    FaceId other(FaceId f) const { return f == face_a ? face_b : face_a; }
    double length() const { return p0.distance_to(p1); }
    // Rotation that lays the two faces flat
    double fold_angle() const { return std::numbers::pi - dihedral_angle; }
};

}  // namespace washiwrap

#endif // WASHIWRAP_UNFOLD_FACE_HPP
