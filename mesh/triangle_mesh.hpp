#ifndef WASHIWRAP_MESH_TRIANGLE_MESH_HPP
#define WASHIWRAP_MESH_TRIANGLE_MESH_HPP

#include <math/vec3.hpp>
#include <array>
#include <cstdint>
#include <vector>

namespace washiwrap {

using VertexId = uint32_t;

// Indexed triangle soup as read from disk, coordinates in millimetres
struct TriangleMesh {
    std::vector<Vec3> vertices;
    std::vector<std::array<VertexId, 3>> triangles;

    size_t vertex_count() const { return vertices.size(); }
    size_t triangle_count() const { return triangles.size(); }
    bool empty() const { return triangles.empty(); }

    // Length of the bounding box diagonal (0 for an empty mesh)
    double extent() const;

    Vec3 centroid() const;
};

}  // namespace washiwrap

#endif // WASHIWRAP_MESH_TRIANGLE_MESH_HPP
