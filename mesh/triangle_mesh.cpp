#include "triangle_mesh.hpp"

namespace washiwrap {

double TriangleMesh::extent() const {
    Bounds3 bounds;
    for (const auto& v : vertices) {
        bounds.extend(v);
    }
    return bounds.diagonal();
}

Vec3 TriangleMesh::centroid() const {
    if (vertices.empty()) {
        return vec3::zero();
    }
    Vec3 sum;
    for (const auto& v : vertices) {
        sum += v;
    }
    return sum / static_cast<double>(vertices.size());
}

}  // namespace washiwrap
