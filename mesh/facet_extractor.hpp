#ifndef WASHIWRAP_MESH_FACET_EXTRACTOR_HPP
#define WASHIWRAP_MESH_FACET_EXTRACTOR_HPP

#include "triangle_mesh.hpp"
#include <unfold/face.hpp>
#include <vector>

namespace washiwrap {

// Tolerances for merging triangles into planar facets
struct FacetConfig {
    // Neighbouring triangles merge when 1 - dot(n_a, n_b) is below this
    double normal_tolerance = 1e-6;

    // Plane offset tolerance relative to the mesh extent
    double plane_tolerance = 1e-6;
};

// Groups coplanar triangles into polygonal faces. Each face is returned as a
// boundary loop without collinear vertices, CCW around its outward normal.
// Throws MalformedMeshError when a facet boundary is not one simple loop.
std::vector<FaceInput> extract_facets(const TriangleMesh& mesh, const FacetConfig& config = FacetConfig{});

}  // namespace washiwrap

#endif // WASHIWRAP_MESH_FACET_EXTRACTOR_HPP
