#ifndef WASHIWRAP_PIPELINE_WRAP_PIPELINE_HPP
#define WASHIWRAP_PIPELINE_WRAP_PIPELINE_HPP

#include <layout/layout_packer.hpp>
#include <mesh/facet_extractor.hpp>
#include <mesh/mesh_loader.hpp>
#include <mesh/triangle_mesh.hpp>
#include <unfold/adjacency_graph.hpp>
#include <unfold/unfold_pipeline.hpp>
#include <string>
#include <vector>

namespace washiwrap {

// Everything needed to go from a mesh file to a layout
struct WrapConfig {
    // Unit of the mesh coordinates
    MeshUnit unit = MeshUnit::Millimetre;

    // Coplanar triangle merging
    FacetConfig facets;

    // Planner choice, tape width and beam search settings
    UnfoldConfig unfold;

    // Shrink, gap, margin, duplicates and sheet limits
    LayoutConfig layout;

    // Throws std::invalid_argument naming the first offending value
    void validate() const;
};

// Intermediate and final products of one run
struct WrapResult {
    AdjacencyGraph graph;
    UnfoldOutcome unfold;
    Layout layout;
};

// Mesh -> facets -> adjacency graph -> strips -> layout
class WrapPipeline {
public:
    static WrapResult run(const std::vector<FaceInput>& faces, const WrapConfig& config);
    static WrapResult run(const TriangleMesh& mesh, const WrapConfig& config);
    static WrapResult run_file(const std::string& path, const WrapConfig& config);

    // Loads and merges facets without planning (graph dumps)
    static AdjacencyGraph build_graph(const std::string& path, const WrapConfig& config);
};

}  // namespace washiwrap

#endif // WASHIWRAP_PIPELINE_WRAP_PIPELINE_HPP
