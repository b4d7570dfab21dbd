#ifndef WASHIWRAP_UNFOLD_ADJACENCY_GRAPH_HPP
#define WASHIWRAP_UNFOLD_ADJACENCY_GRAPH_HPP

#include "face.hpp"
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace washiwrap {

// Dual graph of a closed polyhedral shell.
// Faces are nodes indexed by FaceId, shared edges are AdjacencyEdges indexed
// by AdjacencyId. Both are plain tables; nothing holds pointers into them.
class AdjacencyGraph {
public:
    AdjacencyGraph() = default;

    // Derive faces and shared edges from loader output.
    // Throws MalformedMeshError when an edge is not bordered by exactly two
    // faces, a face is degenerate, or two faces share more than one edge.
    static AdjacencyGraph from_faces(const std::vector<FaceInput>& inputs);

    // Face management
    FaceId add_face(const FaceInput& input);
    const Face& face(FaceId id) const;
    size_t face_count() const { return faces_.size(); }
    const std::vector<Face>& faces() const { return faces_; }

    // Edge management
    AdjacencyId add_edge(FaceId a, FaceId b, const Vec3& p0, const Vec3& p1);
    const AdjacencyEdge& edge(AdjacencyId id) const;
    size_t edge_count() const { return edges_.size(); }
    const std::vector<AdjacencyEdge>& edges() const { return edges_; }

    // Topology queries
    const std::vector<AdjacencyId>& edges_for_face(FaceId id) const;
    std::vector<FaceId> neighbors(FaceId id) const;
    size_t degree(FaceId id) const { return edges_for_face(id).size(); }
    std::optional<AdjacencyId> edge_between(FaceId a, FaceId b) const;
    bool is_connected() const;

    // Size of the mesh, used to scale tolerances
    double scale() const;
    double mean_edge_length() const;

private:
    std::vector<Face> faces_;
    std::vector<AdjacencyEdge> edges_;

    // face id -> incident edge ids
    std::vector<std::vector<AdjacencyId>> face_edges_;

    // (min face, max face) -> edge id
    std::map<std::pair<FaceId, FaceId>, AdjacencyId> pair_to_edge_;
};

}  // namespace washiwrap

#endif // WASHIWRAP_UNFOLD_ADJACENCY_GRAPH_HPP
