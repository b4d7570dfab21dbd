#ifndef WASHIWRAP_UNFOLD_UNFOLD_TRANSFORM_HPP
#define WASHIWRAP_UNFOLD_UNFOLD_TRANSFORM_HPP

#include "adjacency_graph.hpp"
#include "strip.hpp"

namespace washiwrap {

// Shared edges shorter than this (mm) cannot act as hinges
constexpr double kDegenerateEdgeLength = 1e-9;

// Hinge placement of faces into the strip plane
class UnfoldTransform {
public:
    // First face of a strip: its own local frame becomes the strip frame
    static PlacedFace place_root(const Face& face);

    // Lay `next` flat against `prev` across `edge`.
    // The shared endpoints land exactly on their images in `prev`, and of the
    // two mirror placements the one on the far side of the hinge from `prev`
    // is taken. Throws DegenerateEdgeError for a zero-length hinge or one whose
    // endpoints are not corners of both faces, std::invalid_argument when
    // `edge` does not join the two faces.
    static PlacedFace unfold(const Face& prev_face,
                             const PlacedFace& prev,
                             const Face& next,
                             const AdjacencyEdge& edge);

    static PlacedFace unfold(const AdjacencyGraph& graph,
                             const PlacedFace& prev,
                             AdjacencyId edge_id);
};

}  // namespace washiwrap

#endif // WASHIWRAP_UNFOLD_UNFOLD_TRANSFORM_HPP
