#ifndef WASHIWRAP_UNFOLD_OVERLAP_CHECKER_HPP
#define WASHIWRAP_UNFOLD_OVERLAP_CHECKER_HPP

#include "adjacency_graph.hpp"
#include "strip.hpp"
#include <optional>
#include <vector>

namespace washiwrap {

// Interior-overlap test between convex placed polygons.
// Two polygons overlap when they penetrate deeper than epsilon along every
// separating axis; touching along a shared hinge or at a corner does not count.
class OverlapChecker {
public:
    explicit OverlapChecker(double epsilon = 1e-9);

    // Tolerance scaled to the size of the mesh
    static OverlapChecker for_graph(const AdjacencyGraph& graph);

    bool overlaps(const std::vector<PlacedFace>& placed, const Polygon2& candidate) const;

    // Face id of the first placed polygon the candidate overlaps
    std::optional<FaceId> overlapping_face(const std::vector<PlacedFace>& placed,
                                         const Polygon2& candidate) const;

    // Every pair within the strip
    bool strip_is_overlap_free(const Strip& strip) const;

    bool polygons_overlap(const Polygon2& a, const Polygon2& b) const;

    // Smallest projection overlap over all edge normals of a and b,
    // <= 0 when a separating axis exists
    static double penetration_depth(const Polygon2& a, const Polygon2& b);

    double epsilon() const { return epsilon_; }

private:
    double epsilon_;
};

}  // namespace washiwrap

#endif // WASHIWRAP_UNFOLD_OVERLAP_CHECKER_HPP
