#include "overlap_checker.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace washiwrap {

namespace {

void project(const Polygon2& poly, const Vec2& axis, double& lo, double& hi) {
    lo = std::numeric_limits<double>::infinity();
    hi = -std::numeric_limits<double>::infinity();
    for (const auto& p : poly) {
        double d = axis.dot(p);
        lo = std::min(lo, d);
        hi = std::max(hi, d);
    }
}

// Updates depth with the overlap along each edge normal of `edges_of`
void accumulate_axes(const Polygon2& edges_of, const Polygon2& a, const Polygon2& b, double& depth) {
    for (size_t i = 0; i < edges_of.size() && depth > 0.0; ++i) {
        Vec2 d = edges_of[(i + 1) % edges_of.size()] - edges_of[i];
        Vec2 axis = d.perp().normalized();
        if (axis.length_squared() == 0.0) continue;

        double a_lo, a_hi, b_lo, b_hi;
        project(a, axis, a_lo, a_hi);
        project(b, axis, b_lo, b_hi);
        depth = std::min(depth, std::min(a_hi, b_hi) - std::max(a_lo, b_lo));
    }
}

}  // namespace

OverlapChecker::OverlapChecker(double epsilon) : epsilon_(epsilon) {}

OverlapChecker OverlapChecker::for_graph(const AdjacencyGraph& graph) {
    return OverlapChecker(std::max(1e-9, 1e-6 * graph.scale()));
}

double OverlapChecker::penetration_depth(const Polygon2& a, const Polygon2& b) {
    if (a.size() < 3 || b.size() < 3) {
        return 0.0;
    }
    double depth = std::numeric_limits<double>::infinity();
    accumulate_axes(a, a, b, depth);
    accumulate_axes(b, a, b, depth);
    return depth;
}

bool OverlapChecker::polygons_overlap(const Polygon2& a, const Polygon2& b) const {
    Bounds2 ba = polygon_bounds(a);
    Bounds2 bb = polygon_bounds(b);
    if (ba.max_x <= bb.min_x + epsilon_ || bb.max_x <= ba.min_x + epsilon_ ||
        ba.max_y <= bb.min_y + epsilon_ || bb.max_y <= ba.min_y + epsilon_) {
        return false;
    }
    return penetration_depth(a, b) > epsilon_;
}

std::optional<FaceId> OverlapChecker::overlapping_face(const std::vector<PlacedFace>& placed,
                                                     const Polygon2& candidate) const {
    for (const auto& f : placed) {
        if (polygons_overlap(f.polygon, candidate)) {
            return f.face_id;
        }
    }
    return std::nullopt;
}

bool OverlapChecker::overlaps(const std::vector<PlacedFace>& placed, const Polygon2& candidate) const {
    return overlapping_face(placed, candidate).has_value();
}

bool OverlapChecker::strip_is_overlap_free(const Strip& strip) const {
    const auto& faces = strip.faces();
    for (size_t i = 0; i < faces.size(); ++i) {
        for (size_t j = i + 1; j < faces.size(); ++j) {
            if (polygons_overlap(faces[i].polygon, faces[j].polygon)) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace washiwrap
