#include "unfold_transform.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace washiwrap {

namespace {

double distance_to_nearest_vertex(const Face& face, const Vec3& p) {
    double best = std::numeric_limits<double>::infinity();
    for (const auto& v : face.vertices) {
        best = std::min(best, v.distance_to(p));
    }
    return best;
}

}  // namespace

PlacedFace UnfoldTransform::place_root(const Face& face) {
    PlacedFace placed;
    placed.face_id = face.id;
    placed.transform = Transform2::identity();
    placed.polygon = face.local;
    return placed;
}

PlacedFace UnfoldTransform::unfold(const Face& prev_face,
                                   const PlacedFace& prev,
                                   const Face& next,
                                   const AdjacencyEdge& edge) {
    if (prev.face_id != prev_face.id) {
        throw std::invalid_argument("UnfoldTransform::unfold: placed face does not match its face");
    }
    if (!edge.touches(prev_face.id) || edge.other(prev_face.id) != next.id) {
        throw std::invalid_argument("UnfoldTransform::unfold: edge " + std::to_string(edge.id) +
                                    " does not join faces " + std::to_string(prev_face.id) +
                                    " and " + std::to_string(next.id));
    }

    double length = edge.length();
    if (length <= kDegenerateEdgeLength) {
        throw DegenerateEdgeError(prev_face.id, next.id, "shared edge has zero length");
    }

    double tolerance = std::max(1e-6, 1e-4 * length);
    for (const Face* f : {&prev_face, &next}) {
        if (distance_to_nearest_vertex(*f, edge.p0) > tolerance ||
            distance_to_nearest_vertex(*f, edge.p1) > tolerance) {
            throw DegenerateEdgeError(prev_face.id, next.id,
                                      "edge endpoints are not corners of face " + std::to_string(f->id));
        }
    }

    // Hinge in strip coordinates and in the new face's own frame
    Vec2 hinge_a = prev.transform.apply(prev_face.to_local(edge.p0));
    Vec2 hinge_b = prev.transform.apply(prev_face.to_local(edge.p1));
    Vec2 local_a = next.to_local(edge.p0);
    Vec2 local_b = next.to_local(edge.p1);

    Transform2 t = Transform2::align_segment(local_a, local_b, hinge_a, hinge_b, false);
    Polygon2 polygon = transform_polygon(next.local, t);

    double prev_side = orient(hinge_a, hinge_b, polygon_centroid(prev.polygon));
    double next_side = orient(hinge_a, hinge_b, polygon_centroid(polygon));
    if (prev_side * next_side > 0.0) {
        // Inconsistent winding in the input; take the mirror image instead
        auto log = washiwrap::logging::get_logger();
        log->debug("Face {} lands on the same side as face {}, mirroring", next.id, prev_face.id);
        t = Transform2::align_segment(local_a, local_b, hinge_a, hinge_b, true);
        polygon = ensure_ccw(transform_polygon(next.local, t));
    }

    PlacedFace placed;
    placed.face_id = next.id;
    placed.via_edge = edge.id;
    placed.parent = prev_face.id;
    placed.transform = t;
    placed.polygon = std::move(polygon);
    return placed;
}

PlacedFace UnfoldTransform::unfold(const AdjacencyGraph& graph,
                                   const PlacedFace& prev,
                                   AdjacencyId edge_id) {
    const AdjacencyEdge& edge = graph.edge(edge_id);
    return unfold(graph.face(prev.face_id), prev, graph.face(edge.other(prev.face_id)), edge);
}

}  // namespace washiwrap
