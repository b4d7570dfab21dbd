#include "adjacency_graph.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <mesh/vertex_welder.hpp>
#include <algorithm>
#include <cmath>
#include <queue>
#include <sstream>
#include <stdexcept>

namespace washiwrap {

namespace {

std::string describe_point(const Vec3& p) {
    std::ostringstream ss;
    ss << "(" << p.x << ", " << p.y << ", " << p.z << ")";
    return ss.str();
}

double points_extent(const std::vector<FaceInput>& inputs) {
    Bounds3 bounds;
    for (const auto& in : inputs) {
        for (const auto& p : in.points) {
            bounds.extend(p);
        }
    }
    return bounds.diagonal();
}

}  // namespace

FaceId AdjacencyGraph::add_face(const FaceInput& input) {
    FaceId id = static_cast<FaceId>(faces_.size());

    // Drop consecutive repeats so every boundary edge has a length
    std::vector<Vec3> pts;
    for (const auto& p : input.points) {
        if (pts.empty() || pts.back().distance_to(p) > 1e-12) {
            pts.push_back(p);
        }
    }
    while (pts.size() > 1 && pts.front().distance_to(pts.back()) <= 1e-12) {
        pts.pop_back();
    }
    if (pts.size() < 3) {
        throw MalformedMeshError("face " + std::to_string(id) + " has fewer than 3 distinct vertices");
    }

    Vec3 winding = newell_normal(pts);
    double area = 0.5 * winding.length();
    if (area <= 1e-12) {
        throw MalformedMeshError("face " + std::to_string(id) + " has zero area");
    }

    Vec3 normal = input.normal.normalized();
    if (normal.length_squared() == 0.0) {
        normal = winding.normalized();
    }
    if (winding.dot(normal) < 0.0) {
        std::reverse(pts.begin(), pts.end());
    }

    Face face;
    face.id = id;
    face.vertices = pts;
    face.normal = normal;
    face.area = area;
    face.origin = pts[0];
    face.axis_u = (pts[1] - pts[0]).normalized();
    face.axis_v = normal.cross(face.axis_u).normalized();
    face.local.reserve(pts.size());
    for (const auto& p : pts) {
        face.local.push_back(face.to_local(p));
    }

    faces_.push_back(std::move(face));
    face_edges_.emplace_back();
    return id;
}

const Face& AdjacencyGraph::face(FaceId id) const {
    if (id >= faces_.size()) {
        throw std::out_of_range("AdjacencyGraph::face: invalid face id");
    }
    return faces_[id];
}

AdjacencyId AdjacencyGraph::add_edge(FaceId a, FaceId b, const Vec3& p0, const Vec3& p1) {
    if (a >= faces_.size() || b >= faces_.size()) {
        throw std::out_of_range("AdjacencyGraph::add_edge: invalid face id");
    }
    if (a == b) {
        throw MalformedMeshError("face " + std::to_string(a) + " is adjacent to itself");
    }

    auto key = std::make_pair(std::min(a, b), std::max(a, b));
    if (pair_to_edge_.count(key)) {
        throw MalformedMeshError("faces " + std::to_string(key.first) + " and " +
                                 std::to_string(key.second) + " share more than one edge");
    }

    AdjacencyEdge edge;
    edge.id = static_cast<AdjacencyId>(edges_.size());
    edge.face_a = a;
    edge.face_b = b;
    edge.p0 = p0;
    edge.p1 = p1;
    edge.dihedral_angle = std::numbers::pi - angle_between(faces_[a].normal, faces_[b].normal);

    edges_.push_back(edge);
    face_edges_[a].push_back(edge.id);
    face_edges_[b].push_back(edge.id);
    pair_to_edge_[key] = edge.id;
    return edge.id;
}

const AdjacencyEdge& AdjacencyGraph::edge(AdjacencyId id) const {
    if (id >= edges_.size()) {
        throw std::out_of_range("AdjacencyGraph::edge: invalid edge id");
    }
    return edges_[id];
}

const std::vector<AdjacencyId>& AdjacencyGraph::edges_for_face(FaceId id) const {
    if (id >= face_edges_.size()) {
        throw std::out_of_range("AdjacencyGraph::edges_for_face: invalid face id");
    }
    return face_edges_[id];
}

std::vector<FaceId> AdjacencyGraph::neighbors(FaceId id) const {
    std::vector<FaceId> result;
    for (AdjacencyId e : edges_for_face(id)) {
        result.push_back(edges_[e].other(id));
    }
    return result;
}

std::optional<AdjacencyId> AdjacencyGraph::edge_between(FaceId a, FaceId b) const {
    auto it = pair_to_edge_.find({std::min(a, b), std::max(a, b)});
    if (it == pair_to_edge_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool AdjacencyGraph::is_connected() const {
    if (faces_.empty()) {
        return true;
    }
    std::vector<bool> seen(faces_.size(), false);
    std::queue<FaceId> queue;
    queue.push(0);
    seen[0] = true;
    size_t reached = 1;
    while (!queue.empty()) {
        FaceId f = queue.front();
        queue.pop();
        for (AdjacencyId e : face_edges_[f]) {
            FaceId n = edges_[e].other(f);
            if (!seen[n]) {
                seen[n] = true;
                ++reached;
                queue.push(n);
            }
        }
    }
    return reached == faces_.size();
}

double AdjacencyGraph::scale() const {
    Bounds3 bounds;
    for (const auto& f : faces_) {
        for (const auto& p : f.vertices) {
            bounds.extend(p);
        }
    }
    return bounds.diagonal();
}

double AdjacencyGraph::mean_edge_length() const {
    if (edges_.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& e : edges_) {
        total += e.length();
    }
    return total / static_cast<double>(edges_.size());
}

AdjacencyGraph AdjacencyGraph::from_faces(const std::vector<FaceInput>& inputs) {
    auto log = washiwrap::logging::get_logger();

    if (inputs.empty()) {
        throw MalformedMeshError("mesh has no faces");
    }

    AdjacencyGraph graph;
    for (const auto& input : inputs) {
        graph.add_face(input);
    }

    // Weld vertices so that shared corners compare equal across faces
    double weld_tolerance = std::max(1e-9, 1e-6 * points_extent(inputs));
    VertexWelder welder(weld_tolerance);

    struct EdgeUse {
        FaceId face;
        size_t corner;
    };
    std::map<std::pair<uint32_t, uint32_t>, std::vector<EdgeUse>> edge_uses;

    for (const auto& face : graph.faces_) {
        std::vector<uint32_t> ids;
        ids.reserve(face.vertices.size());
        for (const auto& p : face.vertices) {
            ids.push_back(welder.insert(p));
        }
        for (size_t i = 0; i < ids.size(); ++i) {
            uint32_t a = ids[i];
            uint32_t b = ids[(i + 1) % ids.size()];
            if (a == b) {
                log->warn("Face {} has an edge shorter than the weld tolerance ({} mm), ignoring it",
                          face.id, weld_tolerance);
                continue;
            }
            edge_uses[{std::min(a, b), std::max(a, b)}].push_back({face.id, i});
        }
    }

    for (const auto& [key, uses] : edge_uses) {
        const Vec3& p0 = welder.points()[key.first];
        const Vec3& p1 = welder.points()[key.second];
        if (uses.size() != 2) {
            std::string faces;
            for (const auto& use : uses) {
                faces += (faces.empty() ? "" : ", ") + std::to_string(use.face);
            }
            throw MalformedMeshError("edge " + describe_point(p0) + " - " + describe_point(p1) +
                                     " borders " + std::to_string(uses.size()) +
                                     " face(s) [" + faces + "], expected 2");
        }
        const Face& fa = graph.faces_[uses[0].face];
        graph.add_edge(uses[0].face, uses[1].face,
                       fa.vertices[uses[0].corner],
                       fa.vertices[(uses[0].corner + 1) % fa.vertices.size()]);
    }

    log->debug("Adjacency graph: {} faces, {} edges, weld tolerance {} mm",
               graph.face_count(), graph.edge_count(), weld_tolerance);
    return graph;
}

}  // namespace washiwrap
