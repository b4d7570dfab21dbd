#include "facet_extractor.hpp"
#include "disjoint_set.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace washiwrap {

namespace {

using EdgeKey = std::pair<VertexId, VertexId>;

EdgeKey edge_key(VertexId a, VertexId b) {
    return a < b ? EdgeKey{a, b} : EdgeKey{b, a};
}

// Drops corners where the boundary goes straight on
std::vector<Vec3> drop_collinear(const std::vector<Vec3>& loop, double eps) {
    std::vector<Vec3> out;
    const size_t n = loop.size();
    for (size_t i = 0; i < n; ++i) {
        const Vec3& prev = loop[(i + n - 1) % n];
        const Vec3& cur = loop[i];
        const Vec3& next = loop[(i + 1) % n];
        Vec3 d0 = cur - prev;
        Vec3 d1 = next - cur;
        double scale = d0.length() * d1.length();
        if (scale > 0.0 && d0.cross(d1).length() <= eps * scale && d0.dot(d1) > 0.0) {
            continue;
        }
        out.push_back(cur);
    }
    return out;
}

// Orders the undirected boundary edges of one facet into a closed loop
std::vector<VertexId> order_loop(const std::vector<EdgeKey>& boundary, size_t facet) {
    std::map<VertexId, std::vector<VertexId>> next;
    for (const auto& [a, b] : boundary) {
        next[a].push_back(b);
        next[b].push_back(a);
    }
    for (const auto& [v, nbrs] : next) {
        if (nbrs.size() != 2) {
            throw MalformedMeshError("facet " + std::to_string(facet) + " boundary vertex " +
                                     std::to_string(v) + " has " + std::to_string(nbrs.size()) +
                                     " boundary edges, expected 2");
        }
    }

    VertexId start = boundary.front().first;
    std::vector<VertexId> loop = {start};
    VertexId prev = start;
    VertexId cur = boundary.front().second;
    while (cur != start) {
        loop.push_back(cur);
        const auto& nbrs = next[cur];
        VertexId n = (nbrs[0] != prev) ? nbrs[0] : nbrs[1];
        prev = cur;
        cur = n;
        if (loop.size() > boundary.size()) break;
    }
    if (loop.size() != boundary.size()) {
        throw MalformedMeshError("facet " + std::to_string(facet) +
                                 " boundary is not a single simple loop");
    }
    return loop;
}

}  // namespace

std::vector<FaceInput> extract_facets(const TriangleMesh& mesh, const FacetConfig& config) {
    auto log = washiwrap::logging::get_logger();

    const double extent = mesh.extent();
    const double area_floor = 1e-12 * std::max(1.0, extent * extent);
    const double plane_tol = std::max(1e-9, config.plane_tolerance * extent);

    // Unit normal and plane offset per usable triangle
    std::vector<uint32_t> usable;
    std::vector<Vec3> normals(mesh.triangle_count());
    std::vector<double> offsets(mesh.triangle_count(), 0.0);
    std::vector<double> areas(mesh.triangle_count(), 0.0);
    for (uint32_t t = 0; t < mesh.triangle_count(); ++t) {
        const auto& tri = mesh.triangles[t];
        const Vec3& a = mesh.vertices.at(tri[0]);
        const Vec3& b = mesh.vertices.at(tri[1]);
        const Vec3& c = mesh.vertices.at(tri[2]);
        Vec3 cr = (b - a).cross(c - a);
        double len = cr.length();
        if (len * 0.5 <= area_floor) continue;
        normals[t] = cr / len;
        offsets[t] = normals[t].dot(a);
        areas[t] = len * 0.5;
        usable.push_back(t);
    }
    if (usable.size() < mesh.triangle_count()) {
        log->debug("Facets: discarded {} zero-area triangle(s)", mesh.triangle_count() - usable.size());
    }
    if (usable.empty()) {
        throw MalformedMeshError("mesh has no triangles with area");
    }

    std::map<EdgeKey, std::vector<uint32_t>> edge_tris;
    for (uint32_t t : usable) {
        const auto& tri = mesh.triangles[t];
        for (size_t k = 0; k < 3; ++k) {
            edge_tris[edge_key(tri[k], tri[(k + 1) % 3])].push_back(t);
        }
    }

    DisjointSet sets(mesh.triangle_count());
    for (const auto& [key, tris] : edge_tris) {
        if (tris.size() != 2) continue;
        uint32_t a = tris[0];
        uint32_t b = tris[1];
        bool parallel = 1.0 - normals[a].dot(normals[b]) <= config.normal_tolerance;
        bool same_plane = std::abs(offsets[a] - offsets[b]) <= plane_tol;
        if (parallel && same_plane) {
            sets.unite(a, b);
        }
    }

    // Facets numbered by their lowest triangle index
    std::map<uint32_t, size_t> root_to_facet;
    std::vector<std::vector<uint32_t>> groups;
    for (uint32_t t : usable) {
        uint32_t root = sets.find(t);
        auto it = root_to_facet.find(root);
        if (it == root_to_facet.end()) {
            it = root_to_facet.emplace(root, groups.size()).first;
            groups.emplace_back();
        }
        groups[it->second].push_back(t);
    }

    const Vec3 center = mesh.centroid();
    std::vector<FaceInput> faces;
    faces.reserve(groups.size());
    for (size_t f = 0; f < groups.size(); ++f) {
        std::map<EdgeKey, int> counts;
        Vec3 normal;
        for (uint32_t t : groups[f]) {
            const auto& tri = mesh.triangles[t];
            for (size_t k = 0; k < 3; ++k) {
                ++counts[edge_key(tri[k], tri[(k + 1) % 3])];
            }
            normal += normals[t] * areas[t];
        }

        std::vector<EdgeKey> boundary;
        for (const auto& [key, count] : counts) {
            if (count == 1) boundary.push_back(key);
        }
        if (boundary.size() < 3) {
            throw MalformedMeshError("facet " + std::to_string(f) + " has no closed boundary");
        }

        std::vector<Vec3> points;
        for (VertexId v : order_loop(boundary, f)) {
            points.push_back(mesh.vertices[v]);
        }
        points = drop_collinear(points, 1e-9);

        normal = normal.normalized();
        Vec3 facet_center;
        for (const auto& p : points) {
            facet_center += p;
        }
        facet_center /= static_cast<double>(points.size());
        if ((facet_center - center).dot(normal) < 0.0) {
            normal = -normal;
        }
        if (newell_normal(points).dot(normal) < 0.0) {
            std::reverse(points.begin(), points.end());
        }

        faces.push_back({std::move(points), normal});
    }

    log->info("Facets: {} triangles merged into {} face(s)", usable.size(), faces.size());
    return faces;
}

}  // namespace washiwrap
