#include "strip_outline.hpp"
#include <mesh/vertex_welder.hpp>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace washiwrap {

std::vector<Polygon2> outline_loops(const std::vector<Polygon2>& polygons, double tolerance) {
    VertexWelder welder(tolerance);

    // Directed boundary edges with multiplicity; a reversed twin cancels
    std::map<std::pair<uint32_t, uint32_t>, int> directed;
    for (const auto& poly : polygons) {
        std::vector<uint32_t> ids;
        ids.reserve(poly.size());
        for (const auto& p : poly) {
            ids.push_back(welder.insert({p.x, p.y, 0.0}));
        }
        for (size_t i = 0; i < ids.size(); ++i) {
            uint32_t a = ids[i];
            uint32_t b = ids[(i + 1) % ids.size()];
            if (a == b) continue;

            auto twin = directed.find({b, a});
            if (twin != directed.end()) {
                if (--twin->second == 0) {
                    directed.erase(twin);
                }
            } else {
                ++directed[{a, b}];
            }
        }
    }

    std::map<uint32_t, std::vector<uint32_t>> next;
    for (const auto& [edge, count] : directed) {
        for (int k = 0; k < count; ++k) {
            next[edge.first].push_back(edge.second);
        }
    }

    // Every corner has as many edges leaving as entering, so each walk closes
    const auto& points = welder.points();
    std::vector<Polygon2> loops;
    for (auto& [start, outgoing] : next) {
        while (!outgoing.empty()) {
            Polygon2 loop;
            uint32_t current = start;
            do {
                auto it = next.find(current);
                if (it == next.end() || it->second.empty()) {
                    throw std::logic_error("outline_loops: boundary does not close at corner " +
                                           std::to_string(current));
                }
                uint32_t to = it->second.front();
                it->second.erase(it->second.begin());
                loop.push_back({points[current].x, points[current].y});
                current = to;
            } while (current != start);

            loops.push_back(remove_collinear(loop, tolerance));
        }
    }
    return loops;
}

}  // namespace washiwrap
