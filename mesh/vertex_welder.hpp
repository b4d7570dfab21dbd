#ifndef WASHIWRAP_MESH_VERTEX_WELDER_HPP
#define WASHIWRAP_MESH_VERTEX_WELDER_HPP

#include <math/vec3.hpp>
#include <array>
#include <cmath>
#include <cstdint>
#include <map>
#include <vector>

namespace washiwrap {

// Merges points closer than a tolerance into one vertex id.
// Points are bucketed on a grid of cell size == tolerance and the 27
// surrounding cells are searched, so nearby points on opposite sides of a
// cell boundary still merge.
class VertexWelder {
public:
    explicit VertexWelder(double tolerance) : tolerance_(tolerance > 0.0 ? tolerance : 1e-9) {}

    uint32_t insert(const Vec3& p) {
        auto key = cell_of(p);
        for (int dx = -1; dx <= 1; ++dx) {
            for (int dy = -1; dy <= 1; ++dy) {
                for (int dz = -1; dz <= 1; ++dz) {
                    auto it = cells_.find({key[0] + dx, key[1] + dy, key[2] + dz});
                    if (it == cells_.end()) continue;
                    for (uint32_t id : it->second) {
                        if (points_[id].distance_to(p) <= tolerance_) {
                            return id;
                        }
                    }
                }
            }
        }
        uint32_t id = static_cast<uint32_t>(points_.size());
        points_.push_back(p);
        cells_[key].push_back(id);
        return id;
    }

    const std::vector<Vec3>& points() const { return points_; }
    double tolerance() const { return tolerance_; }

private:
    std::array<int64_t, 3> cell_of(const Vec3& p) const {
        return {static_cast<int64_t>(std::floor(p.x / tolerance_)),
                static_cast<int64_t>(std::floor(p.y / tolerance_)),
                static_cast<int64_t>(std::floor(p.z / tolerance_))};
    }

    double tolerance_;
    std::vector<Vec3> points_;
    std::map<std::array<int64_t, 3>, std::vector<uint32_t>> cells_;
};

}  // namespace washiwrap

#endif // WASHIWRAP_MESH_VERTEX_WELDER_HPP
