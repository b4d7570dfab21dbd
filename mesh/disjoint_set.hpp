#ifndef WASHIWRAP_MESH_DISJOINT_SET_HPP
#define WASHIWRAP_MESH_DISJOINT_SET_HPP

#include <cstdint>
#include <numeric>
#include <utility>
#include <vector>

namespace washiwrap {

// Union-find over 0..n-1 with path compression and union by rank
class DisjointSet {
public:
    explicit DisjointSet(size_t n) : parent_(n), rank_(n, 0) {
        std::iota(parent_.begin(), parent_.end(), uint32_t{0});
    }

    uint32_t find(uint32_t x) {
        uint32_t root = x;
        while (parent_[root] != root) {
            root = parent_[root];
        }
        while (parent_[x] != root) {
            uint32_t next = parent_[x];
            parent_[x] = root;
            x = next;
        }
        return root;
    }

    void unite(uint32_t x, uint32_t y) {
        uint32_t rx = find(x);
        uint32_t ry = find(y);
        if (rx == ry) return;
        if (rank_[rx] < rank_[ry]) {
            std::swap(rx, ry);
        }
        parent_[ry] = rx;
        if (rank_[rx] == rank_[ry]) {
            ++rank_[rx];
        }
    }

    size_t size() const { return parent_.size(); }

private:
    std::vector<uint32_t> parent_;
    std::vector<uint8_t> rank_;
};

}  // namespace washiwrap

#endif // WASHIWRAP_MESH_DISJOINT_SET_HPP
