#ifndef WASHIWRAP_UNFOLD_BFS_STRIP_PLANNER_HPP
#define WASHIWRAP_UNFOLD_BFS_STRIP_PLANNER_HPP

#include "adjacency_graph.hpp"
#include "overlap_checker.hpp"
#include "strip.hpp"
#include <vector>

namespace washiwrap {

// Covers every face with tape-width-bounded strips grown breadth-first.
// Always succeeds unless a single face is wider than the tape
// (TapeWidthError); in the worst case every face becomes its own strip.
class BfsStripPlanner {
public:
    static std::vector<Strip> plan(const AdjacencyGraph& graph, double tape_width);

private:
    BfsStripPlanner(const AdjacencyGraph& graph, double tape_width);

    // A hinge from a face already in the strip to a face that is not
    struct Candidate {
        size_t parent_index;   // Position of the parent in the strip
        AdjacencyId edge;
        FaceId child;
    };

    std::vector<Strip> run();
    void check_faces_fit() const;
    FaceId pick_seed() const;
    Strip grow_strip(FaceId seed);
    void push_candidates(const Strip& strip, size_t parent_index, std::vector<Candidate>& layer) const;

    const AdjacencyGraph& graph_;
    double tape_width_;
    OverlapChecker checker_;
    std::vector<bool> assigned_;
    size_t remaining_ = 0;
};

}  // namespace washiwrap

#endif // WASHIWRAP_UNFOLD_BFS_STRIP_PLANNER_HPP
