#ifndef WASHIWRAP_UNFOLD_UNFOLD_PIPELINE_HPP
#define WASHIWRAP_UNFOLD_UNFOLD_PIPELINE_HPP

#include "adjacency_graph.hpp"
#include "bfs_strip_planner.hpp"
#include "hamiltonian_planner.hpp"
#include "strip.hpp"
#include <optional>
#include <string>
#include <vector>

namespace washiwrap {

enum class UnfoldMode {
    Bfs,            // Short strips, always succeeds when every face fits the tape
    Hamiltonian     // One serpentine strip, may fail
};

std::string to_string(UnfoldMode mode);
UnfoldMode parse_unfold_mode(const std::string& name);

// Configuration for choosing and running a planner
struct UnfoldConfig {
    UnfoldMode mode = UnfoldMode::Bfs;

    // Tape width in mm
    double tape_width = 0.0;

    // Beam search settings (Hamiltonian mode only)
    HamiltonianConfig hamiltonian;

    // Fall back to BFS strips when the Hamiltonian search fails
    bool fallback_enabled = true;
};

// Strips plus how they were obtained
struct UnfoldOutcome {
    std::vector<Strip> strips;
    UnfoldMode used_mode = UnfoldMode::Bfs;

    // Set when a Hamiltonian search ran and failed
    std::optional<SearchFailure> search_failure;

    bool fell_back() const { return search_failure.has_value(); }
};

// Runs the configured planner, applies the fallback policy and checks the
// strips before they go to layout
class UnfoldPipeline {
public:
    static UnfoldOutcome run(const AdjacencyGraph& graph, const UnfoldConfig& config);

    // Throws std::logic_error when strips do not partition the faces, a
    // strip is wider than the tape or two faces of a strip overlap
    static void verify(const AdjacencyGraph& graph, const std::vector<Strip>& strips, double tape_width);
};

}  // namespace washiwrap

#endif // WASHIWRAP_UNFOLD_UNFOLD_PIPELINE_HPP
