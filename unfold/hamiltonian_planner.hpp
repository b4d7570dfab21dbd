#ifndef WASHIWRAP_UNFOLD_HAMILTONIAN_PLANNER_HPP
#define WASHIWRAP_UNFOLD_HAMILTONIAN_PLANNER_HPP

#include "adjacency_graph.hpp"
#include "overlap_checker.hpp"
#include "strip.hpp"
#include <common/errors.hpp>
#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace washiwrap {

// Configuration for the serpentine ribbon search
struct HamiltonianConfig {
    // Partial paths kept per depth
    int beam_width = 24;

    // Wall-clock budget for the whole search (seconds)
    double timeout_seconds = 2.0;

    // Weight of the onward-connectivity term relative to ribbon width
    double connectivity_weight = 0.25;

    // Parallelization settings
    int num_threads = 0;  // 0 = auto-detect, > 0 = use specific count
};

enum class SearchFailureReason {
    DeadlineExceeded,   // Time budget spent before a full path was found
    BeamExhausted,      // Every partial path dead-ended
    Infeasible          // No path can exist (face wider than tape, disconnected graph)
};

std::string to_string(SearchFailureReason reason);

// Why the search gave up, with enough context to diagnose it
struct SearchFailure {
    SearchFailureReason reason = SearchFailureReason::BeamExhausted;
    std::string message;
    size_t depth_reached = 0;      // Longest partial path, in faces
    size_t states_expanded = 0;
    double elapsed_seconds = 0.0;
};

using HamiltonianResult = std::variant<Strip, SearchFailure>;

// Raised by callers that surface a failed search instead of falling back
class HamiltonianSearchError : public Error {
public:
    explicit HamiltonianSearchError(SearchFailure failure)
        : Error("Hamiltonian search failed (" + to_string(failure.reason) + "): " + failure.message),
          failure_(std::move(failure)) {}

    const SearchFailure& failure() const { return failure_; }

private:
    SearchFailure failure_;
};

// Width-bounded beam search for a single strip visiting every face once,
// each face hinged on the one before it.
class HamiltonianPlanner {
public:
    static HamiltonianResult plan(const AdjacencyGraph& graph,
                                  double tape_width,
                                  const HamiltonianConfig& config = HamiltonianConfig{});

private:
    using Clock = std::chrono::steady_clock;

    // One partial path of the beam
    struct SearchState {
        std::vector<PlacedFace> placed;
        std::vector<bool> visited;
        Polygon2 hull;
        double width = 0.0;
        double score = 0.0;
    };

    HamiltonianPlanner(const AdjacencyGraph& graph, double tape_width, const HamiltonianConfig& config);

    HamiltonianResult run();
    std::vector<SearchState> initial_beam() const;
    std::vector<SearchState> expand(const SearchState& state) const;
    bool remainder_reachable(const SearchState& state) const;
    size_t onward_degree(const SearchState& state) const;
    double score(const SearchState& state) const;
    void rank_and_truncate(std::vector<SearchState>& states) const;

    SearchFailure failure(SearchFailureReason reason, const std::string& message) const;
    double elapsed_seconds() const;

    const AdjacencyGraph& graph_;
    double tape_width_;
    HamiltonianConfig config_;
    OverlapChecker checker_;
    double length_scale_ = 1.0;

    Clock::time_point start_;
    Clock::time_point deadline_;
    size_t depth_reached_ = 0;
    size_t states_expanded_ = 0;
};

}  // namespace washiwrap

#endif // WASHIWRAP_UNFOLD_HAMILTONIAN_PLANNER_HPP
