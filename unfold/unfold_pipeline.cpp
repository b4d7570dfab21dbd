#include "unfold_pipeline.hpp"
#include "overlap_checker.hpp"
#include <common/logging.hpp>
#include <stdexcept>
#include <variant>

namespace washiwrap {

std::string to_string(UnfoldMode mode) {
    switch (mode) {
        case UnfoldMode::Bfs: return "bfs";
        case UnfoldMode::Hamiltonian: return "hamiltonian";
    }
    return "unknown";
}

UnfoldMode parse_unfold_mode(const std::string& name) {
    if (name == "bfs") return UnfoldMode::Bfs;
    if (name == "hamiltonian" || name == "ham") return UnfoldMode::Hamiltonian;
    throw std::invalid_argument("Unknown unfold mode: " + name + " (expected bfs or hamiltonian)");
}

UnfoldOutcome UnfoldPipeline::run(const AdjacencyGraph& graph, const UnfoldConfig& config) {
    auto log = washiwrap::logging::get_logger();

    UnfoldOutcome outcome;

    if (config.mode == UnfoldMode::Hamiltonian) {
        HamiltonianResult result = HamiltonianPlanner::plan(graph, config.tape_width, config.hamiltonian);
        if (auto* strip = std::get_if<Strip>(&result)) {
            outcome.strips.push_back(std::move(*strip));
            outcome.used_mode = UnfoldMode::Hamiltonian;
            verify(graph, outcome.strips, config.tape_width);
            return outcome;
        }

        SearchFailure failure = std::get<SearchFailure>(std::move(result));
        if (!config.fallback_enabled) {
            throw HamiltonianSearchError(std::move(failure));
        }
        log->warn("Hamiltonian search failed ({}): {}; falling back to BFS strips",
                  to_string(failure.reason), failure.message);
        outcome.search_failure = std::move(failure);
    }

    outcome.strips = BfsStripPlanner::plan(graph, config.tape_width);
    outcome.used_mode = UnfoldMode::Bfs;
    verify(graph, outcome.strips, config.tape_width);
    return outcome;
}

void UnfoldPipeline::verify(const AdjacencyGraph& graph, const std::vector<Strip>& strips, double tape_width) {
    std::vector<int> seen(graph.face_count(), 0);
    OverlapChecker checker = OverlapChecker::for_graph(graph);

    for (size_t s = 0; s < strips.size(); ++s) {
        const Strip& strip = strips[s];
        if (strip.empty()) {
            throw std::logic_error("Strip " + std::to_string(s) + " is empty");
        }
        if (strip.ribbon_width() > tape_width + kWidthTolerance) {
            throw std::logic_error("Strip " + std::to_string(s) + " is " +
                                   std::to_string(strip.ribbon_width()) + " mm wide, tape is " +
                                   std::to_string(tape_width) + " mm");
        }
        if (!checker.strip_is_overlap_free(strip)) {
            throw std::logic_error("Strip " + std::to_string(s) + " has overlapping faces");
        }
        for (const auto& placed : strip.faces()) {
            if (placed.face_id >= seen.size()) {
                throw std::out_of_range("Strip " + std::to_string(s) + " references unknown face " +
                                        std::to_string(placed.face_id));
            }
            ++seen[placed.face_id];
        }
    }

    for (FaceId f = 0; f < seen.size(); ++f) {
        if (seen[f] != 1) {
            throw std::logic_error("Face " + std::to_string(f) + " appears in " +
                                   std::to_string(seen[f]) + " strips");
        }
    }
}

}  // namespace washiwrap
