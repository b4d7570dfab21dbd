#include "hamiltonian_planner.hpp"
#include "unfold_transform.hpp"
#include <common/logging.hpp>
#include <common/parallel_for.hpp>
#include <algorithm>
#include <atomic>
#include <queue>
#include <set>
#include <stdexcept>
#include <utility>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace washiwrap {

std::string to_string(SearchFailureReason reason) {
    switch (reason) {
        case SearchFailureReason::DeadlineExceeded: return "deadline exceeded";
        case SearchFailureReason::BeamExhausted: return "beam exhausted";
        case SearchFailureReason::Infeasible: return "infeasible";
    }
    return "unknown";
}

HamiltonianResult HamiltonianPlanner::plan(const AdjacencyGraph& graph,
                                           double tape_width,
                                           const HamiltonianConfig& config) {
    if (!(tape_width > 0.0)) {
        throw std::invalid_argument("HamiltonianPlanner: tape width must be positive");
    }
    if (config.beam_width < 1) {
        throw std::invalid_argument("HamiltonianPlanner: beam width must be at least 1");
    }
    if (config.timeout_seconds < 0.0) {
        throw std::invalid_argument("HamiltonianPlanner: timeout must not be negative");
    }
    HamiltonianPlanner planner(graph, tape_width, config);
    return planner.run();
}

HamiltonianPlanner::HamiltonianPlanner(const AdjacencyGraph& graph, double tape_width,
                                       const HamiltonianConfig& config)
    : graph_(graph),
      tape_width_(tape_width),
      config_(config),
      checker_(OverlapChecker::for_graph(graph)) {
    double mean = graph.mean_edge_length();
    length_scale_ = mean > 0.0 ? mean : 1.0;
}

double HamiltonianPlanner::elapsed_seconds() const {
    return std::chrono::duration<double>(Clock::now() - start_).count();
}

SearchFailure HamiltonianPlanner::failure(SearchFailureReason reason, const std::string& message) const {
    SearchFailure f;
    f.reason = reason;
    f.message = message;
    f.depth_reached = depth_reached_;
    f.states_expanded = states_expanded_;
    f.elapsed_seconds = elapsed_seconds();
    return f;
}

HamiltonianResult HamiltonianPlanner::run() {
    auto log = washiwrap::logging::get_logger();

    start_ = Clock::now();
    deadline_ = start_ + std::chrono::duration_cast<Clock::duration>(
                             std::chrono::duration<double>(config_.timeout_seconds));

    const size_t face_count = graph_.face_count();
    if (face_count == 0) {
        return failure(SearchFailureReason::Infeasible, "mesh has no faces");
    }
    for (const auto& face : graph_.faces()) {
        double width = ribbon_width(face.local);
        if (width > tape_width_ + kWidthTolerance) {
            return failure(SearchFailureReason::Infeasible,
                           "face " + std::to_string(face.id) + " needs " + std::to_string(width) +
                           " mm, tape width is " + std::to_string(tape_width_) + " mm");
        }
    }
    if (!graph_.is_connected()) {
        return failure(SearchFailureReason::Infeasible, "face adjacency graph is disconnected");
    }

    #ifdef _OPENMP
    int max_threads = omp_get_max_threads();
    int use_threads = (config_.num_threads > 0) ? config_.num_threads : max_threads;
    omp_set_num_threads(use_threads);
    log->debug("Hamiltonian search using {} OpenMP threads", use_threads);
    #endif

    log->info("Hamiltonian search: {} faces, beam {}, timeout {:.2f} s, tape {:.2f} mm",
              face_count, config_.beam_width, config_.timeout_seconds, tape_width_);

    std::vector<SearchState> beam = initial_beam();
    depth_reached_ = 1;

    for (size_t depth = 1; depth < face_count; ++depth) {
        std::vector<std::vector<SearchState>> children(beam.size());
        std::atomic<bool> expired{false};
        std::atomic<size_t> expanded{0};

        // Each state expands independently; the deadline is checked before every expansion
        parallel_for(beam.size(), 4, [&](size_t i) {
            if (expired.load()) return;
            if (Clock::now() >= deadline_) {
                expired.store(true);
                return;
            }
            children[i] = expand(beam[i]);
            expanded.fetch_add(1);
        });
        states_expanded_ += expanded.load();

        if (expired.load()) {
            log->warn("Hamiltonian search: deadline reached at depth {} after {} expansions",
                      depth_reached_, states_expanded_);
            return failure(SearchFailureReason::DeadlineExceeded,
                           "no complete path within " + std::to_string(config_.timeout_seconds) + " s");
        }

        // Merge in beam order so the result does not depend on thread scheduling
        std::vector<SearchState> next;
        for (auto& group : children) {
            for (auto& child : group) {
                next.push_back(std::move(child));
            }
        }

        if (next.empty()) {
            log->warn("Hamiltonian search: beam exhausted at depth {}", depth_reached_);
            return failure(SearchFailureReason::BeamExhausted,
                           "no partial path could be extended beyond " +
                           std::to_string(depth_reached_) + " of " + std::to_string(face_count) + " faces");
        }

        depth_reached_ = depth + 1;
        rank_and_truncate(next);
        log->debug("Hamiltonian depth {}: {} state(s), best width {:.3f} mm",
                   depth_reached_, next.size(), next.front().width);
        beam = std::move(next);
    }

    if (Clock::now() >= deadline_) {
        log->warn("Hamiltonian search: deadline reached after completing {} faces", depth_reached_);
        return failure(SearchFailureReason::DeadlineExceeded,
                       "search exceeded " + std::to_string(config_.timeout_seconds) + " s");
    }

    const SearchState& best = beam.front();
    Strip strip;
    for (const auto& placed : best.placed) {
        strip.append(placed);
    }
    strip.normalize();

    log->info("Hamiltonian search: found ribbon of width {:.3f} mm in {:.3f} s ({} expansions)",
              strip.ribbon_width(), elapsed_seconds(), states_expanded_);
    return strip;
}

std::vector<HamiltonianPlanner::SearchState> HamiltonianPlanner::initial_beam() const {
    std::vector<SearchState> states;
    states.reserve(graph_.face_count());
    for (const auto& face : graph_.faces()) {
        SearchState s;
        s.placed.push_back(UnfoldTransform::place_root(face));
        s.visited.assign(graph_.face_count(), false);
        s.visited[face.id] = true;
        s.hull = convex_hull(face.local);
        s.width = min_width_fit(s.hull).width;
        s.score = score(s);
        states.push_back(std::move(s));
    }
    rank_and_truncate(states);
    return states;
}

std::vector<HamiltonianPlanner::SearchState> HamiltonianPlanner::expand(const SearchState& state) const {
    std::vector<SearchState> children;
    const PlacedFace& last = state.placed.back();

    for (AdjacencyId e : graph_.edges_for_face(last.face_id)) {
        FaceId next = graph_.edge(e).other(last.face_id);
        if (state.visited[next]) continue;

        PlacedFace placed;
        try {
            placed = UnfoldTransform::unfold(graph_, last, e);
        } catch (const DegenerateEdgeError&) {
            continue;
        }

        std::vector<Vec2> pts = state.hull;
        pts.insert(pts.end(), placed.polygon.begin(), placed.polygon.end());
        Polygon2 hull = convex_hull(std::move(pts));
        double width = min_width_fit(hull).width;
        if (width > tape_width_ + kWidthTolerance) continue;
        if (checker_.overlaps(state.placed, placed.polygon)) continue;

        SearchState child;
        child.placed = state.placed;
        child.placed.push_back(std::move(placed));
        child.visited = state.visited;
        child.visited[next] = true;
        child.hull = std::move(hull);
        child.width = width;

        if (!remainder_reachable(child)) continue;

        child.score = score(child);
        children.push_back(std::move(child));
    }
    return children;
}

bool HamiltonianPlanner::remainder_reachable(const SearchState& state) const {
    size_t unvisited = static_cast<size_t>(std::count(state.visited.begin(), state.visited.end(), false));
    if (unvisited == 0) {
        return true;
    }

    std::vector<bool> seen(graph_.face_count(), false);
    std::queue<FaceId> queue;
    FaceId start = state.placed.back().face_id;
    queue.push(start);
    seen[start] = true;
    size_t reached = 0;
    while (!queue.empty()) {
        FaceId f = queue.front();
        queue.pop();
        for (FaceId n : graph_.neighbors(f)) {
            if (seen[n] || state.visited[n]) continue;
            seen[n] = true;
            ++reached;
            queue.push(n);
        }
    }
    return reached == unvisited;
}

size_t HamiltonianPlanner::onward_degree(const SearchState& state) const {
    size_t count = 0;
    for (FaceId n : graph_.neighbors(state.placed.back().face_id)) {
        if (!state.visited[n]) ++count;
    }
    return count;
}

double HamiltonianPlanner::score(const SearchState& state) const {
    // Narrow ribbons first; among similar widths prefer ends with more ways out
    double onward = static_cast<double>(onward_degree(state));
    return state.width + config_.connectivity_weight * length_scale_ / (1.0 + onward);
}

void HamiltonianPlanner::rank_and_truncate(std::vector<SearchState>& states) const {
    std::sort(states.begin(), states.end(), [](const SearchState& a, const SearchState& b) {
        if (a.score != b.score) {
            return a.score < b.score;
        }
        return std::lexicographical_compare(
            a.placed.begin(), a.placed.end(), b.placed.begin(), b.placed.end(),
            [](const PlacedFace& x, const PlacedFace& y) { return x.face_id < y.face_id; });
    });

    // Same visited set and same end face: only the best survives
    std::set<std::pair<std::vector<bool>, FaceId>> seen;
    std::vector<SearchState> kept;
    const size_t limit = static_cast<size_t>(config_.beam_width);
    for (auto& s : states) {
        if (kept.size() >= limit) break;
        if (!seen.insert({s.visited, s.placed.back().face_id}).second) continue;
        kept.push_back(std::move(s));
    }
    states = std::move(kept);
}

}  // namespace washiwrap
