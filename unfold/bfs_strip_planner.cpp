#include "bfs_strip_planner.hpp"
#include "unfold_transform.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <optional>
#include <stdexcept>

namespace washiwrap {

std::vector<Strip> BfsStripPlanner::plan(const AdjacencyGraph& graph, double tape_width) {
    if (!(tape_width > 0.0)) {
        throw std::invalid_argument("BfsStripPlanner: tape width must be positive");
    }
    if (graph.face_count() == 0) {
        throw std::invalid_argument("BfsStripPlanner: graph has no faces");
    }
    BfsStripPlanner planner(graph, tape_width);
    return planner.run();
}

BfsStripPlanner::BfsStripPlanner(const AdjacencyGraph& graph, double tape_width)
    : graph_(graph),
      tape_width_(tape_width),
      checker_(OverlapChecker::for_graph(graph)),
      assigned_(graph.face_count(), false),
      remaining_(graph.face_count()) {}

std::vector<Strip> BfsStripPlanner::run() {
    auto log = washiwrap::logging::get_logger();

    check_faces_fit();

    std::vector<Strip> strips;
    while (remaining_ > 0) {
        FaceId seed = pick_seed();
        Strip strip = grow_strip(seed);
        log->debug("BFS strip {}: {} face(s) from seed {}, ribbon width {:.3f} mm",
                   strips.size(), strip.size(), seed, strip.ribbon_width());
        strip.normalize();
        strips.push_back(std::move(strip));
    }

    log->info("BFS planner: {} faces in {} strip(s)", graph_.face_count(), strips.size());
    return strips;
}

void BfsStripPlanner::check_faces_fit() const {
    for (const auto& face : graph_.faces()) {
        double width = ribbon_width(face.local);
        if (width > tape_width_ + kWidthTolerance) {
            throw TapeWidthError(face.id, width, tape_width_);
        }
    }
}

FaceId BfsStripPlanner::pick_seed() const {
    // Highest degree first, lowest id on ties
    FaceId best = kNoFace;
    for (FaceId f = 0; f < graph_.face_count(); ++f) {
        if (assigned_[f]) continue;
        if (best == kNoFace || graph_.degree(f) > graph_.degree(best)) {
            best = f;
        }
    }
    return best;
}

void BfsStripPlanner::push_candidates(const Strip& strip, size_t parent_index,
                                      std::vector<Candidate>& layer) const {
    FaceId parent = strip.face(parent_index).face_id;
    for (AdjacencyId e : graph_.edges_for_face(parent)) {
        FaceId child = graph_.edge(e).other(parent);
        if (!assigned_[child]) {
            layer.push_back({parent_index, e, child});
        }
    }
}

Strip BfsStripPlanner::grow_strip(FaceId seed) {
    auto log = washiwrap::logging::get_logger();

    Strip strip;
    strip.append(UnfoldTransform::place_root(graph_.face(seed)));
    assigned_[seed] = true;
    --remaining_;

    std::vector<Candidate> layer;
    push_candidates(strip, 0, layer);

    while (!layer.empty()) {
        std::vector<Candidate> next_layer;

        while (!layer.empty()) {
            // Evaluate every live candidate of this layer, keep the one whose
            // inclusion widens the ribbon least
            std::optional<size_t> best;
            PlacedFace best_placed;
            double best_width = 0.0;
            std::vector<Candidate> live;

            for (const auto& cand : layer) {
                if (assigned_[cand.child]) continue;

                PlacedFace placed;
                try {
                    placed = UnfoldTransform::unfold(graph_, strip.face(cand.parent_index), cand.edge);
                } catch (const DegenerateEdgeError& e) {
                    log->debug("BFS: {}; face {} deferred", e.what(), cand.child);
                    continue;
                }

                double width = strip.ribbon_width_with(placed.polygon);
                if (width > tape_width_ + kWidthTolerance) {
                    log->trace("BFS: face {} would widen strip to {:.3f} mm", cand.child, width);
                    continue;
                }
                if (auto hit = checker_.overlapping_face(strip.faces(), placed.polygon)) {
                    log->trace("BFS: face {} overlaps face {}", cand.child, *hit);
                    continue;
                }

                live.push_back(cand);
                if (!best || width < best_width ||
                    (width == best_width && cand.child < live[*best].child)) {
                    best = live.size() - 1;
                    best_width = width;
                    best_placed = std::move(placed);
                }
            }

            if (!best) {
                break;
            }

            FaceId child = live[*best].child;
            strip.append(std::move(best_placed));
            assigned_[child] = true;
            --remaining_;
            push_candidates(strip, strip.size() - 1, next_layer);

            live.erase(live.begin() + static_cast<std::ptrdiff_t>(*best));
            layer = std::move(live);
        }

        layer = std::move(next_layer);
    }

    return strip;
}

}  // namespace washiwrap
