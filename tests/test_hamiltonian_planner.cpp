#include <gtest/gtest.h>
#include <unfold/hamiltonian_planner.hpp>
#include <unfold/overlap_checker.hpp>
#include "test_helpers.hpp"
#include <algorithm>
#include <chrono>
#include <numeric>

using namespace washiwrap;

namespace {

// Permutation of all faces, each hinged on its predecessor, no overlap
void expect_serpentine(const AdjacencyGraph& graph, const Strip& strip, double tape_width) {
    std::vector<FaceId> order = strip.face_order();
    std::vector<FaceId> sorted = order;
    std::sort(sorted.begin(), sorted.end());
    std::vector<FaceId> all(graph.face_count());
    std::iota(all.begin(), all.end(), FaceId{0});
    EXPECT_EQ(sorted, all);

    for (size_t i = 1; i < strip.size(); ++i) {
        const PlacedFace& f = strip.face(i);
        EXPECT_EQ(f.parent, order[i - 1]);
        ASSERT_TRUE(graph.edge_between(order[i - 1], order[i]).has_value());
        EXPECT_EQ(f.via_edge, *graph.edge_between(order[i - 1], order[i]));
    }

    EXPECT_TRUE(OverlapChecker::for_graph(graph).strip_is_overlap_free(strip));
    EXPECT_LE(strip.ribbon_width(), tape_width + kWidthTolerance);
    EXPECT_TRUE(strip.is_normalized());
}

}  // namespace

TEST(HamiltonianPlanner, CubeWithWideTapeFindsSerpentine) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 60.0);

    ASSERT_TRUE(std::holds_alternative<Strip>(result))
        << std::get<SearchFailure>(result).message;
    expect_serpentine(graph, std::get<Strip>(result), 60.0);
}

TEST(HamiltonianPlanner, TetrahedronPath) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::tetrahedron_faces(20.0));
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 40.0);
    ASSERT_TRUE(std::holds_alternative<Strip>(result));
    expect_serpentine(graph, std::get<Strip>(result), 40.0);
}

TEST(HamiltonianPlanner, PrismPath) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::prism_faces(6, 10.0, 8.0));
    HamiltonianConfig config;
    config.beam_width = 64;
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 60.0, config);
    ASSERT_TRUE(std::holds_alternative<Strip>(result))
        << std::get<SearchFailure>(result).message;
    expect_serpentine(graph, std::get<Strip>(result), 60.0);
}

TEST(HamiltonianPlanner, FaceWiderThanTapeIsInfeasible) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 10.0);

    ASSERT_TRUE(std::holds_alternative<SearchFailure>(result));
    EXPECT_EQ(std::get<SearchFailure>(result).reason, SearchFailureReason::Infeasible);
}

TEST(HamiltonianPlanner, NarrowTapeExhaustsBeam) {
    // Only straight rows fit, and no straight row covers a cube
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 20.2);

    ASSERT_TRUE(std::holds_alternative<SearchFailure>(result));
    const SearchFailure& failure = std::get<SearchFailure>(result);
    EXPECT_EQ(failure.reason, SearchFailureReason::BeamExhausted);
    EXPECT_EQ(failure.depth_reached, 4u);
    EXPECT_GT(failure.states_expanded, 0u);
}

TEST(HamiltonianPlanner, ZeroTimeoutExceedsDeadline) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    HamiltonianConfig config;
    config.timeout_seconds = 0.0;
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 60.0, config);

    ASSERT_TRUE(std::holds_alternative<SearchFailure>(result));
    EXPECT_EQ(std::get<SearchFailure>(result).reason, SearchFailureReason::DeadlineExceeded);
}

TEST(HamiltonianPlanner, DeadlineAppliesToCompletePath) {
    // One face is a complete path before any expansion
    AdjacencyGraph graph;
    graph.add_face(test::cube_faces(20.0)[0]);
    HamiltonianConfig config;
    config.timeout_seconds = 0.0;
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 30.0, config);

    ASSERT_TRUE(std::holds_alternative<SearchFailure>(result));
    EXPECT_EQ(std::get<SearchFailure>(result).reason, SearchFailureReason::DeadlineExceeded);
}

TEST(HamiltonianPlanner, ReturnsCloseToDeadline) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::prism_faces(40, 60.0, 10.0));
    HamiltonianConfig config;
    config.beam_width = 5000;
    config.timeout_seconds = 0.05;

    auto start = std::chrono::steady_clock::now();
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 200.0, config);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    EXPECT_LT(elapsed, config.timeout_seconds + 1.0);
    if (auto* failure = std::get_if<SearchFailure>(&result)) {
        EXPECT_EQ(failure->reason, SearchFailureReason::DeadlineExceeded);
    }
}

TEST(HamiltonianPlanner, SelfOverlappingPathIsRejected) {
    // The fan is a chain, and walking it end to end puts the last triangle
    // on the first
    AdjacencyGraph graph = test::right_angle_fan(5);
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 100.0);

    ASSERT_TRUE(std::holds_alternative<SearchFailure>(result));
    const SearchFailure& failure = std::get<SearchFailure>(result);
    EXPECT_EQ(failure.reason, SearchFailureReason::BeamExhausted);
    EXPECT_EQ(failure.depth_reached, 4u);
}

TEST(HamiltonianPlanner, EdgeContactIsNotAnOverlap) {
    AdjacencyGraph graph = test::right_angle_fan(4);
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 100.0);

    ASSERT_TRUE(std::holds_alternative<Strip>(result))
        << std::get<SearchFailure>(result).message;
    expect_serpentine(graph, std::get<Strip>(result), 100.0);
}

TEST(HamiltonianPlanner, SingleFace) {
    AdjacencyGraph graph;
    graph.add_face(test::cube_faces(20.0)[0]);
    HamiltonianResult result = HamiltonianPlanner::plan(graph, 30.0);
    ASSERT_TRUE(std::holds_alternative<Strip>(result));
    EXPECT_EQ(std::get<Strip>(result).size(), 1u);
}

TEST(HamiltonianPlanner, DisconnectedOrEmptyIsInfeasible) {
    AdjacencyGraph empty;
    HamiltonianResult none = HamiltonianPlanner::plan(empty, 30.0);
    ASSERT_TRUE(std::holds_alternative<SearchFailure>(none));
    EXPECT_EQ(std::get<SearchFailure>(none).reason, SearchFailureReason::Infeasible);

    AdjacencyGraph split;
    auto faces = test::cube_faces(20.0);
    split.add_face(faces[0]);
    split.add_face(faces[1]);
    HamiltonianResult result = HamiltonianPlanner::plan(split, 30.0);
    ASSERT_TRUE(std::holds_alternative<SearchFailure>(result));
    EXPECT_EQ(std::get<SearchFailure>(result).reason, SearchFailureReason::Infeasible);
}

TEST(HamiltonianPlanner, ThreadCountDoesNotChangeResult) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::prism_faces(5, 10.0, 8.0));
    HamiltonianConfig single;
    single.num_threads = 1;
    HamiltonianConfig many;
    many.num_threads = 4;

    HamiltonianResult a = HamiltonianPlanner::plan(graph, 40.0, single);
    HamiltonianResult b = HamiltonianPlanner::plan(graph, 40.0, many);
    ASSERT_EQ(a.index(), b.index());
    if (std::holds_alternative<Strip>(a)) {
        EXPECT_EQ(std::get<Strip>(a).face_order(), std::get<Strip>(b).face_order());
    }
}

TEST(HamiltonianPlanner, InvalidArguments) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    EXPECT_THROW(HamiltonianPlanner::plan(graph, 0.0), std::invalid_argument);

    HamiltonianConfig zero_beam;
    zero_beam.beam_width = 0;
    EXPECT_THROW(HamiltonianPlanner::plan(graph, 60.0, zero_beam), std::invalid_argument);

    HamiltonianConfig negative_timeout;
    negative_timeout.timeout_seconds = -1.0;
    EXPECT_THROW(HamiltonianPlanner::plan(graph, 60.0, negative_timeout), std::invalid_argument);
}

TEST(HamiltonianPlanner, SearchErrorCarriesFailure) {
    SearchFailure failure;
    failure.reason = SearchFailureReason::BeamExhausted;
    failure.message = "stuck";
    failure.depth_reached = 3;

    HamiltonianSearchError error(failure);
    EXPECT_EQ(error.failure().depth_reached, 3u);
    EXPECT_NE(std::string(error.what()).find("beam exhausted"), std::string::npos);
    EXPECT_NE(std::string(error.what()).find("stuck"), std::string::npos);
}
