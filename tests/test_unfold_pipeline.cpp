#include <gtest/gtest.h>
#include <unfold/unfold_pipeline.hpp>
#include <unfold/unfold_transform.hpp>
#include "test_helpers.hpp"

using namespace washiwrap;

TEST(UnfoldPipeline, ParseMode) {
    EXPECT_EQ(parse_unfold_mode("bfs"), UnfoldMode::Bfs);
    EXPECT_EQ(parse_unfold_mode("hamiltonian"), UnfoldMode::Hamiltonian);
    EXPECT_EQ(parse_unfold_mode("ham"), UnfoldMode::Hamiltonian);
    EXPECT_THROW(parse_unfold_mode("spiral"), std::invalid_argument);
    EXPECT_EQ(to_string(UnfoldMode::Hamiltonian), "hamiltonian");
}

TEST(UnfoldPipeline, BfsModeCoversEveryFace) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    UnfoldConfig config;
    config.tape_width = 20.2;

    UnfoldOutcome outcome = UnfoldPipeline::run(graph, config);
    EXPECT_EQ(outcome.used_mode, UnfoldMode::Bfs);
    EXPECT_FALSE(outcome.fell_back());
    size_t total = 0;
    for (const auto& strip : outcome.strips) {
        total += strip.size();
    }
    EXPECT_EQ(total, 6u);
}

TEST(UnfoldPipeline, HamiltonianModeReturnsOneStrip) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    UnfoldConfig config;
    config.mode = UnfoldMode::Hamiltonian;
    config.tape_width = 60.0;

    UnfoldOutcome outcome = UnfoldPipeline::run(graph, config);
    EXPECT_EQ(outcome.used_mode, UnfoldMode::Hamiltonian);
    EXPECT_FALSE(outcome.fell_back());
    ASSERT_EQ(outcome.strips.size(), 1u);
    EXPECT_EQ(outcome.strips[0].size(), 6u);
}

TEST(UnfoldPipeline, FailedSearchFallsBackToBfs) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    UnfoldConfig config;
    config.mode = UnfoldMode::Hamiltonian;
    config.tape_width = 20.2;

    UnfoldOutcome outcome = UnfoldPipeline::run(graph, config);
    EXPECT_EQ(outcome.used_mode, UnfoldMode::Bfs);
    ASSERT_TRUE(outcome.fell_back());
    EXPECT_EQ(outcome.search_failure->reason, SearchFailureReason::BeamExhausted);
    EXPECT_EQ(outcome.strips.size(), 3u);
}

TEST(UnfoldPipeline, OverlapFallsBackToSplitStrips) {
    AdjacencyGraph graph = test::right_angle_fan(5);
    UnfoldConfig config;
    config.mode = UnfoldMode::Hamiltonian;
    config.tape_width = 100.0;

    UnfoldOutcome outcome = UnfoldPipeline::run(graph, config);
    EXPECT_EQ(outcome.used_mode, UnfoldMode::Bfs);
    ASSERT_TRUE(outcome.fell_back());
    EXPECT_EQ(outcome.search_failure->reason, SearchFailureReason::BeamExhausted);
    EXPECT_EQ(outcome.strips.size(), 2u);
}

TEST(UnfoldPipeline, FailedSearchWithoutFallbackThrows) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    UnfoldConfig config;
    config.mode = UnfoldMode::Hamiltonian;
    config.tape_width = 20.2;
    config.fallback_enabled = false;

    try {
        UnfoldPipeline::run(graph, config);
        FAIL() << "expected HamiltonianSearchError";
    } catch (const HamiltonianSearchError& e) {
        EXPECT_EQ(e.failure().reason, SearchFailureReason::BeamExhausted);
    }
}

TEST(UnfoldPipeline, FaceWiderThanTapeStillFailsAfterFallback) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    UnfoldConfig config;
    config.mode = UnfoldMode::Hamiltonian;
    config.tape_width = 10.0;

    EXPECT_THROW(UnfoldPipeline::run(graph, config), TapeWidthError);
}

TEST(UnfoldPipeline, VerifyRejectsBadStrips) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));

    // Missing faces
    Strip single;
    single.append(UnfoldTransform::place_root(graph.face(0)));
    EXPECT_THROW(UnfoldPipeline::verify(graph, {single}, 30.0), std::logic_error);

    // Too wide
    std::vector<Strip> strips;
    for (const auto& face : graph.faces()) {
        Strip s;
        s.append(UnfoldTransform::place_root(face));
        strips.push_back(std::move(s));
    }
    EXPECT_NO_THROW(UnfoldPipeline::verify(graph, strips, 30.0));
    EXPECT_THROW(UnfoldPipeline::verify(graph, strips, 15.0), std::logic_error);

    // Face in two strips
    strips.push_back(single);
    EXPECT_THROW(UnfoldPipeline::verify(graph, strips, 30.0), std::logic_error);

    // Empty strip
    strips.pop_back();
    strips.push_back(Strip{});
    EXPECT_THROW(UnfoldPipeline::verify(graph, strips, 30.0), std::logic_error);
}

TEST(UnfoldPipeline, VerifyRejectsOverlap) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    Strip stacked;
    stacked.append(UnfoldTransform::place_root(graph.face(0)));
    PlacedFace same = UnfoldTransform::place_root(graph.face(1));
    same.polygon = stacked.face(0).polygon;
    stacked.append(same);

    std::vector<Strip> strips{stacked};
    for (FaceId f = 2; f < graph.face_count(); ++f) {
        Strip s;
        s.append(UnfoldTransform::place_root(graph.face(f)));
        strips.push_back(std::move(s));
    }
    EXPECT_THROW(UnfoldPipeline::verify(graph, strips, 60.0), std::logic_error);
}
