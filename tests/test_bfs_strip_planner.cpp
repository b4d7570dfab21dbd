#include <gtest/gtest.h>
#include <unfold/bfs_strip_planner.hpp>
#include <unfold/unfold_pipeline.hpp>
#include <unfold/overlap_checker.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"
#include <algorithm>
#include <cmath>

using namespace washiwrap;

namespace {

// Every attached face hangs off an earlier face of its strip through a real edge
void expect_tree_attachment(const AdjacencyGraph& graph, const Strip& strip) {
    ASSERT_FALSE(strip.empty());
    EXPECT_EQ(strip.face(0).parent, kNoFace);
    for (size_t i = 1; i < strip.size(); ++i) {
        const PlacedFace& f = strip.face(i);
        ASSERT_NE(f.via_edge, kNoAdjacency);
        const AdjacencyEdge& e = graph.edge(f.via_edge);
        EXPECT_TRUE(e.touches(f.face_id));
        EXPECT_EQ(e.other(f.face_id), f.parent);

        bool parent_earlier = false;
        for (size_t j = 0; j < i; ++j) {
            parent_earlier = parent_earlier || strip.face(j).face_id == f.parent;
        }
        EXPECT_TRUE(parent_earlier);
    }
}

}  // namespace

TEST(BfsStripPlanner, WideTapeCoversCubeInOneStrip) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    auto strips = BfsStripPlanner::plan(graph, 60.0);

    ASSERT_EQ(strips.size(), 1u);
    EXPECT_EQ(strips[0].size(), 6u);
    EXPECT_LE(strips[0].ribbon_width(), 60.0 + kWidthTolerance);
    EXPECT_NO_THROW(UnfoldPipeline::verify(graph, strips, 60.0));
    expect_tree_attachment(graph, strips[0]);
}

TEST(BfsStripPlanner, SeedIsHighestDegreeFace) {
    // The caps of a hexagonal prism touch six faces, the sides four
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::prism_faces(6, 10.0, 5.0));
    auto strips = BfsStripPlanner::plan(graph, 100.0);
    ASSERT_FALSE(strips.empty());
    EXPECT_EQ(strips[0].face(0).face_id, 0u);
}

TEST(BfsStripPlanner, NarrowTapeSplitsCubeIntoRows) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    auto strips = BfsStripPlanner::plan(graph, 20.2);

    // Only straight rows fit: a belt of four plus the two faces left over
    ASSERT_EQ(strips.size(), 3u);
    EXPECT_EQ(strips[0].size(), 4u);
    EXPECT_EQ(strips[1].size(), 1u);
    EXPECT_EQ(strips[2].size(), 1u);
    for (const auto& s : strips) {
        EXPECT_LE(s.ribbon_width(), 20.2 + kWidthTolerance);
        expect_tree_attachment(graph, s);
    }
    EXPECT_NO_THROW(UnfoldPipeline::verify(graph, strips, 20.2));
}

TEST(BfsStripPlanner, StripsAreNormalized) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::octahedron_faces(10.0));
    auto strips = BfsStripPlanner::plan(graph, 25.0);
    for (const auto& s : strips) {
        EXPECT_TRUE(s.is_normalized());
        Bounds2 b = s.bounds();
        EXPECT_NEAR(b.min_x, 0.0, 1e-9);
        EXPECT_NEAR(b.min_y, 0.0, 1e-9);
        EXPECT_NEAR(b.height(), s.ribbon_width(), 1e-6);
    }
    EXPECT_NO_THROW(UnfoldPipeline::verify(graph, strips, 25.0));
}

TEST(BfsStripPlanner, PartitionsManyFacedPrism) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::prism_faces(16, 30.0, 12.0));
    for (double tape : {60.0, 80.0, 120.0}) {
        auto strips = BfsStripPlanner::plan(graph, tape);
        EXPECT_NO_THROW(UnfoldPipeline::verify(graph, strips, tape)) << "tape " << tape;
    }
}

TEST(BfsStripPlanner, Deterministic) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::prism_faces(7, 15.0, 9.0));
    auto a = BfsStripPlanner::plan(graph, 30.0);
    auto b = BfsStripPlanner::plan(graph, 30.0);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].face_order(), b[i].face_order());
        EXPECT_EQ(a[i].polygons(), b[i].polygons());
    }
}

TEST(BfsStripPlanner, FaceWiderThanTapeThrows) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    try {
        BfsStripPlanner::plan(graph, 10.0);
        FAIL() << "expected TapeWidthError";
    } catch (const TapeWidthError& e) {
        EXPECT_EQ(e.face_id(), 0u);
    }
}

TEST(BfsStripPlanner, TapeExactlyFaceWidthFits) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    auto strips = BfsStripPlanner::plan(graph, 20.0);
    EXPECT_NO_THROW(UnfoldPipeline::verify(graph, strips, 20.0));
}

TEST(BfsStripPlanner, InvalidArguments) {
    AdjacencyGraph graph = AdjacencyGraph::from_faces(test::cube_faces(20.0));
    EXPECT_THROW(BfsStripPlanner::plan(graph, 0.0), std::invalid_argument);
    EXPECT_THROW(BfsStripPlanner::plan(graph, -5.0), std::invalid_argument);
    EXPECT_THROW(BfsStripPlanner::plan(AdjacencyGraph{}, 10.0), std::invalid_argument);
}

TEST(BfsStripPlanner, DegenerateHingeDefersFace) {
    // Two faces joined only by a zero-length hinge end up in separate strips
    AdjacencyGraph graph;
    auto faces = test::cube_faces(20.0);
    graph.add_face(faces[0]);
    graph.add_face(faces[2]);
    graph.add_edge(0, 1, Vec3(0, 0, 0), Vec3(0, 0, 0));

    auto strips = BfsStripPlanner::plan(graph, 100.0);
    EXPECT_EQ(strips.size(), 2u);
    EXPECT_NO_THROW(UnfoldPipeline::verify(graph, strips, 100.0));
}

TEST(BfsStripPlanner, OverlappingFaceStartsNewStrip) {
    // Flattened, the last triangle of the fan would cover the first
    AdjacencyGraph graph = test::right_angle_fan(5);
    auto strips = BfsStripPlanner::plan(graph, 100.0);

    ASSERT_EQ(strips.size(), 2u);
    std::vector<FaceId> first = strips[0].face_order();
    std::sort(first.begin(), first.end());
    EXPECT_EQ(first, (std::vector<FaceId>{0, 1, 2, 3}));
    EXPECT_EQ(strips[0].face(0).face_id, 1u);
    EXPECT_EQ(strips[1].face_order(), std::vector<FaceId>{4});

    OverlapChecker checker = OverlapChecker::for_graph(graph);
    for (const auto& s : strips) {
        EXPECT_TRUE(checker.strip_is_overlap_free(s));
        expect_tree_attachment(graph, s);
    }
    EXPECT_NO_THROW(UnfoldPipeline::verify(graph, strips, 100.0));
}

TEST(BfsStripPlanner, EdgeContactIsNotAnOverlap) {
    // Four quarter turns close the circle; first and last only touch
    AdjacencyGraph graph = test::right_angle_fan(4);
    auto strips = BfsStripPlanner::plan(graph, 100.0);

    ASSERT_EQ(strips.size(), 1u);
    EXPECT_EQ(strips[0].size(), 4u);
    EXPECT_NO_THROW(UnfoldPipeline::verify(graph, strips, 100.0));
}
