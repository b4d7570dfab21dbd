#include <gtest/gtest.h>
#include <pipeline/wrap_pipeline.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"

using namespace washiwrap;

namespace {

WrapConfig config_with_tape(double tape_width) {
    WrapConfig config;
    config.unfold.tape_width = tape_width;
    return config;
}

}  // namespace

TEST(WrapPipeline, CubeMeshToLayout) {
    WrapResult result = WrapPipeline::run(test::cube_mesh(20.0), config_with_tape(20.2));

    EXPECT_EQ(result.graph.face_count(), 6u);
    EXPECT_EQ(result.graph.edge_count(), 12u);
    EXPECT_EQ(result.unfold.used_mode, UnfoldMode::Bfs);
    EXPECT_EQ(result.layout.polygons.size(), 6u);
    EXPECT_EQ(result.layout.strip_count, result.unfold.strips.size());
    EXPECT_NEAR(result.layout.sheet_height, 22.2, 1e-9);
}

TEST(WrapPipeline, HamiltonianEndToEnd) {
    WrapConfig config = config_with_tape(60.0);
    config.unfold.mode = UnfoldMode::Hamiltonian;
    config.layout.duplicates = 2;

    WrapResult result = WrapPipeline::run(test::cube_faces(20.0), config);
    EXPECT_EQ(result.unfold.used_mode, UnfoldMode::Hamiltonian);
    EXPECT_EQ(result.unfold.strips.size(), 1u);
    EXPECT_EQ(result.layout.polygons.size(), 12u);
}

TEST(WrapPipeline, RunFromFile) {
    test::TempFile file("pipeline_cube.stl");
    file.write(test::to_ascii_stl(test::cube_mesh(20.0)));

    WrapResult result = WrapPipeline::run_file(file.path(), config_with_tape(60.0));
    EXPECT_EQ(result.graph.face_count(), 6u);

    AdjacencyGraph graph = WrapPipeline::build_graph(file.path(), WrapConfig{});
    EXPECT_EQ(graph.face_count(), 6u);
    EXPECT_TRUE(graph.is_connected());
}

TEST(WrapPipeline, InchUnitsScaleTheTape) {
    test::TempFile file("pipeline_inch_cube.stl");
    file.write(test::to_ascii_stl(test::cube_mesh(1.0)));

    WrapConfig mm = config_with_tape(20.0);
    EXPECT_NO_THROW(WrapPipeline::run_file(file.path(), mm));

    WrapConfig inch = mm;
    inch.unit = MeshUnit::Inch;
    EXPECT_THROW(WrapPipeline::run_file(file.path(), inch), TapeWidthError);
}

TEST(WrapPipeline, ValidateRejectsBadValues) {
    EXPECT_THROW(WrapConfig{}.validate(), std::invalid_argument);
    EXPECT_NO_THROW(config_with_tape(10.0).validate());

    WrapConfig beam = config_with_tape(10.0);
    beam.unfold.hamiltonian.beam_width = 0;
    EXPECT_THROW(beam.validate(), std::invalid_argument);

    WrapConfig timeout = config_with_tape(10.0);
    timeout.unfold.hamiltonian.timeout_seconds = -0.5;
    EXPECT_THROW(timeout.validate(), std::invalid_argument);

    WrapConfig threads = config_with_tape(10.0);
    threads.unfold.hamiltonian.num_threads = -2;
    EXPECT_THROW(threads.validate(), std::invalid_argument);

    WrapConfig margin = config_with_tape(10.0);
    margin.layout.margin = -1.0;
    EXPECT_THROW(margin.validate(), std::invalid_argument);

    EXPECT_THROW(WrapPipeline::run(test::cube_mesh(20.0), WrapConfig{}), std::invalid_argument);
}

TEST(WrapPipeline, SheetLimitsAreEnforced) {
    WrapConfig config = config_with_tape(20.2);
    config.layout.max_sheet_width = 100.0;
    EXPECT_THROW(WrapPipeline::run(test::cube_mesh(20.0), config), LayoutOverflowError);
}

TEST(WrapPipeline, NarrowTapeReportsFace) {
    try {
        WrapPipeline::run(test::cube_mesh(20.0), config_with_tape(10.0));
        FAIL() << "expected TapeWidthError";
    } catch (const TapeWidthError& e) {
        EXPECT_NEAR(e.tape_width(), 10.0, 1e-12);
        EXPECT_NEAR(e.face_width(), 20.0, 1e-6);
    }
}

TEST(WrapPipeline, OpenSurfaceIsMalformed) {
    auto faces = test::cube_faces(20.0);
    faces.pop_back();
    EXPECT_THROW(WrapPipeline::run(faces, config_with_tape(30.0)), MalformedMeshError);
}
