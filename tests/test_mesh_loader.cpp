#include <gtest/gtest.h>
#include <mesh/mesh_loader.hpp>
#include <common/errors.hpp>
#include "test_helpers.hpp"
#include <algorithm>
#include <cstring>

using namespace washiwrap;

namespace {

std::string to_binary_stl(const TriangleMesh& mesh) {
    std::string bytes(80, ' ');
    uint32_t count = static_cast<uint32_t>(mesh.triangles.size());
    for (int i = 0; i < 4; ++i) {
        bytes.push_back(static_cast<char>((count >> (8 * i)) & 0xff));
    }
    auto put_float = [&](float f) {
        uint32_t bits = 0;
        std::memcpy(&bits, &f, 4);
        for (int i = 0; i < 4; ++i) {
            bytes.push_back(static_cast<char>((bits >> (8 * i)) & 0xff));
        }
    };
    for (const auto& tri : mesh.triangles) {
        put_float(0.0f);
        put_float(0.0f);
        put_float(0.0f);
        for (VertexId v : tri) {
            const Vec3& p = mesh.vertices[v];
            put_float(static_cast<float>(p.x));
            put_float(static_cast<float>(p.y));
            put_float(static_cast<float>(p.z));
        }
        bytes.append(2, '\0');
    }
    return bytes;
}

}  // namespace

TEST(MeshLoader, Units) {
    EXPECT_EQ(parse_mesh_unit("mm"), MeshUnit::Millimetre);
    EXPECT_EQ(parse_mesh_unit("INCH"), MeshUnit::Inch);
    EXPECT_EQ(parse_mesh_unit("in"), MeshUnit::Inch);
    EXPECT_THROW(parse_mesh_unit("furlong"), std::invalid_argument);
    EXPECT_DOUBLE_EQ(unit_scale(MeshUnit::Inch), 25.4);
    EXPECT_EQ(to_string(MeshUnit::Millimetre), "mm");
}

TEST(MeshLoader, AsciiStlIsWelded) {
    TriangleMesh mesh = MeshLoader::parse_stl(test::to_ascii_stl(test::cube_mesh(20.0)));
    EXPECT_EQ(mesh.vertex_count(), 8u);
    EXPECT_EQ(mesh.triangle_count(), 12u);
}

TEST(MeshLoader, BinaryStl) {
    std::string bytes = to_binary_stl(test::cube_mesh(20.0));
    ASSERT_TRUE(MeshLoader::is_binary_stl(bytes));
    EXPECT_FALSE(MeshLoader::is_binary_stl(test::to_ascii_stl(test::cube_mesh(20.0))));

    TriangleMesh mesh = MeshLoader::parse_stl(bytes);
    EXPECT_EQ(mesh.vertex_count(), 8u);
    EXPECT_EQ(mesh.triangle_count(), 12u);
    EXPECT_NEAR(mesh.extent(), 20.0 * std::sqrt(3.0), 1e-4);
}

TEST(MeshLoader, BinaryStlIsLittleEndian) {
    // One facet: zero normal, corners (1, 0, 0), (0, 2, 0), (0, 0, -0.5)
    std::string bytes(80, ' ');
    bytes += std::string("\x01\x00\x00\x00", 4);
    bytes += std::string(12, '\0');
    bytes += std::string("\x00\x00\x80\x3f", 4) + std::string(8, '\0');
    bytes += std::string(4, '\0') + std::string("\x00\x00\x00\x40", 4) + std::string(4, '\0');
    bytes += std::string(8, '\0') + std::string("\x00\x00\x00\xbf", 4);
    bytes += std::string(2, '\0');
    ASSERT_EQ(bytes.size(), 134u);

    TriangleMesh mesh = MeshLoader::parse_stl(bytes);
    ASSERT_EQ(mesh.triangle_count(), 1u);
    ASSERT_EQ(mesh.vertex_count(), 3u);
    for (const Vec3& corner : {Vec3(1.0, 0.0, 0.0), Vec3(0.0, 2.0, 0.0), Vec3(0.0, 0.0, -0.5)}) {
        EXPECT_NE(std::find(mesh.vertices.begin(), mesh.vertices.end(), corner), mesh.vertices.end())
            << corner.x << "," << corner.y << "," << corner.z;
    }
}

TEST(MeshLoader, AsciiStlErrors) {
    EXPECT_THROW(MeshLoader::parse_stl("not a mesh at all"), MeshLoadError);
    EXPECT_THROW(MeshLoader::parse_stl("solid empty\nendsolid empty\n"), MeshLoadError);

    std::string two_corners =
        "solid bad\n"
        "facet normal 0 0 1\n"
        "outer loop\n"
        "vertex 0 0 0\n"
        "vertex 1 0 0\n"
        "endloop\n"
        "endfacet\n"
        "endsolid bad\n";
    try {
        MeshLoader::parse_stl(two_corners, "bad.stl");
        FAIL() << "expected MeshLoadError";
    } catch (const MeshLoadError& e) {
        EXPECT_NE(std::string(e.what()).find("bad.stl:6:"), std::string::npos);
    }
}

TEST(MeshLoader, ObjFaceForms) {
    std::string obj =
        "# unit square pyramid\n"
        "o pyramid\n"
        "v 0 0 0\n"
        "v 10 0 0\n"
        "v 10 10 0\n"
        "v 0 10 0\n"
        "v 5 5 8\n"
        "vt 0 0\n"
        "vn 0 0 1\n"
        "f 4 3 2 1\n"
        "f 1/1/1 2/1/1 5/1/1\n"
        "f 2//1 3//1 5//1\n"
        "f -3 -2 -1   # 3 4 5\n"
        "f 4 1 5\n";
    TriangleMesh mesh = MeshLoader::parse_obj(obj);
    EXPECT_EQ(mesh.vertex_count(), 5u);
    EXPECT_EQ(mesh.triangle_count(), 6u);
}

TEST(MeshLoader, ObjIndexOutOfRange) {
    std::string obj =
        "v 0 0 0\n"
        "v 1 0 0\n"
        "v 0 1 0\n"
        "f 1 2 9\n";
    try {
        MeshLoader::parse_obj(obj, "bad.obj");
        FAIL() << "expected MeshLoadError";
    } catch (const MeshLoadError& e) {
        EXPECT_NE(std::string(e.what()).find("bad.obj:4:"), std::string::npos);
    }
    EXPECT_THROW(MeshLoader::parse_obj("v 0 0 0\nf 0 1 2\n"), MeshLoadError);
    EXPECT_THROW(MeshLoader::parse_obj("v 0 0 x\n"), MeshLoadError);
    EXPECT_THROW(MeshLoader::parse_obj("v 0 0 0\n"), MeshLoadError);
}

TEST(MeshLoader, WeldDropsCollapsedAndRepeated) {
    Vec3 a{0, 0, 0};
    Vec3 b{10, 0, 0};
    Vec3 c{0, 10, 0};
    Vec3 d{0, 0, 10};
    std::vector<std::array<Vec3, 3>> soup = {
        {a, b, c},
        {c, a, b},                       // same triangle, rotated
        {a, b, Vec3{10, 1e-12, 0}},      // collapses onto b
        {a, c, d},
    };
    TriangleMesh mesh = MeshLoader::weld(soup);
    EXPECT_EQ(mesh.triangle_count(), 2u);
    EXPECT_EQ(mesh.vertex_count(), 4u);
}

TEST(MeshLoader, LoadFromFileWithUnits) {
    test::TempFile stl("loader_cube.stl");
    stl.write(test::to_ascii_stl(test::cube_mesh(1.0)));
    TriangleMesh mm = MeshLoader::load(stl.path());
    TriangleMesh inch = MeshLoader::load(stl.path(), MeshUnit::Inch);
    EXPECT_NEAR(inch.extent(), 25.4 * mm.extent(), 1e-9);

    test::TempFile obj("loader_cube.OBJ");
    obj.write(test::to_obj(test::cube_mesh(20.0)));
    EXPECT_EQ(MeshLoader::load(obj.path()).triangle_count(), 12u);
}

TEST(MeshLoader, LoadErrors) {
    EXPECT_THROW(MeshLoader::load("/nonexistent/cube.stl"), MeshLoadError);

    test::TempFile ply("loader_cube.ply");
    ply.write("ply\n");
    try {
        MeshLoader::load(ply.path());
        FAIL() << "expected MeshLoadError";
    } catch (const MeshLoadError& e) {
        EXPECT_NE(std::string(e.what()).find("unsupported format"), std::string::npos);
    }
}
