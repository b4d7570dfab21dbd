#ifndef WASHIWRAP_MESH_MESH_LOADER_HPP
#define WASHIWRAP_MESH_MESH_LOADER_HPP

#include "triangle_mesh.hpp"
#include <array>
#include <string>
#include <vector>

namespace washiwrap {

enum class MeshUnit {
    Millimetre,
    Inch
};

std::string to_string(MeshUnit unit);
MeshUnit parse_mesh_unit(const std::string& name);
double unit_scale(MeshUnit unit);

// Reads STL (ASCII or binary) and Wavefront OBJ into a welded triangle mesh
// in millimetres. Errors are reported as MeshLoadError.
class MeshLoader {
public:
    // Format by extension (.stl, .obj), case-insensitive
    static TriangleMesh load(const std::string& path, MeshUnit unit = MeshUnit::Millimetre);

    // Binary when the byte count matches the triangle count in the header
    static TriangleMesh parse_stl(const std::string& bytes, const std::string& source = "<memory>");
    static TriangleMesh parse_obj(const std::string& text, const std::string& source = "<memory>");

    static bool is_binary_stl(const std::string& bytes);

    // Merges coincident corners, drops collapsed and repeated triangles
    static TriangleMesh weld(const std::vector<std::array<Vec3, 3>>& soup);
};

}  // namespace washiwrap

#endif // WASHIWRAP_MESH_MESH_LOADER_HPP
