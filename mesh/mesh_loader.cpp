#include "mesh_loader.hpp"
#include "vertex_welder.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace washiwrap {

namespace {

constexpr size_t kStlHeaderSize = 80;
constexpr size_t kStlTriangleSize = 50;

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string extension_of(const std::string& path) {
    size_t dot_pos = path.find_last_of('.');
    size_t slash_pos = path.find_last_of('/');
    if (dot_pos == std::string::npos ||
        (slash_pos != std::string::npos && dot_pos < slash_pos)) {
        return "";
    }
    return lowercase(path.substr(dot_pos));
}

std::string read_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw MeshLoadError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string at_line(const std::string& source, size_t line) {
    return source + ":" + std::to_string(line) + ": ";
}

double parse_number(const std::string& token, const std::string& source, size_t line) {
    try {
        size_t used = 0;
        double value = std::stod(token, &used);
        if (used != token.size()) {
            throw std::invalid_argument(token);
        }
        return value;
    } catch (const std::exception&) {
        throw MeshLoadError(at_line(source, line) + "invalid number '" + token + "'");
    }
}

uint32_t read_u32(const std::string& bytes, size_t offset) {
    const auto* b = reinterpret_cast<const unsigned char*>(bytes.data() + offset);
    return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
           (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
}

// Little-endian IEEE 754 single, independent of host byte order
float read_float(const std::string& bytes, size_t offset) {
    uint32_t bits = read_u32(bytes, offset);
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::vector<std::array<Vec3, 3>> parse_binary_stl(const std::string& bytes) {
    uint32_t count = read_u32(bytes, kStlHeaderSize);
    std::vector<std::array<Vec3, 3>> soup;
    soup.reserve(count);
    for (uint32_t t = 0; t < count; ++t) {
        // Skip the stored normal, it is recomputed from the winding
        size_t base = kStlHeaderSize + 4 + static_cast<size_t>(t) * kStlTriangleSize + 12;
        std::array<Vec3, 3> tri;
        for (size_t k = 0; k < 3; ++k) {
            size_t off = base + k * 12;
            tri[k] = {read_float(bytes, off), read_float(bytes, off + 4), read_float(bytes, off + 8)};
        }
        soup.push_back(tri);
    }
    return soup;
}

std::vector<std::array<Vec3, 3>> parse_ascii_stl(const std::string& text, const std::string& source) {
    std::vector<std::array<Vec3, 3>> soup;
    std::vector<Vec3> corners;
    bool saw_solid = false;

    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::istringstream ls(line);
        std::string keyword;
        if (!(ls >> keyword)) continue;
        keyword = lowercase(keyword);

        if (keyword == "solid") {
            saw_solid = true;
        } else if (keyword == "vertex") {
            std::string xs, ys, zs;
            if (!(ls >> xs >> ys >> zs)) {
                throw MeshLoadError(at_line(source, line_no) + "vertex needs three coordinates");
            }
            corners.push_back({parse_number(xs, source, line_no),
                               parse_number(ys, source, line_no),
                               parse_number(zs, source, line_no)});
        } else if (keyword == "endloop") {
            if (corners.size() != 3) {
                throw MeshLoadError(at_line(source, line_no) + "facet has " +
                                    std::to_string(corners.size()) + " vertices, expected 3");
            }
            soup.push_back({corners[0], corners[1], corners[2]});
            corners.clear();
        }
    }

    if (!saw_solid) {
        throw MeshLoadError(source + ": not an STL file (no 'solid' header)");
    }
    if (!corners.empty()) {
        throw MeshLoadError(source + ": unterminated facet at end of file");
    }
    return soup;
}

// "12", "12/4", "12//7", "-3/1/2" -> 0-based vertex index
size_t parse_obj_index(const std::string& token, size_t vertex_count,
                       const std::string& source, size_t line) {
    std::string head = token.substr(0, token.find('/'));
    long long idx = 0;
    try {
        size_t used = 0;
        idx = std::stoll(head, &used);
        if (used != head.size()) {
            throw std::invalid_argument(head);
        }
    } catch (const std::exception&) {
        throw MeshLoadError(at_line(source, line) + "invalid face index '" + token + "'");
    }

    long long resolved = idx > 0 ? idx - 1 : static_cast<long long>(vertex_count) + idx;
    if (idx == 0 || resolved < 0 || resolved >= static_cast<long long>(vertex_count)) {
        throw MeshLoadError(at_line(source, line) + "face index " + head + " out of range (" +
                            std::to_string(vertex_count) + " vertices)");
    }
    return static_cast<size_t>(resolved);
}

}  // namespace

std::string to_string(MeshUnit unit) {
    switch (unit) {
        case MeshUnit::Millimetre: return "mm";
        case MeshUnit::Inch: return "inch";
    }
    return "unknown";
}

MeshUnit parse_mesh_unit(const std::string& name) {
    std::string n = lowercase(name);
    if (n == "mm") return MeshUnit::Millimetre;
    if (n == "inch" || n == "in") return MeshUnit::Inch;
    throw std::invalid_argument("Unknown mesh unit: " + name + " (expected mm or inch)");
}

double unit_scale(MeshUnit unit) {
    return unit == MeshUnit::Inch ? 25.4 : 1.0;
}

bool MeshLoader::is_binary_stl(const std::string& bytes) {
    if (bytes.size() < kStlHeaderSize + 4) {
        return false;
    }
    uint64_t count = read_u32(bytes, kStlHeaderSize);
    return bytes.size() == kStlHeaderSize + 4 + count * kStlTriangleSize;
}

TriangleMesh MeshLoader::load(const std::string& path, MeshUnit unit) {
    auto log = washiwrap::logging::get_logger();

    std::string ext = extension_of(path);
    TriangleMesh mesh;
    if (ext == ".stl") {
        mesh = parse_stl(read_bytes(path), path);
    } else if (ext == ".obj") {
        mesh = parse_obj(read_bytes(path), path);
    } else {
        throw MeshLoadError(path + ": unsupported format '" + ext + "' (expected .stl or .obj)");
    }

    double scale = unit_scale(unit);
    if (scale != 1.0) {
        for (auto& v : mesh.vertices) {
            v *= scale;
        }
    }

    log->info("Loaded {}: {} vertices, {} triangles ({})",
              path, mesh.vertex_count(), mesh.triangle_count(), to_string(unit));
    return mesh;
}

TriangleMesh MeshLoader::parse_stl(const std::string& bytes, const std::string& source) {
    auto log = washiwrap::logging::get_logger();

    std::vector<std::array<Vec3, 3>> soup;
    if (is_binary_stl(bytes)) {
        log->debug("{}: binary STL", source);
        soup = parse_binary_stl(bytes);
    } else {
        log->debug("{}: ASCII STL", source);
        soup = parse_ascii_stl(bytes, source);
    }
    if (soup.empty()) {
        throw MeshLoadError(source + ": no triangles");
    }
    return weld(soup);
}

TriangleMesh MeshLoader::parse_obj(const std::string& text, const std::string& source) {
    std::vector<Vec3> positions;
    std::vector<std::array<Vec3, 3>> soup;

    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        std::istringstream ls(line);
        std::string keyword;
        if (!(ls >> keyword)) continue;

        if (keyword == "v") {
            std::string xs, ys, zs;
            if (!(ls >> xs >> ys >> zs)) {
                throw MeshLoadError(at_line(source, line_no) + "vertex needs three coordinates");
            }
            positions.push_back({parse_number(xs, source, line_no),
                                 parse_number(ys, source, line_no),
                                 parse_number(zs, source, line_no)});
        } else if (keyword == "f") {
            std::vector<size_t> loop;
            std::string token;
            while (ls >> token) {
                loop.push_back(parse_obj_index(token, positions.size(), source, line_no));
            }
            if (loop.size() < 3) {
                throw MeshLoadError(at_line(source, line_no) + "face needs at least 3 vertices");
            }
            // Fan triangulation, faces are convex
            for (size_t k = 1; k + 1 < loop.size(); ++k) {
                soup.push_back({positions[loop[0]], positions[loop[k]], positions[loop[k + 1]]});
            }
        }
        // vt, vn, o, g, s, usemtl, mtllib: not needed for the shell
    }

    if (soup.empty()) {
        throw MeshLoadError(source + ": no faces");
    }
    return weld(soup);
}

TriangleMesh MeshLoader::weld(const std::vector<std::array<Vec3, 3>>& soup) {
    auto log = washiwrap::logging::get_logger();

    TriangleMesh raw;
    for (const auto& tri : soup) {
        raw.vertices.insert(raw.vertices.end(), tri.begin(), tri.end());
    }
    VertexWelder welder(std::max(1e-9, 1e-6 * raw.extent()));

    TriangleMesh mesh;
    std::set<std::array<VertexId, 3>> seen;
    size_t collapsed = 0;
    size_t repeated = 0;
    for (const auto& tri : soup) {
        std::array<VertexId, 3> ids = {welder.insert(tri[0]), welder.insert(tri[1]), welder.insert(tri[2])};
        if (ids[0] == ids[1] || ids[1] == ids[2] || ids[0] == ids[2]) {
            ++collapsed;
            continue;
        }
        std::array<VertexId, 3> key = ids;
        std::sort(key.begin(), key.end());
        if (!seen.insert(key).second) {
            ++repeated;
            continue;
        }
        mesh.triangles.push_back(ids);
    }
    mesh.vertices = welder.points();

    if (collapsed > 0 || repeated > 0) {
        log->debug("Weld: dropped {} collapsed and {} repeated triangle(s)", collapsed, repeated);
    }
    return mesh;
}

}  // namespace washiwrap
