#ifndef WASHIWRAP_SERIALIZATION_LAYOUT_JSON_HPP
#define WASHIWRAP_SERIALIZATION_LAYOUT_JSON_HPP

#include <nlohmann/json.hpp>
#include <layout/layout_packer.hpp>
#include <layout/strip_outline.hpp>
#include <map>
#include <utility>
#include "config_json.hpp"

namespace washiwrap {

// LayoutPolygon serialization
inline void to_json(nlohmann::json& j, const LayoutPolygon& polygon) {
    j["face_id"] = polygon.face_id;
    j["strip"] = polygon.strip_index;
    j["copy"] = polygon.copy_index;
    j["points"] = polygon.points;
}

inline void from_json(const nlohmann::json& j, LayoutPolygon& polygon) {
    polygon.face_id = j.at("face_id").get<FaceId>();
    polygon.strip_index = j.value("strip", size_t{0});
    polygon.copy_index = j.value("copy", size_t{0});
    polygon.points = j.at("points").get<Polygon2>();
}

// LayoutOutline serialization
inline void to_json(nlohmann::json& j, const LayoutOutline& outline) {
    j["strip"] = outline.strip_index;
    j["copy"] = outline.copy_index;
    j["loops"] = outline.loops;
}

inline void from_json(const nlohmann::json& j, LayoutOutline& outline) {
    outline.strip_index = j.value("strip", size_t{0});
    outline.copy_index = j.value("copy", size_t{0});
    outline.loops = j.at("loops").get<std::vector<Polygon2>>();
}

// Rebuilds cut outlines from the face polygons, one per (copy, strip)
inline std::vector<LayoutOutline> outlines_from_polygons(const std::vector<LayoutPolygon>& polygons) {
    std::map<std::pair<size_t, size_t>, std::vector<Polygon2>> grouped;
    for (const auto& p : polygons) {
        grouped[{p.copy_index, p.strip_index}].push_back(p.points);
    }
    std::vector<LayoutOutline> outlines;
    for (const auto& [key, faces] : grouped) {
        LayoutOutline outline;
        outline.copy_index = key.first;
        outline.strip_index = key.second;
        outline.loops = outline_loops(faces);
        outlines.push_back(std::move(outline));
    }
    return outlines;
}

// Layout serialization
inline nlohmann::json layout_to_json(const Layout& layout) {
    nlohmann::json j;
    j["sheet_width"] = layout.sheet_width;
    j["sheet_height"] = layout.sheet_height;
    j["copy_width"] = layout.copy_width;
    j["strip_count"] = layout.strip_count;
    j["copy_count"] = layout.copy_count;
    j["polygons"] = layout.polygons;
    j["outlines"] = layout.outlines;
    return j;
}

inline Layout layout_from_json(const nlohmann::json& j) {
    Layout layout;
    layout.sheet_width = j.at("sheet_width").get<double>();
    layout.sheet_height = j.at("sheet_height").get<double>();
    layout.copy_width = j.value("copy_width", 0.0);
    layout.strip_count = j.value("strip_count", size_t{0});
    layout.copy_count = j.value("copy_count", size_t{1});
    layout.polygons = j.at("polygons").get<std::vector<LayoutPolygon>>();
    if (j.contains("outlines")) {
        layout.outlines = j.at("outlines").get<std::vector<LayoutOutline>>();
    } else {
        layout.outlines = outlines_from_polygons(layout.polygons);
    }
    return layout;
}

}  // namespace washiwrap

#endif // WASHIWRAP_SERIALIZATION_LAYOUT_JSON_HPP
