#ifndef WASHIWRAP_SERIALIZATION_CONFIG_JSON_HPP
#define WASHIWRAP_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <math/transform2.hpp>
#include <mesh/facet_extractor.hpp>
#include <mesh/mesh_loader.hpp>
#include <layout/layout_packer.hpp>
#include <unfold/hamiltonian_planner.hpp>
#include <unfold/unfold_pipeline.hpp>
#include <pipeline/wrap_pipeline.hpp>

namespace washiwrap {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
    v.z = j.at(2).get<double>();
}

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
}

// Transform2 as a row-major 2x3 matrix
inline void to_json(nlohmann::json& j, const Transform2& t) {
    j = nlohmann::json::array({
        nlohmann::json::array({t.m00, t.m01, t.translation.x}),
        nlohmann::json::array({t.m10, t.m11, t.translation.y})
    });
}

NLOHMANN_JSON_SERIALIZE_ENUM(UnfoldMode, {
    {UnfoldMode::Bfs, "bfs"},
    {UnfoldMode::Hamiltonian, "hamiltonian"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(MeshUnit, {
    {MeshUnit::Millimetre, "mm"},
    {MeshUnit::Inch, "inch"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(SearchFailureReason, {
    {SearchFailureReason::DeadlineExceeded, "deadline_exceeded"},
    {SearchFailureReason::BeamExhausted, "beam_exhausted"},
    {SearchFailureReason::Infeasible, "infeasible"},
})

// HamiltonianConfig serialization
inline void to_json(nlohmann::json& j, const HamiltonianConfig& config) {
    j = {
        {"beam_width", config.beam_width},
        {"timeout_seconds", config.timeout_seconds},
        {"connectivity_weight", config.connectivity_weight},
        {"num_threads", config.num_threads}
    };
}

inline void from_json(const nlohmann::json& j, HamiltonianConfig& config) {
    HamiltonianConfig defaults;
    config.beam_width = j.value("beam_width", defaults.beam_width);
    config.timeout_seconds = j.value("timeout_seconds", defaults.timeout_seconds);
    config.connectivity_weight = j.value("connectivity_weight", defaults.connectivity_weight);
    config.num_threads = j.value("num_threads", defaults.num_threads);
}

// UnfoldConfig serialization
inline void to_json(nlohmann::json& j, const UnfoldConfig& config) {
    j = {
        {"mode", config.mode},
        {"tape_width", config.tape_width},
        {"hamiltonian", config.hamiltonian},
        {"fallback_enabled", config.fallback_enabled}
    };
}

inline void from_json(const nlohmann::json& j, UnfoldConfig& config) {
    UnfoldConfig defaults;
    config.mode = j.value("mode", defaults.mode);
    config.tape_width = j.value("tape_width", defaults.tape_width);
    if (j.contains("hamiltonian")) {
        config.hamiltonian = j["hamiltonian"].get<HamiltonianConfig>();
    }
    config.fallback_enabled = j.value("fallback_enabled", defaults.fallback_enabled);
}

// LayoutConfig serialization
inline void to_json(nlohmann::json& j, const LayoutConfig& config) {
    j = {
        {"shrink", config.shrink},
        {"gap", config.gap},
        {"margin", config.margin},
        {"duplicates", config.duplicates},
        {"max_sheet_width", config.max_sheet_width},
        {"max_sheet_height", config.max_sheet_height}
    };
}

inline void from_json(const nlohmann::json& j, LayoutConfig& config) {
    LayoutConfig defaults;
    config.shrink = j.value("shrink", defaults.shrink);
    config.gap = j.value("gap", defaults.gap);
    config.margin = j.value("margin", defaults.margin);
    config.duplicates = j.value("duplicates", defaults.duplicates);
    config.max_sheet_width = j.value("max_sheet_width", defaults.max_sheet_width);
    config.max_sheet_height = j.value("max_sheet_height", defaults.max_sheet_height);
}

// FacetConfig serialization
inline void to_json(nlohmann::json& j, const FacetConfig& config) {
    j = {
        {"normal_tolerance", config.normal_tolerance},
        {"plane_tolerance", config.plane_tolerance}
    };
}

inline void from_json(const nlohmann::json& j, FacetConfig& config) {
    FacetConfig defaults;
    config.normal_tolerance = j.value("normal_tolerance", defaults.normal_tolerance);
    config.plane_tolerance = j.value("plane_tolerance", defaults.plane_tolerance);
}

// WrapConfig serialization
inline void to_json(nlohmann::json& j, const WrapConfig& config) {
    j = {
        {"unit", config.unit},
        {"facets", config.facets},
        {"unfold", config.unfold},
        {"layout", config.layout}
    };
}

inline void from_json(const nlohmann::json& j, WrapConfig& config) {
    WrapConfig defaults;
    config.unit = j.value("unit", defaults.unit);
    if (j.contains("facets")) {
        config.facets = j["facets"].get<FacetConfig>();
    }
    if (j.contains("unfold")) {
        config.unfold = j["unfold"].get<UnfoldConfig>();
    }
    if (j.contains("layout")) {
        config.layout = j["layout"].get<LayoutConfig>();
    }
}

}  // namespace washiwrap

#endif // WASHIWRAP_SERIALIZATION_CONFIG_JSON_HPP
