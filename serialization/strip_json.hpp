#ifndef WASHIWRAP_SERIALIZATION_STRIP_JSON_HPP
#define WASHIWRAP_SERIALIZATION_STRIP_JSON_HPP

#include <nlohmann/json.hpp>
#include <algorithm>
#include <unfold/strip.hpp>
#include <unfold/unfold_pipeline.hpp>
#include "config_json.hpp"

namespace washiwrap {

// PlacedFace serialization
inline void to_json(nlohmann::json& j, const PlacedFace& placed) {
    j["face_id"] = placed.face_id;
    j["via_edge"] = placed.via_edge == kNoAdjacency ? nlohmann::json(nullptr) : nlohmann::json(placed.via_edge);
    j["parent"] = placed.parent == kNoFace ? nlohmann::json(nullptr) : nlohmann::json(placed.parent);
    j["transform"] = placed.transform;
    j["polygon"] = placed.polygon;
}

// Strip serialization
inline void to_json(nlohmann::json& j, const Strip& strip) {
    j["ribbon_width"] = strip.ribbon_width();
    j["length"] = strip.length();
    j["face_order"] = strip.face_order();
    j["faces"] = strip.faces();
}

// SearchFailure serialization
inline void to_json(nlohmann::json& j, const SearchFailure& failure) {
    j = {
        {"reason", failure.reason},
        {"message", failure.message},
        {"depth_reached", failure.depth_reached},
        {"states_expanded", failure.states_expanded},
        {"elapsed_seconds", failure.elapsed_seconds}
    };
}

// UnfoldOutcome serialization
inline nlohmann::json unfold_outcome_to_json(const UnfoldOutcome& outcome) {
    nlohmann::json j;
    j["used_mode"] = outcome.used_mode;
    j["strips"] = outcome.strips;
    if (outcome.search_failure) {
        j["search_failure"] = *outcome.search_failure;
    }
    return j;
}

inline nlohmann::json unfold_outcome_stats(const UnfoldOutcome& outcome) {
    double widest = 0.0;
    for (const auto& s : outcome.strips) {
        widest = std::max(widest, s.ribbon_width());
    }
    return {
        {"strip_count", outcome.strips.size()},
        {"used_mode", outcome.used_mode},
        {"fell_back", outcome.fell_back()},
        {"widest_strip", widest}
    };
}

}  // namespace washiwrap

#endif // WASHIWRAP_SERIALIZATION_STRIP_JSON_HPP
