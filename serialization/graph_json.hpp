#ifndef WASHIWRAP_SERIALIZATION_GRAPH_JSON_HPP
#define WASHIWRAP_SERIALIZATION_GRAPH_JSON_HPP

#include <nlohmann/json.hpp>
#include <unfold/adjacency_graph.hpp>
#include <unfold/face.hpp>
#include "config_json.hpp"

namespace washiwrap {

// Face serialization (3D loop, normal and local polygon)
inline void to_json(nlohmann::json& j, const Face& face) {
    j["id"] = face.id;
    j["vertices"] = face.vertices;
    j["normal"] = face.normal;
    j["local"] = face.local;
    j["area"] = face.area;
}

// AdjacencyEdge serialization
inline void to_json(nlohmann::json& j, const AdjacencyEdge& edge) {
    j["id"] = edge.id;
    j["face_a"] = edge.face_a;
    j["face_b"] = edge.face_b;
    j["p0"] = edge.p0;
    j["p1"] = edge.p1;
    j["dihedral_angle"] = edge.dihedral_angle;
}

// AdjacencyGraph serialization
inline nlohmann::json adjacency_graph_to_json(const AdjacencyGraph& graph) {
    nlohmann::json j;
    j["faces"] = graph.faces();
    j["edges"] = graph.edges();
    return j;
}

// AdjacencyGraph deserialization
// Faces are re-added in order so their ids are preserved; frames and
// dihedral angles are recomputed rather than read.
inline AdjacencyGraph adjacency_graph_from_json(const nlohmann::json& j) {
    AdjacencyGraph graph;

    for (const auto& face_j : j.at("faces")) {
        FaceInput input;
        input.points = face_j.at("vertices").get<std::vector<Vec3>>();
        input.normal = face_j.value("normal", Vec3{});
        graph.add_face(input);
    }

    for (const auto& edge_j : j.at("edges")) {
        graph.add_edge(edge_j.at("face_a").get<FaceId>(),
                       edge_j.at("face_b").get<FaceId>(),
                       edge_j.at("p0").get<Vec3>(),
                       edge_j.at("p1").get<Vec3>());
    }

    return graph;
}

inline nlohmann::json adjacency_graph_stats(const AdjacencyGraph& graph) {
    return {
        {"face_count", graph.face_count()},
        {"edge_count", graph.edge_count()},
        {"connected", graph.is_connected()},
        {"scale", graph.scale()},
        {"mean_edge_length", graph.mean_edge_length()}
    };
}

}  // namespace washiwrap

#endif // WASHIWRAP_SERIALIZATION_GRAPH_JSON_HPP
