#include "wrap_pipeline.hpp"
#include <common/logging.hpp>
#include <stdexcept>

namespace washiwrap {

void WrapConfig::validate() const {
    if (!(unfold.tape_width > 0.0)) {
        throw std::invalid_argument("tape width must be positive");
    }
    if (unfold.hamiltonian.beam_width < 1) {
        throw std::invalid_argument("beam width must be at least 1");
    }
    if (unfold.hamiltonian.timeout_seconds < 0.0) {
        throw std::invalid_argument("Hamiltonian timeout must not be negative");
    }
    if (unfold.hamiltonian.connectivity_weight < 0.0) {
        throw std::invalid_argument("connectivity weight must not be negative");
    }
    if (unfold.hamiltonian.num_threads < 0) {
        throw std::invalid_argument("thread count must not be negative");
    }
    if (facets.normal_tolerance < 0.0 || facets.plane_tolerance < 0.0) {
        throw std::invalid_argument("facet tolerances must not be negative");
    }
    LayoutPacker::validate(layout);
}

WrapResult WrapPipeline::run(const std::vector<FaceInput>& faces, const WrapConfig& config) {
    auto log = washiwrap::logging::get_logger();

    config.validate();

    log->debug("Stage 1: Building adjacency graph");
    WrapResult result;
    result.graph = AdjacencyGraph::from_faces(faces);
    log->debug("Built adjacency graph with {} faces, {} edges",
               result.graph.face_count(), result.graph.edge_count());

    log->debug("Stage 2: Unfolding ({})", to_string(config.unfold.mode));
    result.unfold = UnfoldPipeline::run(result.graph, config.unfold);
    log->debug("Unfolded into {} strip(s) using {}",
               result.unfold.strips.size(), to_string(result.unfold.used_mode));

    log->debug("Stage 3: Packing layout");
    result.layout = LayoutPacker::pack(result.unfold.strips, config.unfold.tape_width, config.layout);

    return result;
}

WrapResult WrapPipeline::run(const TriangleMesh& mesh, const WrapConfig& config) {
    config.validate();
    return run(extract_facets(mesh, config.facets), config);
}

WrapResult WrapPipeline::run_file(const std::string& path, const WrapConfig& config) {
    config.validate();
    return run(MeshLoader::load(path, config.unit), config);
}

AdjacencyGraph WrapPipeline::build_graph(const std::string& path, const WrapConfig& config) {
    TriangleMesh mesh = MeshLoader::load(path, config.unit);
    return AdjacencyGraph::from_faces(extract_facets(mesh, config.facets));
}

}  // namespace washiwrap
