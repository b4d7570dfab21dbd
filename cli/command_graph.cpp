#include "cli_common.hpp"
#include <serialization/graph_json.hpp>

namespace washiwrap::cli {

int command_graph(int argc, char** argv) {
    auto log = washiwrap::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        if (ctx.verbose) {
            logging::enable_verbose();
        }

        if (ctx.help || ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: washiwrap graph <mesh.stl|mesh.obj> -o <graph.json> [--unit mm|inch] [-c config.json]\n";
            return ctx.help ? 0 : 1;
        }

        WrapConfig config = build_wrap_config(ctx);

        log->info("Building adjacency graph from: {}", ctx.input_path);
        AdjacencyGraph graph = WrapPipeline::build_graph(ctx.input_path, config);

        nlohmann::json config_j;
        config_j["unit"] = config.unit;
        config_j["facets"] = config.facets;
        json::SerializedData data = json::make_envelope(
            "graph", ctx.input_path, config_j, adjacency_graph_stats(graph), adjacency_graph_to_json(graph));
        json::write_serialized(ctx.output_path, data);

        std::cerr << "Wrote " << ctx.output_path << " ("
                  << graph.face_count() << " faces, " << graph.edge_count() << " edges)\n";
        log->info("Graph export complete: {} faces, {} edges", graph.face_count(), graph.edge_count());
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace washiwrap::cli
