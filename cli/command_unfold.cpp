#include "cli_common.hpp"
#include <serialization/graph_json.hpp>
#include <serialization/strip_json.hpp>

namespace washiwrap::cli {

int command_unfold(int argc, char** argv) {
    auto log = washiwrap::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        if (ctx.verbose) {
            logging::enable_verbose();
        }

        if (ctx.help || ctx.input_path.empty() || ctx.output_path.empty()) {
            std::cerr << "Usage: washiwrap unfold <mesh.stl|mesh.obj|graph.json> --tape-width W -o <strips.json> [options]\n";
            std::cerr << "Accepts the unfolding options of 'washiwrap wrap'.\n";
            std::cerr << "A graph.json written by 'washiwrap graph' skips mesh loading.\n";
            return ctx.help ? 0 : 1;
        }

        WrapConfig config = build_wrap_config(ctx);
        config.validate();

        log->info("Unfolding {} (tape {:.2f} mm, mode {})",
                  ctx.input_path, config.unfold.tape_width, to_string(config.unfold.mode));

        AdjacencyGraph graph;
        if (json::is_json_path(ctx.input_path)) {
            json::SerializedData input_data = json::read_serialized(ctx.input_path);
            input_data.require_step("graph");
            graph = adjacency_graph_from_json(input_data.data);
            log->debug("Loaded adjacency graph from {}: {} faces", ctx.input_path, graph.face_count());
        } else {
            graph = WrapPipeline::build_graph(ctx.input_path, config);
        }
        UnfoldOutcome outcome = UnfoldPipeline::run(graph, config.unfold);

        json::SerializedData data = json::make_envelope(
            "unfold", ctx.input_path, config, unfold_outcome_stats(outcome), unfold_outcome_to_json(outcome));
        json::write_serialized(ctx.output_path, data);

        std::cerr << "Wrote " << ctx.output_path << " (" << outcome.strips.size() << " strip(s))\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace washiwrap::cli
