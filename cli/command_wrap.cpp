#include "cli_common.hpp"
#include <layout/svg_writer.hpp>
#include <serialization/layout_json.hpp>
#include <serialization/strip_json.hpp>

namespace washiwrap::cli {

namespace {

void print_wrap_usage() {
    std::cerr << "Usage: washiwrap wrap <mesh.stl|mesh.obj> --tape-width W [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o <file>              Output SVG (default: washi_wrap.svg)\n";
    std::cerr << "  --mode bfs|hamiltonian Unfolding strategy (default: bfs)\n";
    std::cerr << "  --unit mm|inch         Mesh unit (default: mm)\n";
    std::cerr << "  --shrink S             Inset every face by S mm (default: 0)\n";
    std::cerr << "  --gap G                Gap between strips and copies in mm (default: 2)\n";
    std::cerr << "  --margin M             Sheet margin in mm (default: 1)\n";
    std::cerr << "  --duplicates N         Copies of the full set (default: 1)\n";
    std::cerr << "  --ham-beam B           Beam width of the Hamiltonian search (default: 24)\n";
    std::cerr << "  --ham-timeout T        Hamiltonian time budget in seconds (default: 2.0)\n";
    std::cerr << "  --no-ham-fallback      Fail instead of falling back to BFS strips\n";
    std::cerr << "  --threads N            Search threads, 0 = all cores (default: 0)\n";
    std::cerr << "  --max-sheet-width X    Fail if the sheet is wider than X mm\n";
    std::cerr << "  --max-sheet-height Y   Fail if the sheet is taller than Y mm\n";
    std::cerr << "  --fold-lines           Also draw dashed face outlines at the hinges\n";
    std::cerr << "  --json <file>          Also write the layout as JSON\n";
    std::cerr << "  -c <config.json>       Read settings from a config file\n";
    std::cerr << "  -v                     Verbose logging\n";
}

}  // namespace

int command_wrap(int argc, char** argv) {
    auto log = washiwrap::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        if (ctx.verbose) {
            logging::enable_verbose();
        }

        if (ctx.help) {
            print_wrap_usage();
            return 0;
        }
        if (ctx.input_path.empty()) {
            print_wrap_usage();
            return 1;
        }
        if (!ctx.tape_width && !ctx.config_path) {
            print_wrap_usage();
            std::cerr << "Error: --tape-width is required\n";
            return 1;
        }

        WrapConfig config = build_wrap_config(ctx);
        config.validate();
        std::string output_path = ctx.output_path.empty() ? "washi_wrap.svg" : ctx.output_path;

        log->info("Wrapping {} (tape {:.2f} mm, mode {})",
                  ctx.input_path, config.unfold.tape_width, to_string(config.unfold.mode));

        WrapResult result = WrapPipeline::run_file(ctx.input_path, config);

        SvgOptions svg_options;
        svg_options.draw_fold_lines = ctx.fold_lines;
        SvgWriter::write(result.layout, output_path, svg_options);

        if (ctx.json_path) {
            nlohmann::json stats = unfold_outcome_stats(result.unfold);
            stats["sheet_width"] = result.layout.sheet_width;
            stats["sheet_height"] = result.layout.sheet_height;
            json::SerializedData data = json::make_envelope(
                "layout", ctx.input_path, config, stats, layout_to_json(result.layout));
            json::write_serialized(*ctx.json_path, data);
            log->info("Wrote layout JSON to {}", *ctx.json_path);
        }

        if (result.unfold.fell_back()) {
            std::cerr << "Warning: Hamiltonian search failed ("
                      << result.unfold.search_failure->message << "), used BFS strips\n";
        }
        std::cerr << "Wrote " << output_path << " ("
                  << result.unfold.strips.size() << " strip(s), "
                  << result.layout.sheet_width << " x " << result.layout.sheet_height << " mm)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace washiwrap::cli
