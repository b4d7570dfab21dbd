#ifndef WASHIWRAP_CLI_COMMON_HPP
#define WASHIWRAP_CLI_COMMON_HPP

#include <pipeline/wrap_pipeline.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <common/logging.hpp>
#include <string>
#include <optional>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace washiwrap::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<std::string> json_path;
    bool verbose = false;
    bool help = false;

    // Overrides for values read from the config file
    std::optional<double> tape_width;
    std::optional<std::string> mode;
    std::optional<std::string> unit;
    std::optional<double> shrink;
    std::optional<double> gap;
    std::optional<double> margin;
    std::optional<int> duplicates;
    std::optional<int> ham_beam;
    std::optional<double> ham_timeout;
    std::optional<int> threads;
    bool no_ham_fallback = false;
    bool fold_lines = false;
    std::optional<double> max_sheet_width;
    std::optional<double> max_sheet_height;
};

inline double parse_double_arg(const std::string& flag, const std::string& value) {
    size_t used = 0;
    double d = 0.0;
    try {
        d = std::stod(value, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(flag + " expects a number, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::runtime_error(flag + " expects a number, got '" + value + "'");
    }
    return d;
}

inline int parse_int_arg(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
    }
    return n;
}

// Parse arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto next_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = next_value(arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = next_value(arg);
        } else if (arg == "--json") {
            ctx.json_path = next_value(arg);
        } else if (arg == "--tape-width") {
            ctx.tape_width = parse_double_arg(arg, next_value(arg));
        } else if (arg == "--mode") {
            ctx.mode = next_value(arg);
        } else if (arg == "--unit" || arg == "--stl-unit") {
            ctx.unit = next_value(arg);
        } else if (arg == "--shrink") {
            ctx.shrink = parse_double_arg(arg, next_value(arg));
        } else if (arg == "--gap") {
            ctx.gap = parse_double_arg(arg, next_value(arg));
        } else if (arg == "--margin") {
            ctx.margin = parse_double_arg(arg, next_value(arg));
        } else if (arg == "--duplicates") {
            ctx.duplicates = parse_int_arg(arg, next_value(arg));
        } else if (arg == "--ham-beam") {
            ctx.ham_beam = parse_int_arg(arg, next_value(arg));
        } else if (arg == "--ham-timeout") {
            ctx.ham_timeout = parse_double_arg(arg, next_value(arg));
        } else if (arg == "--threads") {
            ctx.threads = parse_int_arg(arg, next_value(arg));
        } else if (arg == "--no-ham-fallback") {
            ctx.no_ham_fallback = true;
            ++i;
        } else if (arg == "--fold-lines") {
            ctx.fold_lines = true;
            ++i;
        } else if (arg == "--max-sheet-width") {
            ctx.max_sheet_width = parse_double_arg(arg, next_value(arg));
        } else if (arg == "--max-sheet-height") {
            ctx.max_sheet_height = parse_double_arg(arg, next_value(arg));
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional argument (mesh file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Config file (if any) first, then command-line overrides. Not validated:
// commands that only load the mesh do not need a tape width.
inline WrapConfig build_wrap_config(const CommandContext& ctx) {
    auto log = washiwrap::logging::get_logger();

    WrapConfig config;
    if (ctx.config_path) {
        config = json::read_json_file(*ctx.config_path).get<WrapConfig>();
        log->info("Using configuration from {}", *ctx.config_path);
    }

    if (ctx.tape_width) config.unfold.tape_width = *ctx.tape_width;
    if (ctx.mode) config.unfold.mode = parse_unfold_mode(*ctx.mode);
    if (ctx.unit) config.unit = parse_mesh_unit(*ctx.unit);
    if (ctx.shrink) config.layout.shrink = *ctx.shrink;
    if (ctx.gap) config.layout.gap = *ctx.gap;
    if (ctx.margin) config.layout.margin = *ctx.margin;
    if (ctx.duplicates) config.layout.duplicates = *ctx.duplicates;
    if (ctx.ham_beam) config.unfold.hamiltonian.beam_width = *ctx.ham_beam;
    if (ctx.ham_timeout) config.unfold.hamiltonian.timeout_seconds = *ctx.ham_timeout;
    if (ctx.threads) config.unfold.hamiltonian.num_threads = *ctx.threads;
    if (ctx.no_ham_fallback) config.unfold.fallback_enabled = false;
    if (ctx.max_sheet_width) config.layout.max_sheet_width = *ctx.max_sheet_width;
    if (ctx.max_sheet_height) config.layout.max_sheet_height = *ctx.max_sheet_height;

    return config;
}

// Command function declarations
int command_wrap(int argc, char** argv);
int command_graph(int argc, char** argv);
int command_unfold(int argc, char** argv);

}  // namespace washiwrap::cli

#endif // WASHIWRAP_CLI_COMMON_HPP
