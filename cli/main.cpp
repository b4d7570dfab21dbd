#include "cli_common.hpp"
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Unfolds a convex polyhedral mesh into a printable washi tape wrap.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  wrap     Mesh to SVG layout (full pipeline)\n";
    std::cerr << "  graph    Mesh to face adjacency graph JSON\n";
    std::cerr << "  unfold   Mesh to unfolded strips JSON\n";
    std::cerr << "\n";
    std::cerr << "Run '" << program_name << " <command> --help' for command options.\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  WASHIWRAP_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "wrap") {
        return washiwrap::cli::command_wrap(argc, argv);
    }
    if (command == "graph") {
        return washiwrap::cli::command_graph(argc, argv);
    }
    if (command == "unfold") {
        return washiwrap::cli::command_unfold(argc, argv);
    }
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
