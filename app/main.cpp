#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options] <input>\n";
    std::cerr << "\n";
    std::cerr << "Converts branching skeletons to tube meshes and collision shapes.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  mesh        Skeleton JSON -> OBJ or GLB (by output extension)\n";
    std::cerr << "  colliders   Skeleton JSON -> capsule/sphere collider JSON\n";
    std::cerr << "  info        Summarize a GLB file\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <path>     Output file\n";
    std::cerr << "  -c, --config <path>     Run configuration JSON\n";
    std::cerr << "  -r, --resolution <n>    Ring vertex count (clamped to 3..128)\n";
    std::cerr << "  --min-radius <r>        Skip colliders thinner than r\n";
    std::cerr << "  -v, --verbose           Debug logging\n";
    std::cerr << "  -h, --help              Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  BRANCHMESH_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    auto log = branchmesh::logging::get_logger();

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    log->debug("Dispatching command: {}", command);
    if (command == "mesh") {
        return branchmesh::cli::command_mesh(argc, argv);
    }
    if (command == "colliders") {
        return branchmesh::cli::command_colliders(argc, argv);
    }
    if (command == "info") {
        return branchmesh::cli::command_info(argc, argv);
    }

    log->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
