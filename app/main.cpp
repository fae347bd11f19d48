#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Lays out a trait galaxy around its central node.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  generate    Generate a node set (-c config.json -o nodes.json)\n";
    std::cerr << "  layout      Compute a static resting layout for a node set\n";
    std::cerr << "  simulate    Run the per-frame simulation for a number of ticks\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -c, --config FILE   JSON config with generation/physics/driver sections\n";
    std::cerr << "  -o, --output FILE   Output file\n";
    std::cerr << "  -v, --verbose       Debug logging\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  TRAITGALAXY_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    auto log = traitgalaxy::logging::get_logger();
    log->debug("Running command: {}", command);

    if (command == "generate") {
        return traitgalaxy::cli::command_generate(argc, argv);
    } else if (command == "layout") {
        return traitgalaxy::cli::command_layout(argc, argv);
    } else if (command == "simulate") {
        return traitgalaxy::cli::command_simulate(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
