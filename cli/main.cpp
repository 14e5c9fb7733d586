#include "cli_common.hpp"

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> -c <config.json> [--debug] [-v]\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  panelize     Subdivide a surface into a grid of panels\n";
    std::cerr << "  fenestrate   Panelize and cut data-driven openings\n";
    std::cerr << "  tower        Loft a twisted tower from a plan curve\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config   JSON configuration file\n";
    std::cerr << "  --debug        Include error kind, element and causes on failure\n";
    std::cerr << "  -v, --verbose  Debug logging\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  ENVELOPEKIT_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "panelize") {
        return envelopekit::cli::command_panelize(argc, argv);
    }
    if (command == "fenestrate") {
        return envelopekit::cli::command_fenestrate(argc, argv);
    }
    if (command == "tower") {
        return envelopekit::cli::command_tower(argc, argv);
    }
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
