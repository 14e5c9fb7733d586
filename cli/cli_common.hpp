#ifndef ENVELOPEKIT_CLI_COMMON_HPP
#define ENVELOPEKIT_CLI_COMMON_HPP

#include <common/logging.hpp>
#include <host/runner.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace envelopekit::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string config_path;
    bool debug = false;
    bool verbose = false;
    bool help = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "--debug") {
            ctx.debug = true;
            ++i;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Logs every diagnostic line of a failed run; returns the exit code
inline int report_failure(const std::vector<std::string>& diagnostics) {
    auto log = envelopekit::logging::get_logger();
    for (const auto& line : diagnostics) {
        log->error("{}", line);
    }
    return 1;
}

// Command function declarations
int command_panelize(int argc, char** argv);
int command_fenestrate(int argc, char** argv);
int command_tower(int argc, char** argv);

}  // namespace envelopekit::cli

#endif // ENVELOPEKIT_CLI_COMMON_HPP
