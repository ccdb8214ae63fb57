// gccorrect - cmd_estimate.cpp
// CLI handler for the 'estimate' subcommand

#include "cli_common.h"

#include <iostream>
#include <stdexcept>

namespace gccorrect {

extern int run_estimate(const EstimateConfig& config);

int cmd_estimate(int argc, char** argv) {
    CLICommand cmd = make_estimate_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }

    if (!cmd.validate_known(argc, argv) || !cmd.validate_required(argc, argv)) {
        return 1;
    }

    EstimateConfig config;
    try {
        read_input_options(cmd, argc, argv, config.input);
        read_sampling_options(cmd, argc, argv, config.sampling);
        config.output_path = cmd.get_option(argc, argv, "--output", "-");
        config.trace_path = cmd.get_option(argc, argv, "--trace");
        config.verbose = cmd.has_flag(argc, argv, "--verbose");
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cmd.print_help();
        return 1;
    }

    return run_estimate(config);
}

}  // namespace gccorrect
