// gccorrect - cmd_rates.cpp
// CLI handler for the 'rates' subcommand

#include "cli_common.h"

#include <iostream>
#include <stdexcept>

namespace gccorrect {

extern int run_rates(const RateConfig& config);

int cmd_rates(int argc, char** argv) {
    CLICommand cmd = make_rates_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }

    if (!cmd.validate_known(argc, argv) || !cmd.validate_required(argc, argv)) {
        return 1;
    }

    RateConfig config;
    try {
        read_input_options(cmd, argc, argv, config.input);
        read_sampling_options(cmd, argc, argv, config.sampling);
        config.shift = cmd.get_int(argc, argv, "--shift", 0);
        config.min_positions = cmd.get_int64(argc, argv, "--min-positions", 1000);
        config.output_path = cmd.get_option(argc, argv, "--output", "-");
        config.trace_path = cmd.get_option(argc, argv, "--trace");
        config.verbose = cmd.has_flag(argc, argv, "--verbose");

        if (config.shift < 0) throw std::invalid_argument("--shift must be >= 0");
        if (config.min_positions < 1) throw std::invalid_argument("--min-positions must be >= 1");
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cmd.print_help();
        return 1;
    }

    return run_rates(config);
}

}  // namespace gccorrect
