// gccorrect - cmd_correct.cpp
// CLI handler for the 'correct' subcommand

#include "cli_common.h"

#include <iostream>
#include <stdexcept>

namespace gccorrect {

extern int run_correct(const CorrectConfig& config);

int cmd_correct(int argc, char** argv) {
    CLICommand cmd = make_correct_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        return 0;
    }

    if (!cmd.validate_known(argc, argv) || !cmd.validate_required(argc, argv)) {
        return 1;
    }

    CorrectConfig config;
    try {
        read_input_options(cmd, argc, argv, config.input);
        read_worker_options(cmd, argc, argv, config.sampling);
        config.rates_path = cmd.get_option(argc, argv, "--rates");
        config.shift = cmd.get_int(argc, argv, "--shift", 0);
        config.bin_size = cmd.get_int(argc, argv, "--bin-size", 0);
        config.output_path = cmd.get_option(argc, argv, "--output", "-");
        config.trace_path = cmd.get_option(argc, argv, "--trace");
        config.verbose = cmd.has_flag(argc, argv, "--verbose");

        bool smooth = cmd.has_flag(argc, argv, "--smooth");
        bool no_smooth = cmd.has_flag(argc, argv, "--no-smooth");
        if (smooth && no_smooth) {
            throw std::invalid_argument("--smooth and --no-smooth are mutually exclusive");
        }
        config.smooth = smooth;

        if (config.shift < 0) throw std::invalid_argument("--shift must be >= 0");
        if (config.bin_size < 0) throw std::invalid_argument("--bin-size must be > 0");
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cmd.print_help();
        return 1;
    }

    return run_correct(config);
}

}  // namespace gccorrect
