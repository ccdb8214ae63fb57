// gccorrect - GC-bias correction of sequencing coverage
// Main entry point with git-style subcommand dispatch

#include <gccorrect/config.hpp>
#include <iostream>
#include <string>

// Forward declarations for subcommands
namespace gccorrect {
    int cmd_estimate(int argc, char** argv);
    int cmd_rates(int argc, char** argv);
    int cmd_correct(int argc, char** argv);
}

static void print_version() {
    std::cout << "gccorrect " << gccorrect::VERSION << "\n";
}

static void print_usage(const char* prog) {
    std::cerr << "gccorrect - GC-bias correction of sequencing coverage\n";
    std::cerr << "Version: " << gccorrect::VERSION << "\n\n";
    std::cerr << "Usage: " << prog << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  estimate         Estimate insert length and coverage cutoffs\n";
    std::cerr << "  rates            Measure fragment rate per GC value (stage 1)\n";
    std::cerr << "  correct          Correct per-base counts and bin them (stage 2)\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -h, --help     Show this help message\n";
    std::cerr << "  -v, --version  Show version information\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  gccorrect rates --reference ref.fa --mappability map.bed --bam aln.bam --output rates.txt\n";
    std::cerr << "  gccorrect correct --reference ref.fa --mappability map.bed --bam aln.bam --rates rates.txt\n";
    std::cerr << "\n";
    std::cerr << "For command-specific help, use: gccorrect <command> --help\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "-h" || cmd == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd == "-v" || cmd == "--version") {
        print_version();
        return 0;
    }

    if (cmd == "estimate") {
        return gccorrect::cmd_estimate(argc - 1, argv + 1);
    } else if (cmd == "rates") {
        return gccorrect::cmd_rates(argc - 1, argv + 1);
    } else if (cmd == "correct") {
        return gccorrect::cmd_correct(argc - 1, argv + 1);
    } else {
        std::cerr << "Error: Unknown command '" << cmd << "'\n\n";
        print_usage(argv[0]);
        return 1;
    }
}
