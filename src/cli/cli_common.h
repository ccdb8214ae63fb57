// gccorrect - cli_common.h
// Common CLI infrastructure for consistent command-line interface

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <gccorrect/config.hpp>

namespace gccorrect {

struct CLIOption {
    std::string name;           // e.g., "--bam"
    std::string arg_name;       // e.g., "FILE", "N", "" for flags
    std::string description;
    std::string default_value;  // "" if required or no default
    bool required;

    CLIOption(const std::string& n, const std::string& arg, const std::string& desc,
              const std::string& def = "", bool req = false)
        : name(n), arg_name(arg), description(desc), default_value(def), required(req) {}
};

struct CLIOutput {
    std::string filename;
    std::string description;

    CLIOutput(const std::string& f, const std::string& d) : filename(f), description(d) {}
};

struct CLICommand {
    std::string name;
    std::string description;
    std::vector<std::string> description_extra;
    std::vector<CLIOption> options;
    std::vector<CLIOutput> outputs;
    std::string note;
    std::vector<std::string> examples;

    // Print formatted help message to stderr
    void print_help() const;

    bool has_help_flag(int argc, char** argv) const;

    // Validate required arguments are present
    // Returns true if valid, false otherwise (prints error message and help)
    bool validate_required(int argc, char** argv) const;

    // Reject arguments that are not declared options
    bool validate_known(int argc, char** argv) const;

    // Get option value (returns default if not found)
    std::string get_option(int argc, char** argv, const std::string& name,
                           const std::string& default_val = "") const;

    // Numeric options; throw std::invalid_argument naming the option
    int get_int(int argc, char** argv, const std::string& name, int default_val) const;
    int64_t get_int64(int argc, char** argv, const std::string& name, int64_t default_val) const;
    double get_double(int argc, char** argv, const std::string& name, double default_val) const;

    bool has_flag(int argc, char** argv, const std::string& flag) const;

    std::vector<std::string> get_missing_required(int argc, char** argv) const;

private:
    const CLIOption* find(const std::string& arg) const;
};

// "chr1,chr2" -> {"chr1", "chr2"}; empty entries are dropped
std::vector<std::string> split_list(const std::string& value);

// Options shared by every command: inputs, threads, mapq, seed. Only the
// estimating commands take the sampling options on top.
void read_input_options(const CLICommand& cmd, int argc, char** argv, InputConfig& input);
void read_worker_options(const CLICommand& cmd, int argc, char** argv, SamplingConfig& sampling);
void read_sampling_options(const CLICommand& cmd, int argc, char** argv, SamplingConfig& sampling);

// Command definitions
CLICommand make_estimate_command();
CLICommand make_rates_command();
CLICommand make_correct_command();

}  // namespace gccorrect
