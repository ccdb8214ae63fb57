// gccorrect - cli_common.cpp
// Common CLI infrastructure implementation

#include "cli_common.h"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace gccorrect {

namespace {

// "-v, --verbose" -> {"-v", "--verbose"}
std::vector<std::string> aliases(const std::string& name) {
    std::vector<std::string> out;
    std::string part;
    std::istringstream ss(name);
    while (std::getline(ss, part, ',')) {
        size_t b = part.find_first_not_of(' ');
        size_t e = part.find_last_not_of(' ');
        if (b != std::string::npos) out.push_back(part.substr(b, e - b + 1));
    }
    return out;
}

template <typename T, typename Parse>
T parse_number(const std::string& name, const std::string& value, const char* what, Parse parse) {
    size_t used = 0;
    T v{};
    try {
        v = static_cast<T>(parse(value, &used));
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " expects " + what + ", got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(name + " expects " + what + ", got '" + value + "'");
    }
    return v;
}

}  // namespace

void CLICommand::print_help() const {
    std::cerr << "Usage: gccorrect " << name << " [options]\n\n";
    std::cerr << description << "\n";

    for (const auto& line : description_extra) {
        std::cerr << line << "\n";
    }
    std::cerr << "\n";

    std::vector<const CLIOption*> required_opts;
    std::vector<const CLIOption*> optional_opts;
    for (const auto& opt : options) {
        (opt.required ? required_opts : optional_opts).push_back(&opt);
    }

    // Column width based on the longest option
    size_t opt_col = 21;
    for (const auto& opt : options) {
        size_t len = 2 + opt.name.length();
        if (!opt.arg_name.empty()) len += 1 + opt.arg_name.length();
        if (len + 1 > opt_col) opt_col = len + 1;
    }

    auto print_option = [opt_col](const CLIOption& opt) {
        std::string opt_str = "  " + opt.name;
        if (!opt.arg_name.empty()) opt_str += " " + opt.arg_name;
        while (opt_str.length() < opt_col) opt_str += " ";
        std::string desc = opt.description;
        if (!opt.required && !opt.default_value.empty()) {
            desc += " (default: " + opt.default_value + ")";
        }
        std::cerr << opt_str << desc << "\n";
    };

    if (!required_opts.empty()) {
        std::cerr << "Required:\n";
        for (const auto* opt : required_opts) print_option(*opt);
        std::cerr << "\n";
    }

    std::cerr << "Options:\n";
    for (const auto* opt : optional_opts) print_option(*opt);
    std::cerr << "\n";

    if (!outputs.empty()) {
        std::cerr << "Output:\n";
        for (const auto& out : outputs) {
            std::string out_str = "  " + out.filename;
            while (out_str.length() < opt_col) out_str += " ";
            std::cerr << out_str << out.description << "\n";
        }
        std::cerr << "\n";
    }

    if (!note.empty()) {
        std::cerr << "Note:\n  " << note << "\n\n";
    }

    if (!examples.empty()) {
        std::cerr << "Example:\n";
        for (const auto& ex : examples) {
            std::cerr << "  " << ex << "\n";
        }
    }
}

bool CLICommand::has_help_flag(int argc, char** argv) const {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") return true;
    }
    return false;
}

const CLIOption* CLICommand::find(const std::string& arg) const {
    for (const auto& opt : options) {
        for (const auto& alias : aliases(opt.name)) {
            if (alias == arg) return &opt;
        }
    }
    return nullptr;
}

bool CLICommand::has_flag(int argc, char** argv, const std::string& flag) const {
    const CLIOption* opt = find(flag);
    std::vector<std::string> names = opt ? aliases(opt->name) : std::vector<std::string>{flag};
    for (int i = 1; i < argc; ++i) {
        for (const auto& n : names) {
            if (argv[i] == n) return true;
        }
    }
    return false;
}

std::string CLICommand::get_option(int argc, char** argv, const std::string& name,
                                   const std::string& default_val) const {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == name) return argv[i + 1];
    }
    return default_val;
}

int CLICommand::get_int(int argc, char** argv, const std::string& name, int default_val) const {
    std::string value = get_option(argc, argv, name);
    if (value.empty()) return default_val;
    return parse_number<int>(name, value, "an integer",
                             [](const std::string& s, size_t* used) { return std::stoi(s, used); });
}

int64_t CLICommand::get_int64(int argc, char** argv, const std::string& name,
                              int64_t default_val) const {
    std::string value = get_option(argc, argv, name);
    if (value.empty()) return default_val;
    return parse_number<int64_t>(name, value, "an integer",
                                 [](const std::string& s, size_t* used) { return std::stoll(s, used); });
}

double CLICommand::get_double(int argc, char** argv, const std::string& name,
                              double default_val) const {
    std::string value = get_option(argc, argv, name);
    if (value.empty()) return default_val;
    return parse_number<double>(name, value, "a number",
                                [](const std::string& s, size_t* used) { return std::stod(s, used); });
}

std::vector<std::string> CLICommand::get_missing_required(int argc, char** argv) const {
    std::vector<std::string> missing;
    for (const auto& opt : options) {
        if (!opt.required) continue;
        bool found = false;
        for (int i = 1; i < argc; ++i) {
            if (argv[i] == opt.name && i + 1 < argc) {
                found = true;
                break;
            }
        }
        if (!found) missing.push_back(opt.name);
    }
    return missing;
}

bool CLICommand::validate_required(int argc, char** argv) const {
    auto missing = get_missing_required(argc, argv);
    if (missing.empty()) return true;

    std::cerr << "Error: Missing required arguments.\n";
    std::cerr << "Required:";
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) std::cerr << ",";
        std::cerr << " " << missing[i];
    }
    std::cerr << "\n\n";
    print_help();
    return false;
}

bool CLICommand::validate_known(int argc, char** argv) const {
    for (int i = 1; i < argc; ++i) {
        const CLIOption* opt = find(argv[i]);
        if (!opt) {
            std::cerr << "Error: Unknown argument '" << argv[i] << "'\n\n";
            print_help();
            return false;
        }
        if (!opt->arg_name.empty()) ++i;
    }
    return true;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::string item;
    std::istringstream ss(value);
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

void read_input_options(const CLICommand& cmd, int argc, char** argv, InputConfig& input) {
    input.reference_path = cmd.get_option(argc, argv, "--reference");
    input.mappability_path = cmd.get_option(argc, argv, "--mappability");
    input.bam_path = cmd.get_option(argc, argv, "--bam");
    input.chromosomes = split_list(cmd.get_option(argc, argv, "--chromosomes"));
    input.min_span = cmd.get_int64(argc, argv, "--min-span", DEFAULT_MIN_SPAN);
    if (input.min_span < 0) {
        throw std::invalid_argument("--min-span must be >= 0");
    }
}

void read_worker_options(const CLICommand& cmd, int argc, char** argv, SamplingConfig& sampling) {
    sampling.threads = cmd.get_int(argc, argv, "--threads", 1);
    sampling.min_mapq = cmd.get_int(argc, argv, "--min-mapq", 30);
    sampling.seed = static_cast<uint64_t>(cmd.get_int64(argc, argv, "--seed", 42));
    if (sampling.threads < 1) throw std::invalid_argument("--threads must be >= 1");
}

void read_sampling_options(const CLICommand& cmd, int argc, char** argv, SamplingConfig& sampling) {
    read_worker_options(cmd, argc, argv, sampling);
    sampling.fraction = cmd.get_double(argc, argv, "--fraction", 0.1);
    sampling.coverage = cmd.get_double(argc, argv, "--coverage", 0.0);
    sampling.insert_mean = cmd.get_double(argc, argv, "--insert-mean", 0.0);
    sampling.insert_stdev = cmd.get_double(argc, argv, "--insert-stdev", 0.0);

    if (!(sampling.fraction > 0.0)) throw std::invalid_argument("--fraction must be > 0");
    if (sampling.coverage < 0.0) throw std::invalid_argument("--coverage must be > 0");
    if (sampling.insert_mean < 0.0 || sampling.insert_stdev < 0.0) {
        throw std::invalid_argument("--insert-mean and --insert-stdev must be > 0");
    }
    if ((sampling.insert_mean > 0.0) != (cmd.has_flag(argc, argv, "--insert-stdev"))) {
        throw std::invalid_argument("--insert-mean and --insert-stdev go together");
    }
}

// Command definitions

namespace {

std::vector<CLIOption> input_options() {
    return {
        {"--reference", "FILE", "Reference FASTA (faidx index built when missing)", "", true},
        {"--mappability", "FILE", "Mappable intervals, BED (chrom, start, end)", "", true},
        {"--bam", "FILE", "Coordinate-sorted, indexed BAM", "", true},
        {"--chromosomes", "LIST", "Comma-separated contigs to use", "all"},
        {"--min-span", "N", "Mappable runs longer than N anchor coverage sampling", "10000"},
    };
}

std::vector<CLIOption> worker_options() {
    return {
        {"--threads", "N", "Number of worker threads", "1"},
        {"--min-mapq", "N", "Minimum mapping quality", "30"},
        {"--seed", "N", "Random seed", "42"},
    };
}

std::vector<CLIOption> sampling_options() {
    std::vector<CLIOption> options = worker_options();
    options.insert(options.begin() + 2, {
        {"--fraction", "F", "Positions to sample: <=1 fraction of length, >1 total count", "0.1"},
        {"--coverage", "X", "Expected mean coverage (skips coverage inference)"},
        {"--insert-mean", "X", "Mean insert length (skips insert inference)"},
        {"--insert-stdev", "X", "Insert length standard deviation"},
    });
    return options;
}

std::vector<CLIOption> common_tail() {
    return {
        {"--output", "FILE", "Output file, - for stdout", "-"},
        {"--trace", "FILE", "Write a detailed trace log"},
        {"-v, --verbose", "", "Enable verbose output"},
        {"-h, --help", "", "Show this help message"},
    };
}

void append(std::vector<CLIOption>& to, const std::vector<CLIOption>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

}  // namespace

CLICommand make_estimate_command() {
    CLICommand cmd;
    cmd.name = "estimate";
    cmd.description = "Estimate insert length and coverage cutoffs from an alignment set.";
    cmd.description_extra = {
        "",
        "Samples proper pairs for the insert length and pileup columns for the",
        "depth distribution; with --coverage the cutoffs come from a Poisson model.",
    };

    append(cmd.options, input_options());
    append(cmd.options, sampling_options());
    append(cmd.options, common_tail());

    cmd.outputs = {
        {"<output>", "TSV: key, value (insert_mean, insert_stdev, coverage_mean, ...)"},
    };

    cmd.examples = {
        "gccorrect estimate --reference ref.fa --mappability map.bed --bam aln.bam",
    };
    return cmd;
}

CLICommand make_rates_command() {
    CLICommand cmd;
    cmd.name = "rates";
    cmd.description = "Measure fragment rate against local GC content (stage 1).";
    cmd.description_extra = {
        "",
        "Samples mappable positions, counts forward fragment starts per GC value over",
        "an insert-length window and rescans under-sampled GC values genome-wide.",
    };

    append(cmd.options, input_options());
    append(cmd.options, sampling_options());
    cmd.options.push_back({"--shift", "N", "Bases trimmed from each end of the GC window", "0"});
    cmd.options.push_back({"--min-positions", "N", "Positions required for a usable rate", "1000"});
    append(cmd.options, common_tail());

    cmd.outputs = {
        {"<output>", "TSV: gc, positions, fragments, rate (- when unusable)"},
    };

    cmd.examples = {
        "gccorrect rates --reference ref.fa --mappability map.bed --bam aln.bam > rates.txt",
        "gccorrect rates --reference ref.fa --mappability map.bed --bam aln.bam --fraction 2000000 --threads 8",
    };
    return cmd;
}

CLICommand make_correct_command() {
    CLICommand cmd;
    cmd.name = "correct";
    cmd.description = "Apply a GC rate table per base and report binned corrected counts (stage 2).";
    cmd.description_extra = {
        "",
        "Each read end is weighted by the rate of the GC window it starts; bases",
        "without a rate are excluded. Bins hold a fixed number of included bases.",
    };

    append(cmd.options, input_options());
    cmd.options.insert(cmd.options.begin() + 3,
                       CLIOption("--rates", "FILE", "Rate table written by 'gccorrect rates'", "", true));
    append(cmd.options, worker_options());
    cmd.options.push_back({"--shift", "N", "Shift used when the rates were measured", "0"});
    cmd.options.push_back({"--bin-size", "N", "Included bases per bin (searched when unset)"});
    cmd.options.push_back({"--smooth", "", "Rescale bins against a LOWESS coverage-vs-GC curve"});
    cmd.options.push_back({"--no-smooth", "", "Disable the LOWESS rescaling (default)"});
    append(cmd.options, common_tail());

    cmd.outputs = {
        {"<output>", "TSV: chrom, start, end, gc_bases, raw_count, corrected_count"},
    };

    cmd.note = "The GC window length is taken from the rate table (its last GC value minus 2 x shift).";

    cmd.examples = {
        "gccorrect correct --reference ref.fa --mappability map.bed --rates rates.txt --bam aln.bam --bin-size 1000",
        "gccorrect correct --reference ref.fa --mappability map.bed --rates rates.txt --bam aln.bam --smooth",
    };
    return cmd;
}

}  // namespace gccorrect
