// gccorrect - Centralized Configuration Structures
// All command configs in one place for consistency
#ifndef GCCORRECT_CONFIG_HPP
#define GCCORRECT_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "gccorrect/version.h"

namespace gccorrect {

// Global version (set by cmake from git describe)
constexpr const char* VERSION = GCCORRECT_VERSION_STRING;

// Mappable runs longer than this are kept as coverage-sampling anchors
constexpr int64_t DEFAULT_MIN_SPAN = 10000;

// Candidate bin sizes are multiples of this step
constexpr int BIN_SIZE_STEP = 50;

// Smallest mean/stdev ratio of binned totals accepted by the bin-size search
constexpr double BIN_SIZE_MIN_RATIO = 4.0;

// Columns whose mean mapping quality is below this are left out of the
// coverage histogram
constexpr int COVERAGE_MIN_MEAN_MAPQ = 20;

// Insert-length subsampling
constexpr double INSERT_KEEP_PROBABILITY = 0.5;
constexpr size_t INSERT_TARGET_RECORDS = 10000;

// Pileup columns or records scanned between interrupt checks
constexpr uint32_t CANCEL_CHECK_INTERVAL = 65536;

// Shared input files
struct InputConfig {
    std::string reference_path;
    std::string mappability_path;
    std::string bam_path;
    std::vector<std::string> chromosomes;   // empty = every reference contig
    int64_t min_span = DEFAULT_MIN_SPAN;
};

// Settings shared by the estimator and both stages
struct SamplingConfig {
    int threads = 1;
    int min_mapq = 30;
    double fraction = 0.1;                  // <=1: fraction of length, >1: absolute budget
    uint64_t seed = 42;

    double coverage = 0.0;                  // 0 = infer from the alignments
    double insert_mean = 0.0;               // 0 = infer from the alignments
    double insert_stdev = 0.0;
};

struct EstimateConfig {
    InputConfig input;
    SamplingConfig sampling;
    std::string output_path = "-";
    std::string trace_path;
    bool verbose = false;
};

// Stage 1
struct RateConfig {
    InputConfig input;
    SamplingConfig sampling;
    int shift = 0;
    int64_t min_positions = 1000;
    std::string output_path = "-";
    std::string trace_path;
    bool verbose = false;
};

// Stage 2
struct CorrectConfig {
    InputConfig input;
    SamplingConfig sampling;
    std::string rates_path;
    int shift = 0;
    int bin_size = 0;                       // 0 = search for one
    bool smooth = false;
    std::string output_path = "-";
    std::string trace_path;
    bool verbose = false;
};

}  // namespace gccorrect

#endif  // GCCORRECT_CONFIG_HPP
