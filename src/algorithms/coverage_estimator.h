#pragma once

#include <cstdint>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "alignment_file.h"
#include "mappability.h"
#include "reference_index.h"
#include "../util/logger.h"
#include "../util/work_pool.h"
#include <gccorrect/config.hpp>

namespace gccorrect {

// The sampled insert lengths are too spread out to trust (mean - 3 sd < 0)
class InsertEstimateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct InsertEstimate {
    double mean = 0.0;
    double stdev = 0.0;
    size_t samples = 0;
};

// Depth cutoffs: a column is usable when min_depth <= depth <= max_depth
struct CoverageCutoffs {
    double mean = 0.0;
    double stdev = 0.0;
    double min_depth = 0.0;
    double max_depth = 0.0;

    bool accepts(int depth) const { return depth >= min_depth && depth <= max_depth; }
};

// Proper pair with positive template length and both mates usable
bool is_insert_record(const bam1_t* b);

// Walk the file keeping each record with probability `keep_probability`
// until `target` usable records are collected. Throws InsertEstimateError
// when nothing usable is found or mean - 3 sd < 0, InterruptedError once
// `token` is cancelled.
InsertEstimate estimate_insert(AlignmentFile& file, std::mt19937_64& rng,
                               const CancellationToken& token,
                               double keep_probability = INSERT_KEEP_PROBABILITY,
                               size_t target = INSERT_TARGET_RECORDS);

// Lander-Waterman cutoffs for an expected mean coverage. Up to 100x the
// interval grows from the Poisson mode toward the heavier neighbour until it
// holds more than 0.999 of the mass; above 100x (0.5x, 2x) is used.
CoverageCutoffs poisson_cutoffs(double coverage);

// Interval whose pileup depth is sampled
struct CoverageUnit {
    std::string contig;
    int64_t start = 0;
    int64_t end = 0;
};

using DepthHistogram = std::map<int, uint64_t>;

// One interval per contig: a random long mappable segment when the contig
// has any, otherwise a random window of fraction * length / 2 bases.
std::vector<CoverageUnit> plan_coverage_units(const ReferenceIndex& ref,
                                              const MappabilityMask& mask,
                                              double fraction, std::mt19937_64& rng);

// depth -> number of columns, skipping columns with mean mapq below
// `min_mean_mapq`
DepthHistogram depth_histogram(AlignmentFile& file, const CoverageUnit& unit,
                               const CancellationToken& token,
                               int min_mean_mapq = COVERAGE_MIN_MEAN_MAPQ);

// mean +/- 3 sd of the histogram, floored at 0
CoverageCutoffs cutoffs_from_histogram(const DepthHistogram& histogram);

// Sample depth on every contig in parallel and derive cutoffs
CoverageCutoffs estimate_coverage(const std::string& bam_path, const ReferenceIndex& ref,
                                  const MappabilityMask& mask, const SamplingConfig& sampling,
                                  CancellationToken& token, Logger& log);

// Insert length and depth cutoffs used by both stages. Values given in
// `sampling` are taken as-is; the rest are inferred from the alignments.
struct AlignmentProfile {
    InsertEstimate insert;
    CoverageCutoffs cutoffs;
    bool insert_inferred = false;
    bool coverage_inferred = false;
};

AlignmentProfile profile_alignments(const std::string& bam_path, const ReferenceIndex& ref,
                                    const MappabilityMask& mask, const SamplingConfig& sampling,
                                    CancellationToken& token, Logger& log);

}  // namespace gccorrect
