#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "alignment_file.h"
#include "coverage_estimator.h"
#include "mappability.h"
#include "rate_table.h"
#include "reference_index.h"
#include "../util/logger.h"
#include "../util/work_pool.h"

namespace gccorrect {

// Column filters and GC window shared by both passes. The GC of position
// pos is counted over [pos + shift, pos + insert_length - shift).
struct RateParams {
    int insert_length = 0;
    int shift = 0;
    int min_mapq = 0;
    CoverageCutoffs cutoffs;

    int window() const { return insert_length - 2 * shift; }
};

// Contiguous slice of one contig handled by one worker
struct RateUnit {
    size_t contig = 0;
    int64_t start = 0;
    int64_t end = 0;
    int64_t numselect = 0;   // positions drawn in pass 1
    uint64_t seed = 0;
};

struct UnitCounts {
    std::vector<GcCounts> counts;       // indexed by GC value
    std::vector<int64_t> drawn;         // pass 1 draws, sorted and distinct
    uint64_t evaluated = 0;             // positions added to `counts`
};

// Split every contig into ceil(length / threads) slices. `fraction` <= 1
// draws that fraction of each slice; > 1 is a genome-wide budget shared in
// proportion to slice length.
std::vector<RateUnit> plan_rate_units(const ReferenceIndex& ref, int threads,
                                      double fraction, uint64_t seed);

// Sorted, distinct positions drawn uniformly from the unit
std::vector<int64_t> draw_positions(const RateUnit& unit);

// Fragment starts at a column, or -1 when depth or mean mapq rule it out
int column_fragments(const PileupColumn& column, const RateParams& params);

// Pass 1: evaluate the drawn mappable positions that fall on pileup columns.
// Both passes throw InterruptedError mid-unit once `token` is cancelled.
UnitCounts process_region(AlignmentFile& file, const Contig& contig,
                          const std::vector<bool>& mask, const RateUnit& unit,
                          const RateParams& params, const CancellationToken& token);

// Pass 2: scan every column of the unit, keeping positions whose GC is
// flagged in `left` and which pass 1 did not draw
UnitCounts process_region_left(AlignmentFile& file, const Contig& contig,
                               const std::vector<bool>& mask, const RateUnit& unit,
                               const RateParams& params, const std::vector<bool>& left,
                               const std::vector<int64_t>& drawn,
                               const CancellationToken& token);

struct RateEstimate {
    RateTable table;
    std::vector<int> left_over;         // GC values refined by pass 2
    uint64_t pass1_positions = 0;
    uint64_t pass2_positions = 0;
};

// Both passes over every contig, merged into a finalized table
RateEstimate estimate_rates(const std::string& bam_path, const ReferenceIndex& ref,
                            const MappabilityMask& mask, const RateParams& params,
                            const SamplingConfig& sampling, int64_t min_positions,
                            CancellationToken& token, Logger& log);

}  // namespace gccorrect
