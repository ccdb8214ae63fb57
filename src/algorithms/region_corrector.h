#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "alignment_file.h"
#include "mappability.h"
#include "rate_table.h"
#include "reference_index.h"
#include "../util/logger.h"
#include "../util/work_pool.h"

namespace gccorrect {

// Per-base read-end counts of a contig slice. A base without a forward or
// reverse rate, or outside the mask, holds the sentinel (-1, -1) and is
// left out of binning.
struct BaseCounts {
    int64_t start = 0;
    std::vector<int32_t> raw;
    std::vector<float> corrected;

    static constexpr int32_t SENTINEL = -1;

    size_t size() const { return raw.size(); }
    bool excluded(size_t i) const { return raw[i] == SENTINEL; }
};

// The forward window of base i is [i + shift, i + shift + window), the
// reverse window its mirror [i - shift - window, i - shift), matching the
// Stage 1 window of a fragment starting at i.
struct CorrectParams {
    int window = 0;       // GC window length
    int shift = 0;
    int min_mapq = 0;
};

struct CorrectUnit {
    size_t contig = 0;
    int64_t start = 0;
    int64_t end = 0;
};

// ceil(length / threads) slices of one contig
std::vector<CorrectUnit> plan_correct_units(size_t contig, int64_t length, int threads);

// Forward and reverse window rates for every base of the unit, both windows
// clipped to the contig; -1 where the window is empty, the base is not
// mappable, or the GC value has no rate.
void window_rates(const Contig& contig, const std::vector<bool>& mask,
                  const RateTable& rates, const CorrectUnit& unit,
                  const CorrectParams& params,
                  std::vector<float>& forward, std::vector<float>& reverse);

// Count read ends of one unit. Forward reads land on their start with the
// forward-window rate, reverse reads on their alignment end with the
// reverse-window rate. A reverse read ending at the contig end has no base
// to land on and is not counted.
BaseCounts correct_region(AlignmentFile& file, const Contig& contig,
                          const std::vector<bool>& mask, const RateTable& rates,
                          const CorrectUnit& unit, const CorrectParams& params,
                          const CancellationToken& token);

// All units of one contig, concatenated in genome order
BaseCounts correct_contig(const std::string& bam_path, const Contig& contig, size_t contig_index,
                          const std::vector<bool>& mask, const RateTable& rates,
                          const CorrectParams& params, int threads,
                          CancellationToken& token, Logger& log);

}  // namespace gccorrect
