#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "reference_index.h"
#include "region_corrector.h"

namespace gccorrect {

// A run of `bases` included (non-sentinel) positions, [start, end) on chrom
struct Bin {
    std::string chrom;
    int64_t start = 0;
    int64_t end = 0;
    int64_t gc_bases = 0;
    int64_t bases = 0;
    int64_t raw = 0;
    double corrected = 0.0;

    double gc_fraction() const { return bases > 0 ? static_cast<double>(gc_bases) / bases : 0.0; }
};

// Fills bins left to right. A bin closes once it holds `bin_size` included
// bases; flush() emits the last partial bin if it holds any.
class BinAccumulator {
public:
    BinAccumulator(const std::string& chrom, int bin_size, std::vector<Bin>& out);

    void add(int64_t pos, char base, int32_t raw, float corrected);
    void flush();

private:
    std::string chrom_;
    int bin_size_;
    std::vector<Bin>& out_;
    Bin current_;
};

// Bin every included base of a contig
std::vector<Bin> bin_contig(const Contig& contig, const BaseCounts& counts, int bin_size);

// Corrected counts of the included bases, sentinels dropped
std::vector<double> included_values(const BaseCounts& counts);

struct BinSizeSearch {
    int bin_size = 0;
    double ratio = 0.0;         // mean / sd of chunk sums at bin_size
    bool converged = false;     // false when chunks ran out first
};

// Try bin sizes step, 2*step, ... over `values`: split into len/size
// chunks, sum each, and stop at the first size whose mean / (population)
// sd of chunk sums reaches `min_ratio`.
BinSizeSearch search_bin_size(const std::vector<double>& values,
                              int step = 50, double min_ratio = 4.0);

// "chrom<TAB>start<TAB>end<TAB>gc<TAB>raw<TAB>corrected" rows
void write_bins(std::ostream& out, const std::vector<Bin>& bins);

}  // namespace gccorrect
