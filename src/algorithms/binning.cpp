#include "binning.h"

#include <cmath>
#include <iomanip>
#include <limits>
#include <ostream>

#include "window_tally.h"

namespace gccorrect {

BinAccumulator::BinAccumulator(const std::string& chrom, int bin_size, std::vector<Bin>& out)
    : chrom_(chrom), bin_size_(bin_size), out_(out) {}

void BinAccumulator::add(int64_t pos, char base, int32_t raw, float corrected) {
    if (current_.bases == 0) {
        current_.chrom = chrom_;
        current_.start = pos;
    }
    current_.end = pos + 1;
    current_.bases += 1;
    if (is_gc(base)) current_.gc_bases += 1;
    current_.raw += raw;
    current_.corrected += corrected;

    if (current_.bases >= bin_size_) flush();
}

void BinAccumulator::flush() {
    if (current_.bases > 0) out_.push_back(current_);
    current_ = Bin();
}

std::vector<Bin> bin_contig(const Contig& contig, const BaseCounts& counts, int bin_size) {
    std::vector<Bin> bins;
    BinAccumulator acc(contig.name, bin_size, bins);
    for (size_t i = 0; i < counts.size(); ++i) {
        if (counts.excluded(i)) continue;
        const int64_t pos = counts.start + static_cast<int64_t>(i);
        acc.add(pos, contig.sequence[pos], counts.raw[i], counts.corrected[i]);
    }
    acc.flush();
    return bins;
}

std::vector<double> included_values(const BaseCounts& counts) {
    std::vector<double> values;
    values.reserve(counts.size());
    for (size_t i = 0; i < counts.size(); ++i) {
        if (!counts.excluded(i)) values.push_back(counts.corrected[i]);
    }
    return values;
}

BinSizeSearch search_bin_size(const std::vector<double>& values, int step, double min_ratio) {
    BinSizeSearch search;
    for (size_t size = step; ; size += step) {
        const size_t chunks = values.size() / size;
        if (chunks < 2) break;

        std::vector<double> sums(chunks, 0.0);
        for (size_t c = 0; c < chunks; ++c) {
            for (size_t i = c * size; i < (c + 1) * size; ++i) sums[c] += values[i];
        }

        double mean = 0.0;
        for (double s : sums) mean += s;
        mean /= chunks;
        double var = 0.0;
        for (double s : sums) var += (s - mean) * (s - mean);
        const double sd = std::sqrt(var / chunks);

        search.bin_size = static_cast<int>(size);
        search.ratio = sd > 0.0 ? mean / sd : std::numeric_limits<double>::infinity();
        if (sd == 0.0 || search.ratio >= min_ratio) {
            search.converged = true;
            return search;
        }
    }
    if (search.bin_size == 0) search.bin_size = step;
    return search;
}

void write_bins(std::ostream& out, const std::vector<Bin>& bins) {
    for (const auto& bin : bins) {
        out << bin.chrom << "\t" << bin.start << "\t" << bin.end << "\t"
            << bin.gc_bases << "\t" << bin.raw << "\t"
            << std::fixed << std::setprecision(4) << bin.corrected << "\n";
        out.unsetf(std::ios::floatfield);
    }
}

}  // namespace gccorrect
