#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace gccorrect {

struct GcCounts {
    uint64_t positions = 0;   // reference positions observed with this GC
    uint64_t fragments = 0;   // fragment starts observed on those positions
};

// GC value (0..insert_length) -> observed counts and correction rate.
// A rate exists for a GC value when positions >= min_positions and
// fragments > 0:
//   rate = global_mean_rate * positions / fragments
//   global_mean_rate = sum(fragments) / sum(positions)
class RateTable {
public:
    RateTable() = default;
    explicit RateTable(int insert_length);

    void add(int gc, uint64_t positions, uint64_t fragments);
    void add(const std::vector<GcCounts>& counts);

    // Compute the global mean rate and every per-GC rate
    void finalize(int64_t min_positions);

    int insert_length() const { return static_cast<int>(counts_.size()) - 1; }
    size_t size() const { return counts_.size(); }
    const GcCounts& counts(int gc) const { return counts_[gc]; }
    uint64_t total_positions() const;
    uint64_t total_fragments() const;
    double global_mean_rate() const { return global_mean_; }

    bool has_rate(int gc) const { return gc >= 0 && gc < (int)rates_.size() && usable_[gc]; }
    double rate(int gc) const { return rates_[gc]; }

    // GC values with fewer than min_positions observed positions
    std::vector<int> under_sampled(int64_t min_positions) const;

    // "gc<TAB>positions<TAB>fragments<TAB>rate" rows, rate "-" when unusable
    void write(std::ostream& out) const;

    // Parse rows written by write(). Rows must cover 0..N in order. Throws
    // std::runtime_error on malformed input.
    static RateTable read(std::istream& in);
    static RateTable read_file(const std::string& path);

private:
    std::vector<GcCounts> counts_;
    std::vector<double> rates_;
    std::vector<bool> usable_;
    double global_mean_ = 0.0;
};

}  // namespace gccorrect
