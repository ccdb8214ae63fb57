#include "rate_estimator.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <random>
#include <sstream>

#include "window_tally.h"

namespace gccorrect {

namespace {

bool window_fits(int64_t pos, const RateParams& params, int64_t contig_length) {
    return pos + params.shift >= 0 && pos + params.insert_length - params.shift <= contig_length;
}

}  // namespace

std::vector<RateUnit> plan_rate_units(const ReferenceIndex& ref, int threads,
                                      double fraction, uint64_t seed) {
    const int64_t parts = std::max(threads, 1);
    const double genome = static_cast<double>(std::max<int64_t>(ref.total_length(), 1));

    std::vector<RateUnit> units;
    for (size_t ci = 0; ci < ref.size(); ++ci) {
        const int64_t length = ref[ci].length;
        if (length == 0) continue;
        const int64_t step = (length + parts - 1) / parts;
        for (int64_t start = 0; start < length; start += step) {
            RateUnit unit;
            unit.contig = ci;
            unit.start = start;
            unit.end = std::min(start + step, length);
            const double span = static_cast<double>(unit.end - unit.start);
            unit.numselect = static_cast<int64_t>(std::llround(
                fraction <= 1.0 ? fraction * span : fraction * span / genome));
            unit.seed = seed + 0x9E3779B97F4A7C15ULL * (units.size() + 1);
            units.push_back(unit);
        }
    }
    return units;
}

std::vector<int64_t> draw_positions(const RateUnit& unit) {
    std::vector<int64_t> drawn;
    if (unit.numselect <= 0 || unit.end <= unit.start) return drawn;

    std::mt19937_64 rng(unit.seed);
    std::uniform_int_distribution<int64_t> position(unit.start, unit.end - 1);
    drawn.reserve(unit.numselect);
    for (int64_t i = 0; i < unit.numselect; ++i) drawn.push_back(position(rng));
    std::sort(drawn.begin(), drawn.end());
    drawn.erase(std::unique(drawn.begin(), drawn.end()), drawn.end());
    return drawn;
}

int column_fragments(const PileupColumn& column, const RateParams& params) {
    if (!params.cutoffs.accepts(column.depth)) return -1;
    if (column.depth > 0 && column.mean_mapq() < params.min_mapq) return -1;
    return column.forward_heads();
}

UnitCounts process_region(AlignmentFile& file, const Contig& contig,
                          const std::vector<bool>& mask, const RateUnit& unit,
                          const RateParams& params, const CancellationToken& token) {
    UnitCounts result;
    result.counts.resize(params.insert_length + 1);
    result.drawn = draw_positions(unit);

    std::vector<int64_t> candidates;
    for (int64_t pos : result.drawn) {
        if (mask[pos] && window_fits(pos, params, contig.length)) candidates.push_back(pos);
    }
    if (candidates.empty()) return result;

    CancellationCheck interrupt(token, "pass 1");
    PileupWalker walker(file, contig.name, candidates.front(), candidates.back() + 1);
    PileupColumn column;
    size_t next = 0;
    while (next < candidates.size() && walker.next(column)) {
        interrupt.step();
        while (next < candidates.size() && candidates[next] < column.pos) ++next;
        if (next == candidates.size() || candidates[next] != column.pos) continue;

        int frags = column_fragments(column, params);
        if (frags < 0) continue;

        int64_t gc = count_gc(contig.sequence, column.pos + params.shift,
                              column.pos + params.insert_length - params.shift);
        result.counts[gc].positions += 1;
        result.counts[gc].fragments += frags;
        ++result.evaluated;
    }
    return result;
}

UnitCounts process_region_left(AlignmentFile& file, const Contig& contig,
                               const std::vector<bool>& mask, const RateUnit& unit,
                               const RateParams& params, const std::vector<bool>& left,
                               const std::vector<int64_t>& drawn,
                               const CancellationToken& token) {
    UnitCounts result;
    result.counts.resize(params.insert_length + 1);

    SlidingWindow window(contig.sequence, params.shift, params.window());
    CancellationCheck interrupt(token, "pass 2");
    PileupWalker walker(file, contig.name, unit.start, unit.end);
    PileupColumn column;
    size_t next_drawn = 0;
    while (walker.next(column)) {
        interrupt.step();
        const int64_t pos = column.pos;
        while (next_drawn < drawn.size() && drawn[next_drawn] < pos) ++next_drawn;
        if (next_drawn < drawn.size() && drawn[next_drawn] == pos) continue;
        if (!mask[pos] || !window_fits(pos, params, contig.length)) continue;

        window.seek(pos);
        const int64_t gc = window.tally().gc();
        if (!left[gc]) continue;

        int frags = column_fragments(column, params);
        if (frags < 0) continue;

        result.counts[gc].positions += 1;
        result.counts[gc].fragments += frags;
        ++result.evaluated;
    }
    return result;
}

RateEstimate estimate_rates(const std::string& bam_path, const ReferenceIndex& ref,
                            const MappabilityMask& mask, const RateParams& params,
                            const SamplingConfig& sampling, int64_t min_positions,
                            CancellationToken& token, Logger& log) {
    if (params.insert_length <= 0 || params.shift < 0 || params.window() <= 0) {
        std::ostringstream ss;
        ss << "GC window is empty (insert length " << params.insert_length
           << ", shift " << params.shift << ")";
        throw std::invalid_argument(ss.str());
    }

    auto units = plan_rate_units(ref, sampling.threads, sampling.fraction, sampling.seed);
    log.info("Pass 1: sampling positions in " + std::to_string(units.size()) + " units");

    auto open_bam = [&bam_path]() { return std::make_unique<AlignmentFile>(bam_path); };

    auto first = run_units<UnitCounts>(
        units, sampling.threads, token, open_bam,
        [&](std::unique_ptr<AlignmentFile>& file, const RateUnit& unit) {
            const Contig& contig = ref[unit.contig];
            return process_region(*file, contig, mask.mask(contig.name), unit, params, token);
        },
        &log, "pass 1");

    RateEstimate estimate;
    estimate.table = RateTable(params.insert_length);
    for (const auto& r : first) {
        estimate.table.add(r.counts);
        estimate.pass1_positions += r.evaluated;
    }

    estimate.left_over = estimate.table.under_sampled(min_positions);
    log.metric("pass1_positions", static_cast<int64_t>(estimate.pass1_positions));
    log.metric("left_over_gc_values", static_cast<int64_t>(estimate.left_over.size()));

    if (!estimate.left_over.empty()) {
        std::vector<bool> left(params.insert_length + 1, false);
        for (int gc : estimate.left_over) left[gc] = true;

        // Pass 2 reuses the pass 1 draws; each unit only needs its own
        std::vector<size_t> order(units.size());
        for (size_t i = 0; i < order.size(); ++i) order[i] = i;

        log.info("Pass 2: scanning all positions for " +
                 std::to_string(estimate.left_over.size()) + " under-sampled GC values");
        auto second = run_units<UnitCounts>(
            order, sampling.threads, token, open_bam,
            [&](std::unique_ptr<AlignmentFile>& file, size_t i) {
                const RateUnit& unit = units[i];
                const Contig& contig = ref[unit.contig];
                return process_region_left(*file, contig, mask.mask(contig.name), unit,
                                           params, left, first[i].drawn, token);
            },
            &log, "pass 2");

        for (const auto& r : second) {
            estimate.table.add(r.counts);
            estimate.pass2_positions += r.evaluated;
        }
    }
    log.metric("pass2_positions", static_cast<int64_t>(estimate.pass2_positions));

    estimate.table.finalize(min_positions);
    log.metric("global_mean_rate", estimate.table.global_mean_rate(), 6);
    return estimate;
}

}  // namespace gccorrect
