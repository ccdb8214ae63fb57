#include "region_corrector.h"

#include <algorithm>
#include <memory>

#include "window_tally.h"

namespace gccorrect {

namespace {

float lookup(const RateTable& rates, const SlidingWindow& w) {
    if (w.tally().size() == 0) return -1.0f;
    int64_t gc = w.tally().gc();
    if (!rates.has_rate(static_cast<int>(gc))) return -1.0f;
    return static_cast<float>(rates.rate(static_cast<int>(gc)));
}

}  // namespace

std::vector<CorrectUnit> plan_correct_units(size_t contig, int64_t length, int threads) {
    std::vector<CorrectUnit> units;
    if (length <= 0) return units;
    const int64_t parts = std::max(threads, 1);
    const int64_t step = (length + parts - 1) / parts;
    for (int64_t start = 0; start < length; start += step) {
        units.push_back({contig, start, std::min(start + step, length)});
    }
    return units;
}

void window_rates(const Contig& contig, const std::vector<bool>& mask,
                  const RateTable& rates, const CorrectUnit& unit,
                  const CorrectParams& params,
                  std::vector<float>& forward, std::vector<float>& reverse) {
    const size_t n = static_cast<size_t>(unit.end - unit.start);
    forward.assign(n, -1.0f);
    reverse.assign(n, -1.0f);

    SlidingWindow fw(contig.sequence, params.shift, params.window);
    SlidingWindow rv(contig.sequence, -(params.window + params.shift), params.window);
    fw.reset(unit.start);
    rv.reset(unit.start);

    for (int64_t i = unit.start; i < unit.end; ++i) {
        if (i > unit.start) {
            fw.advance();
            rv.advance();
        }
        if (!mask[i]) continue;
        const size_t k = static_cast<size_t>(i - unit.start);
        forward[k] = lookup(rates, fw);
        reverse[k] = lookup(rates, rv);
    }
}

BaseCounts correct_region(AlignmentFile& file, const Contig& contig,
                          const std::vector<bool>& mask, const RateTable& rates,
                          const CorrectUnit& unit, const CorrectParams& params,
                          const CancellationToken& token) {
    std::vector<float> forward, reverse;
    window_rates(contig, mask, rates, unit, params, forward, reverse);

    BaseCounts counts;
    counts.start = unit.start;
    counts.raw.assign(forward.size(), 0);
    counts.corrected.assign(forward.size(), 0.0f);
    for (size_t k = 0; k < forward.size(); ++k) {
        if (forward[k] < 0.0f || reverse[k] < 0.0f) {
            counts.raw[k] = BaseCounts::SENTINEL;
            counts.corrected[k] = BaseCounts::SENTINEL;
        }
    }

    // A reverse read whose end lands on unit.start only overlaps the base before it
    CancellationCheck interrupt(token, contig.name);
    RegionReader reader(file, contig.name, std::max<int64_t>(unit.start - 1, 0), unit.end);
    while (reader.next()) {
        interrupt.step();
        const bam1_t* b = reader.record();
        if (b->core.flag & EXCLUDED_FLAGS) continue;
        if (b->core.qual < params.min_mapq) continue;

        const bool reverse_strand = bam_is_rev(b);
        const int64_t pos = reverse_strand ? bam_endpos(b) : b->core.pos;
        // bam_endpos is one past the last aligned base; at the contig end it is off the contig
        if (pos < unit.start || pos >= unit.end) continue;

        const size_t k = static_cast<size_t>(pos - unit.start);
        if (counts.excluded(k)) continue;

        counts.raw[k] += 1;
        counts.corrected[k] += reverse_strand ? reverse[k] : forward[k];
    }
    return counts;
}

BaseCounts correct_contig(const std::string& bam_path, const Contig& contig, size_t contig_index,
                          const std::vector<bool>& mask, const RateTable& rates,
                          const CorrectParams& params, int threads,
                          CancellationToken& token, Logger& log) {
    auto units = plan_correct_units(contig_index, contig.length, threads);

    auto parts = run_units<BaseCounts>(
        units, threads, token,
        [&bam_path]() { return std::make_unique<AlignmentFile>(bam_path); },
        [&](std::unique_ptr<AlignmentFile>& file, const CorrectUnit& unit) {
            return correct_region(*file, contig, mask, rates, unit, params, token);
        },
        &log, contig.name);

    BaseCounts merged;
    merged.raw.reserve(contig.length);
    merged.corrected.reserve(contig.length);
    for (auto& part : parts) {
        merged.raw.insert(merged.raw.end(), part.raw.begin(), part.raw.end());
        merged.corrected.insert(merged.corrected.end(), part.corrected.begin(),
                                part.corrected.end());
    }
    return merged;
}

}  // namespace gccorrect
