#include "coverage_estimator.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <sstream>

namespace gccorrect {

bool is_insert_record(const bam1_t* b) {
    const uint16_t flag = b->core.flag;
    if (flag & (EXCLUDED_FLAGS | BAM_FMUNMAP)) return false;
    if (!(flag & BAM_FPROPER_PAIR)) return false;
    return b->core.isize > 0;
}

InsertEstimate estimate_insert(AlignmentFile& file, std::mt19937_64& rng,
                               const CancellationToken& token,
                               double keep_probability, size_t target) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::vector<double> lengths;
    lengths.reserve(target);

    CancellationCheck interrupt(token, "insert estimate");
    BamRecordPtr b = make_record();
    while (lengths.size() < target && file.read(b.get())) {
        interrupt.step();
        if (coin(rng) >= keep_probability) continue;
        if (!is_insert_record(b.get())) continue;
        lengths.push_back(static_cast<double>(b->core.isize));
    }

    if (lengths.size() < 2) {
        throw InsertEstimateError(
            "too few proper pairs to estimate the insert length; "
            "pass --insert-mean and --insert-stdev");
    }

    InsertEstimate est;
    est.samples = lengths.size();
    double sum = 0.0;
    for (double x : lengths) sum += x;
    est.mean = sum / lengths.size();
    double var_sum = 0.0;
    for (double x : lengths) var_sum += (x - est.mean) * (x - est.mean);
    est.stdev = std::sqrt(var_sum / (lengths.size() - 1));

    if (est.mean - 3.0 * est.stdev < 0.0) {
        std::ostringstream ss;
        ss << "estimated insert length " << est.mean << " +/- " << est.stdev
           << " is implausible (mean - 3 sd < 0); pass --insert-mean and --insert-stdev";
        throw InsertEstimateError(ss.str());
    }
    return est;
}

CoverageCutoffs poisson_cutoffs(double coverage) {
    if (!(coverage > 0.0)) {
        throw std::invalid_argument("coverage must be positive");
    }

    CoverageCutoffs c;
    c.mean = coverage;
    c.stdev = std::sqrt(coverage);

    if (coverage > 100.0) {
        c.min_depth = 0.5 * coverage;
        c.max_depth = 2.0 * coverage;
        return c;
    }

    auto pmf = [coverage](int64_t k) {
        return std::exp(k * std::log(coverage) - coverage - std::lgamma(k + 1.0));
    };

    int64_t lo = static_cast<int64_t>(std::floor(coverage));
    int64_t hi = lo;
    double mass = pmf(lo);
    while (mass <= 0.999) {
        double left = lo > 0 ? pmf(lo - 1) : -1.0;
        double right = pmf(hi + 1);
        if (left > right) {
            --lo;
            mass += left;
        } else {
            ++hi;
            mass += right;
        }
    }
    c.min_depth = static_cast<double>(lo);
    c.max_depth = static_cast<double>(hi);
    return c;
}

std::vector<CoverageUnit> plan_coverage_units(const ReferenceIndex& ref,
                                              const MappabilityMask& mask,
                                              double fraction, std::mt19937_64& rng) {
    std::vector<CoverageUnit> units;
    for (const auto& contig : ref.contigs()) {
        if (contig.length == 0) continue;
        const auto& anchors = mask.long_segments(contig.name);
        if (!anchors.empty()) {
            std::uniform_int_distribution<size_t> pick(0, anchors.size() - 1);
            const Segment& s = anchors[pick(rng)];
            units.push_back({contig.name, s.start, s.end});
            continue;
        }
        int64_t size = static_cast<int64_t>(fraction * contig.length / 2.0);
        size = std::max<int64_t>(1, std::min(size, contig.length));
        std::uniform_int_distribution<int64_t> start(0, contig.length - size);
        int64_t s = start(rng);
        units.push_back({contig.name, s, s + size});
    }
    return units;
}

DepthHistogram depth_histogram(AlignmentFile& file, const CoverageUnit& unit,
                               const CancellationToken& token, int min_mean_mapq) {
    DepthHistogram histogram;
    CancellationCheck interrupt(token, "coverage");
    PileupWalker walker(file, unit.contig, unit.start, unit.end);
    PileupColumn column;
    while (walker.next(column)) {
        interrupt.step();
        if (column.mean_mapq() < min_mean_mapq) continue;
        ++histogram[column.depth];
    }
    return histogram;
}

CoverageCutoffs cutoffs_from_histogram(const DepthHistogram& histogram) {
    double n = 0.0, sum = 0.0;
    for (const auto& [depth, count] : histogram) {
        n += count;
        sum += static_cast<double>(depth) * count;
    }
    if (n < 2) {
        throw std::runtime_error(
            "too few covered positions to estimate coverage; pass --coverage");
    }

    CoverageCutoffs c;
    c.mean = sum / n;
    double var_sum = 0.0;
    for (const auto& [depth, count] : histogram) {
        double diff = depth - c.mean;
        var_sum += diff * diff * count;
    }
    c.stdev = std::sqrt(var_sum / (n - 1));
    c.min_depth = std::max(0.0, c.mean - 3.0 * c.stdev);
    c.max_depth = std::max(0.0, c.mean + 3.0 * c.stdev);
    return c;
}

CoverageCutoffs estimate_coverage(const std::string& bam_path, const ReferenceIndex& ref,
                                  const MappabilityMask& mask, const SamplingConfig& sampling,
                                  CancellationToken& token, Logger& log) {
    double fraction = sampling.fraction;
    if (fraction > 1.0) {
        fraction = std::min(1.0, fraction / std::max<int64_t>(1, ref.total_length()));
    }

    std::mt19937_64 rng(sampling.seed);
    auto units = plan_coverage_units(ref, mask, fraction, rng);
    log.detail("Sampling depth over " + std::to_string(units.size()) + " intervals");

    auto histograms = run_units<DepthHistogram>(
        units, sampling.threads, token,
        [&bam_path]() { return std::make_unique<AlignmentFile>(bam_path); },
        [&token](std::unique_ptr<AlignmentFile>& file, const CoverageUnit& unit) {
            return depth_histogram(*file, unit, token);
        },
        &log, "coverage");

    DepthHistogram merged;
    for (const auto& h : histograms) {
        for (const auto& [depth, count] : h) merged[depth] += count;
    }
    return cutoffs_from_histogram(merged);
}

AlignmentProfile profile_alignments(const std::string& bam_path, const ReferenceIndex& ref,
                                    const MappabilityMask& mask, const SamplingConfig& sampling,
                                    CancellationToken& token, Logger& log) {
    AlignmentProfile profile;

    if (sampling.insert_mean > 0.0) {
        profile.insert.mean = sampling.insert_mean;
        profile.insert.stdev = sampling.insert_stdev;
    } else {
        log.info("Estimating insert length from " + bam_path);
        AlignmentFile file(bam_path);
        std::mt19937_64 rng(sampling.seed);
        profile.insert = estimate_insert(file, rng, token);
        profile.insert_inferred = true;
        log.decision("insert_length", std::to_string(std::lround(profile.insert.mean)),
                     "inferred from " + std::to_string(profile.insert.samples) + " proper pairs");
    }
    log.metric("insert_mean", profile.insert.mean, 2);
    log.metric("insert_stdev", profile.insert.stdev, 2);

    if (sampling.coverage > 0.0) {
        profile.cutoffs = poisson_cutoffs(sampling.coverage);
        log.decision("coverage_cutoffs", "Lander-Waterman",
                     "expected coverage " + std::to_string(sampling.coverage) + " given");
    } else {
        log.info("Estimating coverage from pileup samples");
        profile.cutoffs = estimate_coverage(bam_path, ref, mask, sampling, token, log);
        profile.coverage_inferred = true;
        log.decision("coverage_cutoffs", "mean +/- 3 sd", "inferred from pileup depth");
    }
    token.check("alignment profile");
    log.metric("coverage_mean", profile.cutoffs.mean, 2);
    log.metric("coverage_stdev", profile.cutoffs.stdev, 2);
    log.metric("min_depth", profile.cutoffs.min_depth, 2);
    log.metric("max_depth", profile.cutoffs.max_depth, 2);
    return profile;
}

}  // namespace gccorrect
