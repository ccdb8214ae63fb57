#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <random>

#include "algorithms/lowess.h"

using namespace gccorrect;

namespace {

double coefficient_of_variation(const std::vector<Bin>& bins) {
    double mean = 0.0;
    for (const auto& b : bins) mean += b.corrected;
    mean /= bins.size();
    double var = 0.0;
    for (const auto& b : bins) var += (b.corrected - mean) * (b.corrected - mean);
    return std::sqrt(var / bins.size()) / mean;
}

}  // namespace

TEST(Lowess, RecoversALine) {
    std::vector<double> x, y;
    for (int i = 0; i <= 100; ++i) {
        x.push_back(i / 100.0);
        y.push_back(2.0 * x.back() + 1.0);
    }
    std::vector<double> at = {0.0, 0.25, 0.5, 1.0};
    auto fit = lowess(x, y, at);
    for (size_t i = 0; i < at.size(); ++i) {
        EXPECT_NEAR(fit[i], 2.0 * at[i] + 1.0, 1e-9);
    }
}

TEST(Lowess, ResistsOutliers) {
    std::mt19937_64 rng(4);
    std::normal_distribution<double> noise(0.0, 0.05);
    std::vector<double> x, y;
    for (int i = 0; i < 200; ++i) {
        x.push_back(i / 200.0);
        y.push_back(5.0 + noise(rng));
    }
    y[100] = 500.0;
    y[101] = -400.0;

    auto fit = lowess(x, y, {0.5});
    EXPECT_NEAR(fit[0], 5.0, 0.1);
}

TEST(Lowess, RejectsMismatchedInput) {
    EXPECT_THROW(lowess({1.0, 2.0}, {1.0}, {1.0}), std::invalid_argument);
    EXPECT_THROW(lowess({}, {}, {1.0}), std::invalid_argument);
}

TEST(SmoothBins, FlattensGcTrend) {
    std::mt19937_64 rng(8);
    std::uniform_int_distribution<int> gc(200, 700);
    std::vector<Bin> bins;
    for (int i = 0; i < 2000; ++i) {
        Bin b;
        b.chrom = "chr1";
        b.start = i * 1000;
        b.end = b.start + 1000;
        b.bases = 1000;
        b.gc_bases = gc(rng);
        b.corrected = 40.0 + 80.0 * b.gc_fraction();
        bins.push_back(b);
    }
    const double before = coefficient_of_variation(bins);

    SmoothingResult r = smooth_bins(bins);
    EXPECT_EQ(r.rescaled, bins.size());
    EXPECT_EQ(r.skipped, 0u);
    EXPECT_GT(r.median_coverage, 40.0);
    EXPECT_LT(coefficient_of_variation(bins), before / 10.0);
    for (const auto& b : bins) EXPECT_NEAR(b.corrected, r.median_coverage, 0.5);
}

TEST(SmoothBins, SubsamplesLargeInputs) {
    std::vector<Bin> bins(300);
    for (size_t i = 0; i < bins.size(); ++i) {
        bins[i].bases = 100;
        bins[i].gc_bases = 30 + static_cast<int64_t>(i % 40);
        bins[i].corrected = 10.0;
    }
    LowessParams params;
    params.max_fit_points = 50;
    SmoothingResult r = smooth_bins(bins, params);
    EXPECT_DOUBLE_EQ(r.median_coverage, 10.0);
    for (const auto& b : bins) EXPECT_NEAR(b.corrected, 10.0, 1e-9);
}

TEST(SmoothBins, EmptyInputIsANoOp) {
    std::vector<Bin> bins;
    SmoothingResult r = smooth_bins(bins);
    EXPECT_EQ(r.rescaled, 0u);
}
