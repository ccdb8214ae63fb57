#pragma once

#include <cstdint>
#include <vector>

#include "binning.h"

namespace gccorrect {

struct LowessParams {
    double span = 2.0 / 3.0;        // fraction of points in each local fit
    int robustness_iterations = 3;
    size_t max_fit_points = 50000;  // larger inputs are subsampled for the fit
    uint64_t seed = 42;
};

// Locally weighted linear regression of y on x (tricube weights, bisquare
// robustness), evaluated at every value of `at`
std::vector<double> lowess(const std::vector<double>& x, const std::vector<double>& y,
                           const std::vector<double>& at, const LowessParams& params = {});

struct SmoothingResult {
    double median_coverage = 0.0;
    size_t rescaled = 0;
    size_t skipped = 0;     // bins where the fitted curve is not positive
};

// Fit corrected count against GC fraction over all bins and rescale each
// bin by median(corrected) / curve(gc)
SmoothingResult smooth_bins(std::vector<Bin>& bins, const LowessParams& params = {});

}  // namespace gccorrect
