#include "lowess.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>

#include <Eigen/Dense>

namespace gccorrect {

namespace {

struct Point {
    double x;
    double y;
};

double tricube(double u) {
    if (u >= 1.0) return 0.0;
    double t = 1.0 - u * u * u;
    return t * t * t;
}

double bisquare(double u) {
    if (u >= 1.0) return 0.0;
    double t = 1.0 - u * u;
    return t * t;
}

double median_of(std::vector<double> v) {
    if (v.empty()) return 0.0;
    size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    double m = v[mid];
    if (v.size() % 2 == 0) {
        m = (m + *std::max_element(v.begin(), v.begin() + mid)) / 2.0;
    }
    return m;
}

// Weighted local linear fit at x0 over the k points nearest to it
double fit_at(const std::vector<Point>& pts, const std::vector<double>& robustness,
              size_t k, double x0) {
    const size_t n = pts.size();
    size_t lo = std::lower_bound(pts.begin(), pts.end(), x0,
                                 [](const Point& p, double v) { return p.x < v; }) - pts.begin();
    size_t hi = lo;
    while (hi - lo < k) {
        if (lo > 0 && (hi == n || x0 - pts[lo - 1].x <= pts[hi].x - x0)) {
            --lo;
        } else {
            ++hi;
        }
    }
    double h = std::max(x0 - pts[lo].x, pts[hi - 1].x - x0);

    Eigen::Matrix2d xtwx = Eigen::Matrix2d::Zero();
    Eigen::Vector2d xtwy = Eigen::Vector2d::Zero();
    double wsum = 0.0, wysum = 0.0;
    for (size_t i = lo; i < hi; ++i) {
        double d = std::abs(pts[i].x - x0);
        double w = (h > 0.0 ? tricube(d / (h * 1.000001)) : 1.0) * robustness[i];
        if (w <= 0.0) continue;
        Eigen::Vector2d row(1.0, pts[i].x - x0);
        xtwx += w * row * row.transpose();
        xtwy += w * pts[i].y * row;
        wsum += w;
        wysum += w * pts[i].y;
    }
    if (wsum <= 0.0) return 0.0;

    Eigen::FullPivLU<Eigen::Matrix2d> lu(xtwx);
    if (!lu.isInvertible()) return wysum / wsum;
    return lu.solve(xtwy)(0);
}

}  // namespace

std::vector<double> lowess(const std::vector<double>& x, const std::vector<double>& y,
                           const std::vector<double>& at, const LowessParams& params) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("lowess: x and y differ in length");
    }
    if (x.empty()) {
        throw std::invalid_argument("lowess: no points");
    }

    std::vector<Point> pts(x.size());
    for (size_t i = 0; i < x.size(); ++i) pts[i] = {x[i], y[i]};
    std::sort(pts.begin(), pts.end(), [](const Point& a, const Point& b) { return a.x < b.x; });

    const size_t n = pts.size();
    const size_t k = std::min(n, std::max<size_t>(2, static_cast<size_t>(std::ceil(params.span * n))));
    std::vector<double> robustness(n, 1.0);

    double scale = 0.0;
    for (const auto& p : pts) scale += std::abs(p.y);
    scale /= n;

    // Points share few distinct x values; fit once per value
    std::vector<double> xs;
    for (const auto& p : pts) {
        if (xs.empty() || p.x != xs.back()) xs.push_back(p.x);
    }

    for (int iter = 0; iter < params.robustness_iterations; ++iter) {
        std::vector<double> fitted(xs.size());
        for (size_t j = 0; j < xs.size(); ++j) fitted[j] = fit_at(pts, robustness, k, xs[j]);

        std::vector<double> residuals(n);
        size_t j = 0;
        for (size_t i = 0; i < n; ++i) {
            while (xs[j] != pts[i].x) ++j;
            residuals[i] = std::abs(pts[i].y - fitted[j]);
        }
        double s = median_of(residuals);
        // residuals at rounding level: the fit is already exact
        if (s <= 1e-12 * scale) break;
        for (size_t i = 0; i < n; ++i) robustness[i] = bisquare(residuals[i] / (6.0 * s));
    }

    std::vector<double> out(at.size());
    for (size_t i = 0; i < at.size(); ++i) out[i] = fit_at(pts, robustness, k, at[i]);
    return out;
}

SmoothingResult smooth_bins(std::vector<Bin>& bins, const LowessParams& params) {
    SmoothingResult result;
    if (bins.empty()) return result;

    std::vector<size_t> fit_idx(bins.size());
    std::iota(fit_idx.begin(), fit_idx.end(), 0);
    if (fit_idx.size() > params.max_fit_points) {
        std::mt19937_64 rng(params.seed);
        std::shuffle(fit_idx.begin(), fit_idx.end(), rng);
        fit_idx.resize(params.max_fit_points);
    }

    std::vector<double> x, y;
    x.reserve(fit_idx.size());
    y.reserve(fit_idx.size());
    for (size_t i : fit_idx) {
        x.push_back(bins[i].gc_fraction());
        y.push_back(bins[i].corrected);
    }

    std::vector<double> coverage(bins.size());
    std::vector<double> gc(bins.size());
    for (size_t i = 0; i < bins.size(); ++i) {
        coverage[i] = bins[i].corrected;
        gc[i] = bins[i].gc_fraction();
    }
    result.median_coverage = median_of(coverage);

    std::vector<double> grid = gc;
    std::sort(grid.begin(), grid.end());
    grid.erase(std::unique(grid.begin(), grid.end()), grid.end());
    std::vector<double> curve = lowess(x, y, grid, params);

    for (size_t i = 0; i < bins.size(); ++i) {
        size_t g = std::lower_bound(grid.begin(), grid.end(), gc[i]) - grid.begin();
        if (curve[g] <= 0.0) {
            ++result.skipped;
            continue;
        }
        bins[i].corrected *= result.median_coverage / curve[g];
        ++result.rescaled;
    }
    return result;
}

}  // namespace gccorrect
