// SPDX-License-Identifier: MIT
#include "src/math/statistics.hpp"
#include <cmath>

namespace dvolkit {

std::optional<double> mean(std::span<const double> x) {
    if (x.empty()) return std::nullopt;
    double sum = 0.0;
    for (double v : x) sum += v;
    return sum / static_cast<double>(x.size());
}

std::optional<double> sample_stddev(std::span<const double> x) {
    if (x.size() < 2) return std::nullopt;
    const double m = *mean(x);
    double ss = 0.0;
    for (double v : x) ss += (v - m) * (v - m);
    double var = ss / static_cast<double>(x.size() - 1);
    return var > 0.0 ? std::sqrt(var) : 0.0;
}

std::optional<double> pearson_correlation(std::span<const double> x,
                                          std::span<const double> y) {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;
    const double mx = *mean(x);
    const double my = *mean(y);

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - mx;
        double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return std::nullopt;
    return sxy / std::sqrt(sxx * syy);
}

std::optional<double> mean_absolute_error(std::span<const double> x,
                                          std::span<const double> y) {
    if (x.size() != y.size() || x.empty()) return std::nullopt;
    double sum = 0.0;
    for (size_t i = 0; i < x.size(); ++i) sum += std::abs(x[i] - y[i]);
    return sum / static_cast<double>(x.size());
}

std::optional<double> root_mean_squared_error(std::span<const double> x,
                                              std::span<const double> y) {
    if (x.size() != y.size() || x.empty()) return std::nullopt;
    double sum = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double d = x[i] - y[i];
        sum += d * d;
    }
    return std::sqrt(sum / static_cast<double>(x.size()));
}

}  // namespace dvolkit
