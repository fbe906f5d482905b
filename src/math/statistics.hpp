// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <span>

namespace dvolkit {

/// Arithmetic mean; nullopt for an empty sample
[[nodiscard]] std::optional<double> mean(std::span<const double> x);

/// Bessel-corrected (n-1) standard deviation; nullopt for fewer than 2 values
[[nodiscard]] std::optional<double> sample_stddev(std::span<const double> x);

/**
 * @brief Pearson correlation of two equally sized samples
 *
 * @return nullopt when the sizes differ, fewer than 2 pairs are given, or
 *         either sample has zero variance (correlation undefined)
 */
[[nodiscard]] std::optional<double> pearson_correlation(std::span<const double> x,
                                                        std::span<const double> y);

/// Mean absolute difference; nullopt for empty or mismatched samples
[[nodiscard]] std::optional<double> mean_absolute_error(std::span<const double> x,
                                                        std::span<const double> y);

/// Root mean squared difference; nullopt for empty or mismatched samples
[[nodiscard]] std::optional<double> root_mean_squared_error(std::span<const double> x,
                                                            std::span<const double> y);

}  // namespace dvolkit
