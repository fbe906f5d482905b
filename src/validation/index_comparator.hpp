// SPDX-License-Identifier: MIT
/**
 * @file index_comparator.hpp
 * @brief Agreement between the reconstructed DVOL and the exchange's index
 *
 * An acceptance check, not a pipeline stage: a failed comparison is reported
 * through the result and the comparison_result probe and never aborts.
 */

#pragma once

#include "src/dvol/dvol_index.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace dvolkit {

struct ComparatorConfig {
    size_t min_common_days = 5;
    double pass_correlation = 0.90;     ///< Strictly greater passes
    std::vector<DvolQuality> accepted_quality{DvolQuality::High, DvolQuality::Medium};
};

/// @return void on success, ValidationError naming the first bad field
std::expected<void, ValidationError> validate_comparator_config(const ComparatorConfig& config);

/// One value of the official index (daily close or finer)
struct IndexObservation {
    UtcTime timestamp;
    double value = 0.0;                 ///< Percent or decimal, see normalize_vol_quote()
};

/// One computed DVOL value with its quality grade
struct QualifiedDvol {
    UtcTime timestamp;
    double dvol = 0.0;
    DvolQuality quality = DvolQuality::Low;
};

struct ComparisonReport {
    size_t n_days = 0;
    std::optional<double> correlation;  ///< Undefined when either series is constant
    double mae = 0.0;
    double rmse = 0.0;
    double bias = 0.0;                  ///< Mean of computed minus official
    bool passed = false;
};

/**
 * @brief Compare daily closes of both series on their common UTC days
 *
 * Official values are normalized to decimals; unusable ones are dropped.
 * Computed values outside the accepted quality grades are dropped. Each
 * series keeps its last value per UTC day.
 *
 * @return Report, TooFewCommonDays when the overlap is below the minimum,
 *         or InvalidConfig when `config` fails validate_comparator_config()
 */
[[nodiscard]] std::expected<ComparisonReport, DvolError>
compare_with_official_index(std::span<const IndexObservation> official,
                            std::span<const QualifiedDvol> computed,
                            const ComparatorConfig& config = {});

}  // namespace dvolkit
