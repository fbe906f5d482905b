// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include "src/market/utc_time.hpp"
#include <expected>

namespace dvolkit {

/// Configuration for the model-free DVOL computation
///
/// Defaults reproduce the exchange-style 30-day index. Thresholds encode
/// data-sufficiency policy and change the output when altered.
struct DvolConfig {
    double target_days = 30.0;          ///< Constant maturity of the index
    double min_days = 2.0;              ///< Shortest usable expiry
    double max_days = 90.0;             ///< Longest usable expiry
    double days_per_year = kDaysPerYear;

    double max_iv = 5.0;                ///< Quotes with IV outside (0, max_iv] are excluded
    size_t min_strikes = 3;             ///< Distinct strikes required per expiry
    size_t min_otm_per_side = 3;        ///< OTM puts and OTM calls required per expiry
    size_t min_contributions = 6;       ///< Priced strikes required in the integral

    size_t high_quality_strikes = 5;    ///< Both legs at or above: "high"
    size_t medium_quality_strikes = 3;  ///< Both legs at or above: "medium"

    double degenerate_bracket_eps = 1e-10;  ///< Near/far closer than this (years) skip interpolation
    double rate = 0.0;                  ///< Discount rate for Black-76

    [[nodiscard]] double target_tau() const { return target_days / days_per_year; }
    [[nodiscard]] double min_tau() const { return min_days / days_per_year; }
    [[nodiscard]] double max_tau() const { return max_days / days_per_year; }
};

/// Check that a configuration is internally consistent
///
/// @return void on success, ValidationError naming the first bad field
std::expected<void, ValidationError> validate_dvol_config(const DvolConfig& config);

}  // namespace dvolkit
