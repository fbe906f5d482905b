// SPDX-License-Identifier: MIT
/**
 * @file vov_series.hpp
 * @brief Volatility of volatility and the f_VoV scaling factor
 *
 * VoV is the annualized rolling standard deviation of daily DVOL log
 * returns. f_VoV compares each day's VoV with the full-sample mean and is
 * therefore a batch computation: the series is materialized first and
 * scaled in a second pass.
 */

#pragma once

#include "src/support/error_types.hpp"
#include "src/vov/daily_resample.hpp"
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dvolkit {

/// VoV parameters
struct VovConfig {
    size_t window = 30;                 ///< Trailing window, days (inclusive of the current day)
    size_t min_valid_returns = 20;      ///< Fewer valid returns in the window leave vov empty
    double annualization_days = 365.0;  ///< Crypto trades every calendar day
    double alpha = 0.75;                ///< f_VoV exponent
    double f_vov_cap = 2.0;             ///< Upper bound on f_VoV
};

/// @return void on success, ValidationError naming the first bad field
std::expected<void, ValidationError> validate_vov_config(const VovConfig& config);

/// One day of the VoV series
struct VovRecord {
    std::string date;
    UtcTime timestamp;
    double dvol_daily = 0.0;
    std::optional<double> log_return;   ///< Empty on the first day
    std::optional<double> vov;          ///< Empty until the window fills or when returns are sparse
    std::optional<double> f_vov;        ///< Set by add_f_vov_to_series()
};

/**
 * @brief Rolling VoV over a daily series
 *
 * Days with index < window never get a vov. For later days, fewer than
 * `min_valid_returns` valid returns in the window leave vov empty and set
 * f_vov to 1.0.
 *
 * @return One record per input day; empty when fewer than two days are given
 *         or when `config` fails validate_vov_config()
 */
[[nodiscard]] std::vector<VovRecord> compute_vov_series(std::span<const DailyDvol> daily,
                                                        const VovConfig& config = {});

/// Mean of the present vov values, or 1.0 when there are none
[[nodiscard]] double compute_vov_bar(std::span<const VovRecord> records);

/**
 * @brief f_VoV = min((vov / vov_bar)^alpha, cap)
 *
 * An absent or non-positive vov and a non-positive vov_bar all map to the
 * neutral factor 1.0, which keeps every result in (0, cap].
 */
[[nodiscard]] double compute_f_vov(std::optional<double> vov, double vov_bar,
                                   const VovConfig& config = {});

/// Second pass: fill f_vov on every record from the series-wide vov_bar
void add_f_vov_to_series(std::vector<VovRecord>& records, const VovConfig& config = {});

/// Resample, VoV and f_VoV for one asset's hourly DVOL series
[[nodiscard]] std::vector<VovRecord> compute_vov_pipeline(std::span<const DvolObservation> hourly,
                                                          const VovConfig& config = {});

/// Run compute_vov_pipeline() for every asset, assets in parallel
[[nodiscard]] std::map<std::string, std::vector<VovRecord>>
compute_vov_by_asset(const std::map<std::string, std::vector<DvolObservation>>& hourly_by_asset,
                     const VovConfig& config = {});

}  // namespace dvolkit
