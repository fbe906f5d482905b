// SPDX-License-Identifier: MIT
/**
 * @file dvol_index.hpp
 * @brief 30-day constant-maturity implied volatility from one snapshot hour
 *
 * Quotes are grouped by expiry, the two expiries bracketing the 30-day
 * target are selected, each is reduced to a model-free variance, and total
 * variance is interpolated linearly in time to the target.
 */

#pragma once

#include "src/dvol/dvol_config.hpp"
#include "src/dvol/expiry_variance.hpp"
#include "src/market/forward_curve.hpp"
#include "src/market/option_quote.hpp"
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace dvolkit {

/// Data-sufficiency grade of a DVOL estimate
enum class DvolQuality {
    High,
    Medium,
    Low
};

[[nodiscard]] std::string_view to_string(DvolQuality quality) noexcept;
[[nodiscard]] std::optional<DvolQuality> parse_quality(std::string_view s) noexcept;

/// All quotes of one expiry at one snapshot hour
struct ExpirySlice {
    UtcTime expiry;
    double tau = 0.0;        ///< Years from the snapshot hour to expiry
    double forward = 0.0;    ///< Futures forward, or spot as proxy
    std::vector<OptionQuote> quotes;
};

/// Per-snapshot-hour DVOL
struct DvolResult {
    double dvol = 0.0;               ///< Annualized vol, decimal (0.55 = 55%)
    DvolQuality quality = DvolQuality::Low;
    UtcTime near_expiry;
    UtcTime far_expiry;
    size_t n_near_strikes = 0;
    size_t n_far_strikes = 0;
    double near_variance = 0.0;
    double far_variance = 0.0;
    double near_tau = 0.0;
    double far_tau = 0.0;
};

/**
 * @brief Group quotes into expiry slices usable for a 30-day index
 *
 * Quotes without an expiry are dropped. Time to expiry is measured from
 * the snapshot hour (not from quote arrival) and expiries outside
 * [min_days, max_days] are discarded.
 *
 * @return Slices sorted by time to expiry
 */
[[nodiscard]] std::vector<ExpirySlice>
build_expiry_slices(std::span<const OptionQuote> quotes, UtcTime snapshot_hour,
                    double spot_price, const ForwardCurve* forwards,
                    const DvolConfig& config = {});

/**
 * @brief Indices of the near and far slices around the target maturity
 *
 * Picks the first adjacent pair with tau_i <= target <= tau_{i+1}. When the
 * target lies outside the available expiries, the two expiries on the
 * closest side are used.
 *
 * @param slices Slices sorted by tau (at least two)
 */
[[nodiscard]] std::optional<std::pair<size_t, size_t>>
select_bracketing_pair(std::span<const ExpirySlice> slices, double target_tau);

/**
 * @brief Annualized variance at the target maturity
 *
 * Linear interpolation of total variance (variance * tau) with the weight
 * clamped to [0, 1], so a non-bracketing pair degrades to one endpoint.
 * Expiries closer than `eps` years return the near variance unchanged.
 */
[[nodiscard]] double interpolate_variance(double near_variance, double near_tau,
                                          double far_variance, double far_tau,
                                          double target_tau, double eps = 1e-10);

/// "high" when both legs reach high_quality_strikes, "medium" for medium, else "low"
[[nodiscard]] DvolQuality grade_quality(size_t n_near, size_t n_far, const DvolConfig& config = {});

/**
 * @brief DVOL for one (asset, snapshot hour)
 *
 * Returns no result (as an insufficient-data error) when fewer than two
 * expiries survive the maturity filter or when either bracketing expiry
 * has no variance. There are no partial results.
 *
 * @param quotes Option quotes observed for the hour
 * @param snapshot_hour Start of the snapshot hour
 * @param spot_price Spot/index price for the hour
 * @param forwards Optional forward curve keyed by expiry
 * @param config Thresholds
 */
[[nodiscard]] std::expected<DvolResult, DvolError>
compute_dvol_at_hour(std::span<const OptionQuote> quotes, UtcTime snapshot_hour,
                     double spot_price, const ForwardCurve* forwards = nullptr,
                     const DvolConfig& config = {});

}  // namespace dvolkit
