// SPDX-License-Identifier: MIT
/**
 * @file expiry_variance.hpp
 * @brief Model-free (Carr-Madan) variance for a single expiry
 *
 * Discretized variance-swap replication over the listed strike grid:
 *
 *   sigma^2 = (2/T) * sum_i dK_i / K_i^2 * Q(K_i) - (1/T) * (F/K0 - 1)^2
 *
 * where Q(K) is the out-of-the-money option price at strike K (puts below
 * K0, calls above, the put/call average at K0) and K0 is the highest strike
 * not above the forward.
 */

#pragma once

#include "src/dvol/dvol_config.hpp"
#include "src/market/option_quote.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <map>
#include <optional>
#include <span>

namespace dvolkit {

/// Implied vols observed at one strike, at most one per option type
struct StrikeQuotes {
    std::optional<double> call_iv;
    std::optional<double> put_iv;
};

/// Strike grid of one expiry, ordered by strike
using StrikeBook = std::map<double, StrikeQuotes>;

/**
 * @brief Group quotes by strike
 *
 * Quotes with IV outside (0, max_iv] are dropped. When a strike carries
 * several quotes of the same type, the last one wins.
 *
 * @return Strike book, or NonFiniteInput/InvalidStrike for malformed quotes
 */
[[nodiscard]] std::expected<StrikeBook, DvolError>
build_strike_book(std::span<const OptionQuote> quotes, double max_iv = kMaxDecimalVol);

/// Highest strike not above the forward; the lowest strike if none is,
/// the forward itself for an empty book
[[nodiscard]] double find_k0(const StrikeBook& book, double forward);

/// Successful per-expiry variance estimate
struct VarianceResult {
    double variance = 0.0;       ///< Annualized variance
    size_t strike_count = 0;     ///< min(OTM puts, OTM calls): the limiting side
    size_t n_contributions = 0;  ///< Strikes that entered the integral
    double k0 = 0.0;             ///< Strike separating puts from calls
};

/**
 * @brief Model-free variance of one expiry
 *
 * All quotes must share one expiry. Insufficient-data errors carry the
 * achieved min(OTM puts, OTM calls) in `achieved_count` so callers can
 * report why an expiry was unusable.
 *
 * @param quotes Quotes of a single expiry
 * @param tau Time to expiry in years
 * @param forward Forward price for the expiry
 * @param config Thresholds and discount rate
 */
[[nodiscard]] std::expected<VarianceResult, DvolError>
compute_expiry_variance(std::span<const OptionQuote> quotes, double tau, double forward,
                        const DvolConfig& config = {});

/// Same as above with default thresholds and an explicit discount rate
[[nodiscard]] std::expected<VarianceResult, DvolError>
compute_expiry_variance(std::span<const OptionQuote> quotes, double tau, double forward,
                        double rate);

}  // namespace dvolkit
