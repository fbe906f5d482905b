// SPDX-License-Identifier: MIT
/**
 * @file option_quote.hpp
 * @brief Option market observations handed to the volatility core
 */

#pragma once

#include "src/market/utc_time.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace dvolkit {

/**
 * Option type enumeration.
 */
enum class OptionType {
    CALL,
    PUT
};

/// Parse "C"/"P" (either case)
[[nodiscard]] std::optional<OptionType> parse_option_type(std::string_view s) noexcept;

/**
 * @brief One option market observation
 *
 * Quotes are immutable observations. The core only filters and groups them.
 * `expiry` is normalized to the daily 08:00 UTC cutoff upstream; a quote
 * without an expiry is dropped by the hourly driver.
 */
struct OptionQuote {
    double strike = 0.0;                    ///< Strike in quote currency
    std::optional<UtcTime> expiry;          ///< Expiry timestamp
    OptionType type = OptionType::CALL;     ///< CALL or PUT
    double mark_iv = 0.0;                   ///< Annualized implied vol, decimal, valid in (0, 5]
    std::optional<double> mark_price;       ///< Informational only
    std::optional<double> underlying_price; ///< Spot/index observed with the quote
};

/// Upper bound of a decimal implied volatility; larger raw values are percentages
inline constexpr double kMaxDecimalVol = 5.0;

/// Normalize an exchange volatility quote to a decimal
///
/// Feeds publish volatility either as a decimal (0.55) or as a percentage
/// (55.0). Anything above 5.0 is read as a percentage and divided by 100.
/// Decimal vols above 500% are therefore misread; the threshold is kept for
/// parity with the published index history.
///
/// @return Decimal volatility in (0, 5], or nullopt if unusable
[[nodiscard]] std::optional<double> normalize_vol_quote(double raw) noexcept;

/// Components of an exchange option instrument name
struct InstrumentInfo {
    std::string asset;      ///< "BTC", "SOL", ...
    UtcTime expiry;         ///< Expiry date at the 08:00 UTC cutoff
    double strike = 0.0;
    OptionType type = OptionType::CALL;
};

/// Daily expiry cutoff hour (UTC)
inline constexpr int kExpiryCutoffHour = 8;

/// Parse names like "BTC-25SEP20-6000-C" or "SOL_USDC-7MAR25-150.5-P"
///
/// Two-digit years are taken as 20xx. The asset is the prefix before the
/// first underscore.
[[nodiscard]] std::optional<InstrumentInfo> parse_instrument_name(std::string_view name);

}  // namespace dvolkit
