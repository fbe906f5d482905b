// SPDX-License-Identifier: MIT
/**
 * @file synthetic_chain.hpp
 * @brief Synthetic option chains shared by the DVOL tests
 */

#pragma once

#include "src/market/option_quote.hpp"
#include "src/market/utc_time.hpp"
#include <chrono>
#include <cmath>
#include <optional>
#include <vector>

namespace dvolkit::testing {

/// Snapshot hour used by every synthetic chain
inline UtcTime test_hour() {
    return make_utc_time(2024, 3, 1, 12);
}

/// Expiry `tau` years after `from`, rounded to the millisecond
inline UtcTime expiry_after(UtcTime from, double tau) {
    auto ms = static_cast<int64_t>(std::llround(tau * kDaysPerYear * 86'400'000.0));
    return from + std::chrono::milliseconds{ms};
}

inline OptionQuote make_quote(double strike, std::optional<UtcTime> expiry,
                              OptionType type, double iv) {
    OptionQuote q;
    q.strike = strike;
    q.expiry = expiry;
    q.type = type;
    q.mark_iv = iv;
    return q;
}

/**
 * @brief Puts below and calls above the forward, one straddle at it
 *
 * Strikes are forward + k * spacing for k in [-n_side, n_side]. Strikes
 * below the forward carry a put, above a call, and the forward strike both.
 */
inline std::vector<OptionQuote> otm_chain(std::optional<UtcTime> expiry, double forward,
                                          size_t n_side, double spacing, double iv) {
    std::vector<OptionQuote> quotes;
    for (size_t i = 0; i <= 2 * n_side; ++i) {
        double k = forward + (static_cast<double>(i) - static_cast<double>(n_side)) * spacing;
        if (k < forward) {
            quotes.push_back(make_quote(k, expiry, OptionType::PUT, iv));
        } else if (k > forward) {
            quotes.push_back(make_quote(k, expiry, OptionType::CALL, iv));
        } else {
            quotes.push_back(make_quote(k, expiry, OptionType::PUT, iv));
            quotes.push_back(make_quote(k, expiry, OptionType::CALL, iv));
        }
    }
    return quotes;
}

/// Two-expiry snapshot around forward 100 with flat IV
inline std::vector<OptionQuote> two_expiry_snapshot(double near_tau, size_t near_side,
                                                    double far_tau, size_t far_side,
                                                    double iv = 0.6, double spacing = 5.0) {
    auto quotes = otm_chain(expiry_after(test_hour(), near_tau), 100.0, near_side, spacing, iv);
    auto far = otm_chain(expiry_after(test_hour(), far_tau), 100.0, far_side, spacing, iv);
    quotes.insert(quotes.end(), far.begin(), far.end());
    return quotes;
}

}  // namespace dvolkit::testing
