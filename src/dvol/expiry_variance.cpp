// SPDX-License-Identifier: MIT
#include "src/dvol/expiry_variance.hpp"
#include "src/pricing/black76.hpp"
#include "src/support/dvol_trace.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <vector>

namespace dvolkit {

namespace {

std::unexpected<DvolError> reject(DvolErrorCode code, size_t achieved, double value) {
    if (is_insufficient_data(code)) {
        DVOLKIT_TRACE_INSUFFICIENT_DATA(MODULE_EXPIRY_VARIANCE, static_cast<int>(code), achieved, value);
    } else {
        DVOLKIT_TRACE_VALIDATION_ERROR(MODULE_EXPIRY_VARIANCE, static_cast<int>(code), value, achieved);
    }
    return std::unexpected(DvolError{.code = code, .achieved_count = achieved, .value = value});
}

/// Out-of-the-money price Q(K) for one strike of the grid
double otm_price(double strike, const StrikeQuotes& sq, double k0,
                 double forward, double tau, double rate) {
    if (strike < k0) {
        if (sq.put_iv) return black76_price(forward, strike, tau, *sq.put_iv, OptionType::PUT, rate);
        return black76_price(forward, strike, tau, *sq.call_iv, OptionType::PUT, rate);
    }
    if (strike > k0) {
        if (sq.call_iv) return black76_price(forward, strike, tau, *sq.call_iv, OptionType::CALL, rate);
        return black76_price(forward, strike, tau, *sq.put_iv, OptionType::CALL, rate);
    }

    // At K0: straddle average, each side at its own IV when both are quoted
    double call_iv = sq.call_iv.value_or(sq.put_iv.value_or(0.0));
    double put_iv = sq.put_iv.value_or(call_iv);
    return 0.5 * (black76_price(forward, strike, tau, call_iv, OptionType::CALL, rate) +
                  black76_price(forward, strike, tau, put_iv, OptionType::PUT, rate));
}

/// Strike width: one-sided at the edges, central difference inside
double strike_width(const std::vector<double>& strikes, size_t i) {
    size_t n = strikes.size();
    if (i == 0) return strikes[1] - strikes[0];
    if (i == n - 1) return strikes[n - 1] - strikes[n - 2];
    return 0.5 * (strikes[i + 1] - strikes[i - 1]);
}

}  // namespace

std::expected<StrikeBook, DvolError>
build_strike_book(std::span<const OptionQuote> quotes, double max_iv) {
    StrikeBook book;
    for (size_t i = 0; i < quotes.size(); ++i) {
        const auto& q = quotes[i];
        if (!std::isfinite(q.strike) || !std::isfinite(q.mark_iv)) {
            return reject(DvolErrorCode::NonFiniteInput, i, q.strike);
        }
        if (q.strike <= 0.0) {
            return reject(DvolErrorCode::InvalidStrike, i, q.strike);
        }
        if (q.mark_iv <= 0.0 || q.mark_iv > max_iv) {
            continue;
        }
        auto& slot = book[q.strike];
        if (q.type == OptionType::CALL) {
            slot.call_iv = q.mark_iv;
        } else {
            slot.put_iv = q.mark_iv;
        }
    }
    return book;
}

double find_k0(const StrikeBook& book, double forward) {
    if (book.empty()) {
        return forward;
    }
    // First strike above the forward; K0 is the one before it
    auto it = book.upper_bound(forward);
    if (it == book.begin()) {
        return book.begin()->first;
    }
    return std::prev(it)->first;
}

std::expected<VarianceResult, DvolError>
compute_expiry_variance(std::span<const OptionQuote> quotes, double tau, double forward,
                        const DvolConfig& config) {
    DVOLKIT_TRACE_ALGO_START(MODULE_EXPIRY_VARIANCE, quotes.size(), tau, forward);

    if (auto valid = validate_dvol_config(config); !valid) {
        return reject(DvolErrorCode::InvalidConfig, static_cast<size_t>(valid.error().code),
                      valid.error().value);
    }
    if (!std::isfinite(tau) || !std::isfinite(forward)) {
        return reject(DvolErrorCode::NonFiniteInput, 0, std::isfinite(tau) ? forward : tau);
    }
    if (tau <= 0.0) return reject(DvolErrorCode::NonPositiveTime, 0, tau);
    if (forward <= 0.0) return reject(DvolErrorCode::NonPositiveForward, 0, forward);
    if (quotes.empty()) return reject(DvolErrorCode::EmptyInput, 0, 0.0);

    auto book = build_strike_book(quotes, config.max_iv);
    if (!book) {
        return std::unexpected(book.error());
    }

    if (book->size() < config.min_strikes) {
        return reject(DvolErrorCode::TooFewStrikes, 0, static_cast<double>(book->size()));
    }

    const double k0 = find_k0(*book, forward);

    size_t otm_puts = 0;
    size_t otm_calls = 0;
    std::vector<double> strikes;
    strikes.reserve(book->size());
    for (const auto& [strike, sq] : *book) {
        if (strike < k0) ++otm_puts;
        else if (strike > k0) ++otm_calls;
        strikes.push_back(strike);
    }
    const size_t strike_count = std::min(otm_puts, otm_calls);

    if (otm_puts < config.min_otm_per_side || otm_calls < config.min_otm_per_side) {
        return reject(DvolErrorCode::TooFewOtmStrikes, strike_count, k0);
    }

    // Widths come from the full validated grid; strikes priced at zero are
    // skipped without re-spacing their neighbours.
    double weighted_sum = 0.0;
    size_t n_contributions = 0;
    size_t i = 0;
    for (const auto& [strike, sq] : *book) {
        double q = otm_price(strike, sq, k0, forward, tau, config.rate);
        if (q > 0.0) {
            weighted_sum += strike_width(strikes, i) / (strike * strike) * q;
            ++n_contributions;
        }
        ++i;
    }

    if (n_contributions < config.min_contributions) {
        return reject(DvolErrorCode::TooFewContributions, strike_count,
                      static_cast<double>(n_contributions));
    }

    double carry = forward / k0 - 1.0;
    double variance = (2.0 / tau) * weighted_sum - (1.0 / tau) * carry * carry;

    if (!(variance > 0.0)) {
        return reject(DvolErrorCode::NonPositiveVariance, strike_count, variance);
    }

    DVOLKIT_TRACE_ALGO_COMPLETE(MODULE_EXPIRY_VARIANCE, n_contributions, variance);
    return VarianceResult{
        .variance = variance,
        .strike_count = strike_count,
        .n_contributions = n_contributions,
        .k0 = k0,
    };
}

std::expected<VarianceResult, DvolError>
compute_expiry_variance(std::span<const OptionQuote> quotes, double tau, double forward,
                        double rate) {
    DvolConfig config;
    config.rate = rate;
    return compute_expiry_variance(quotes, tau, forward, config);
}

}  // namespace dvolkit
