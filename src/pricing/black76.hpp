// SPDX-License-Identifier: MIT
/**
 * @file black76.hpp
 * @brief Black-76 pricing of European options on a forward
 *
 * Used to turn quoted implied volatilities back into out-of-the-money
 * option prices for the model-free variance integral.
 */

#pragma once

#include "src/market/option_quote.hpp"
#include <cmath>

namespace dvolkit {

/// Standard normal CDF using erfc for numerical stability
inline double norm_cdf(double x) {
    return 0.5 * std::erfc(-x * M_SQRT1_2);
}

/// Black-76 d1 = [ln(F/K) + sigma^2*T/2] / (sigma*sqrt(T))
inline double black76_d1(double forward, double strike, double tau, double sigma) {
    return (std::log(forward / strike) + 0.5 * sigma * sigma * tau) / (sigma * std::sqrt(tau));
}

/**
 * @brief Black-76 European option price
 *
 * call = e^{-rT} (F N(d1) - K N(d2)), put = e^{-rT} (K N(-d2) - F N(-d1)).
 *
 * Any non-positive forward, strike, maturity or volatility yields 0.0.
 * Callers must read 0.0 as "unpriced", never as "worthless".
 *
 * @param forward Forward price F
 * @param strike Strike K
 * @param tau Time to expiry in years
 * @param sigma Implied volatility (decimal)
 * @param type CALL or PUT
 * @param rate Continuously compounded discount rate
 */
[[nodiscard]] double black76_price(double forward, double strike, double tau, double sigma,
                                   OptionType type, double rate = 0.0) noexcept;

}  // namespace dvolkit
