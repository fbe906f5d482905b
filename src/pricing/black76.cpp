// SPDX-License-Identifier: MIT
#include "src/pricing/black76.hpp"

namespace dvolkit {

double black76_price(double forward, double strike, double tau, double sigma,
                     OptionType type, double rate) noexcept {
    if (tau <= 0.0 || sigma <= 0.0 || forward <= 0.0 || strike <= 0.0) {
        return 0.0;
    }

    double d1 = black76_d1(forward, strike, tau, sigma);
    double d2 = d1 - sigma * std::sqrt(tau);
    double discount = std::exp(-rate * tau);

    if (type == OptionType::PUT) {
        return discount * (strike * norm_cdf(-d2) - forward * norm_cdf(-d1));
    } else {
        return discount * (forward * norm_cdf(d1) - strike * norm_cdf(d2));
    }
}

}  // namespace dvolkit
