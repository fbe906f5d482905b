// SPDX-License-Identifier: MIT
#include "src/dvol/dvol_index.hpp"
#include "src/support/dvol_trace.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace dvolkit {

namespace {

std::unexpected<DvolError> reject(DvolError error) {
    if (is_insufficient_data(error)) {
        DVOLKIT_TRACE_INSUFFICIENT_DATA(MODULE_DVOL_INDEX, static_cast<int>(error.code),
                                        error.achieved_count, error.value);
    } else {
        DVOLKIT_TRACE_VALIDATION_ERROR(MODULE_DVOL_INDEX, static_cast<int>(error.code),
                                       error.value, error.achieved_count);
    }
    return std::unexpected(error);
}

}  // namespace

std::string_view to_string(DvolQuality quality) noexcept {
    switch (quality) {
        case DvolQuality::High: return "high";
        case DvolQuality::Medium: return "medium";
        case DvolQuality::Low: return "low";
    }
    return "low";
}

std::optional<DvolQuality> parse_quality(std::string_view s) noexcept {
    if (s == "high") return DvolQuality::High;
    if (s == "medium") return DvolQuality::Medium;
    if (s == "low") return DvolQuality::Low;
    return std::nullopt;
}

std::vector<ExpirySlice>
build_expiry_slices(std::span<const OptionQuote> quotes, UtcTime snapshot_hour,
                    double spot_price, const ForwardCurve* forwards,
                    const DvolConfig& config) {
    std::map<UtcTime, std::vector<OptionQuote>> by_expiry;
    for (const auto& q : quotes) {
        if (!q.expiry) continue;
        by_expiry[*q.expiry].push_back(q);
    }

    const double min_tau = config.min_tau();
    const double max_tau = config.max_tau();

    std::vector<ExpirySlice> slices;
    for (auto& [expiry, group] : by_expiry) {
        auto tau = year_fraction(snapshot_hour, expiry);
        if (!tau || *tau < min_tau || *tau > max_tau) {
            continue;
        }
        ExpirySlice slice;
        slice.expiry = expiry;
        slice.tau = *tau;
        slice.forward = forwards ? forwards->forward_or(expiry, spot_price) : spot_price;
        slice.quotes = std::move(group);
        slices.push_back(std::move(slice));
    }

    // Expiry order is tau order; the sort only guards the invariant
    std::stable_sort(slices.begin(), slices.end(),
                     [](const ExpirySlice& a, const ExpirySlice& b) { return a.tau < b.tau; });
    return slices;
}

std::optional<std::pair<size_t, size_t>>
select_bracketing_pair(std::span<const ExpirySlice> slices, double target_tau) {
    const size_t n = slices.size();
    if (n < 2) return std::nullopt;

    for (size_t i = 0; i + 1 < n; ++i) {
        if (slices[i].tau <= target_tau && target_tau <= slices[i + 1].tau) {
            return std::make_pair(i, i + 1);
        }
    }

    if (target_tau <= slices.front().tau) return std::make_pair(size_t{0}, size_t{1});
    if (target_tau >= slices.back().tau) return std::make_pair(n - 2, n - 1);
    return std::nullopt;
}

double interpolate_variance(double near_variance, double near_tau,
                            double far_variance, double far_tau,
                            double target_tau, double eps) {
    if (std::abs(far_tau - near_tau) < eps) {
        return near_variance;
    }
    double total_near = near_variance * near_tau;
    double total_far = far_variance * far_tau;
    double w = std::clamp((target_tau - near_tau) / (far_tau - near_tau), 0.0, 1.0);
    double total_target = total_near + w * (total_far - total_near);
    return total_target / target_tau;
}

DvolQuality grade_quality(size_t n_near, size_t n_far, const DvolConfig& config) {
    if (n_near >= config.high_quality_strikes && n_far >= config.high_quality_strikes) {
        return DvolQuality::High;
    }
    if (n_near >= config.medium_quality_strikes && n_far >= config.medium_quality_strikes) {
        return DvolQuality::Medium;
    }
    return DvolQuality::Low;
}

std::expected<DvolResult, DvolError>
compute_dvol_at_hour(std::span<const OptionQuote> quotes, UtcTime snapshot_hour,
                     double spot_price, const ForwardCurve* forwards,
                     const DvolConfig& config) {
    DVOLKIT_TRACE_ALGO_START(MODULE_DVOL_INDEX, quotes.size(), to_epoch_ms(snapshot_hour), spot_price);

    if (auto valid = validate_dvol_config(config); !valid) {
        return reject(invalid_config_error(valid.error()));
    }
    if (!std::isfinite(spot_price)) {
        return reject(DvolError{.code = DvolErrorCode::NonFiniteInput, .value = spot_price});
    }
    if (quotes.empty()) {
        return reject(DvolError{.code = DvolErrorCode::EmptyInput});
    }
    if (spot_price <= 0.0) {
        return reject(DvolError{.code = DvolErrorCode::NonPositiveSpot, .value = spot_price});
    }

    auto slices = build_expiry_slices(quotes, snapshot_hour, spot_price, forwards, config);
    if (slices.size() < 2) {
        return reject(DvolError{.code = DvolErrorCode::TooFewExpiries,
                                .achieved_count = slices.size()});
    }

    const double target_tau = config.target_tau();
    auto pair = select_bracketing_pair(slices, target_tau);
    if (!pair) {
        return reject(DvolError{.code = DvolErrorCode::NoBracketingPair,
                                .achieved_count = slices.size(), .value = target_tau});
    }
    const ExpirySlice& near = slices[pair->first];
    const ExpirySlice& far = slices[pair->second];

    auto near_var = compute_expiry_variance(near.quotes, near.tau, near.forward, config);
    if (!near_var) {
        DvolError err = near_var.error();
        err.leg = ExpiryLeg::Near;
        return reject(err);
    }
    auto far_var = compute_expiry_variance(far.quotes, far.tau, far.forward, config);
    if (!far_var) {
        DvolError err = far_var.error();
        err.leg = ExpiryLeg::Far;
        return reject(err);
    }

    double variance = interpolate_variance(near_var->variance, near.tau,
                                           far_var->variance, far.tau,
                                           target_tau, config.degenerate_bracket_eps);
    if (!(variance > 0.0)) {
        return reject(DvolError{.code = DvolErrorCode::NonPositiveVariance, .value = variance});
    }

    DvolResult result;
    result.dvol = std::sqrt(variance);
    result.quality = grade_quality(near_var->strike_count, far_var->strike_count, config);
    result.near_expiry = near.expiry;
    result.far_expiry = far.expiry;
    result.n_near_strikes = near_var->strike_count;
    result.n_far_strikes = far_var->strike_count;
    result.near_variance = near_var->variance;
    result.far_variance = far_var->variance;
    result.near_tau = near.tau;
    result.far_tau = far.tau;

    DVOLKIT_TRACE_DVOL_RESULT(result.dvol, static_cast<int>(result.quality),
                              result.n_near_strikes, result.n_far_strikes);
    DVOLKIT_TRACE_ALGO_COMPLETE(MODULE_DVOL_INDEX, 2, result.dvol);
    return result;
}

}  // namespace dvolkit
