// SPDX-License-Identifier: MIT
#include "src/dvol/dvol_config.hpp"
#include <cmath>

namespace dvolkit {

std::expected<void, ValidationError> validate_dvol_config(const DvolConfig& config) {
    if (!(config.days_per_year > 0.0)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidMaturity, config.days_per_year));
    }
    if (!(config.min_days > 0.0) || !(config.max_days > config.min_days)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidBounds, config.min_days));
    }
    if (!(config.target_days > 0.0)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidMaturity, config.target_days));
    }
    if (!(config.max_iv > 0.0)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidVolatility, config.max_iv));
    }
    if (config.min_strikes < 2 || config.min_otm_per_side < 1) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidThreshold,
                                               static_cast<double>(config.min_strikes)));
    }
    if (config.medium_quality_strikes > config.high_quality_strikes) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidThreshold,
                                               static_cast<double>(config.medium_quality_strikes)));
    }
    if (!std::isfinite(config.rate)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidRate, config.rate));
    }
    if (!(config.degenerate_bracket_eps >= 0.0)) {
        return std::unexpected(ValidationError(ValidationErrorCode::OutOfRange, config.degenerate_bracket_eps));
    }
    return {};
}

}  // namespace dvolkit
