// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <expected>
#include <ostream>
#include <string_view>

namespace dvolkit {

/// Reasons a volatility estimate is not produced
///
/// The first group is routine market-data sparsity: thin books, stale
/// expiries, gaps in the daily series. Callers branch on it and move on.
/// The second group is a contract breach by whoever materialized the input.
enum class DvolErrorCode {
    // Insufficient data
    EmptyInput,
    NonPositiveTime,
    NonPositiveForward,
    NonPositiveSpot,
    TooFewStrikes,
    TooFewOtmStrikes,
    TooFewContributions,
    NonPositiveVariance,
    TooFewExpiries,
    NoBracketingPair,
    TooFewCommonDays,

    // Invalid input
    NonFiniteInput,
    InvalidStrike,
    UnsortedInput,
    InvalidConfig
};

/// Which bracketing expiry an error came from
enum class ExpiryLeg {
    None,
    Near,
    Far
};

/// Detailed error passed through the expected failure path
struct DvolError {
    DvolErrorCode code{DvolErrorCode::EmptyInput};
    size_t achieved_count = 0;  ///< Strikes per side, expiries or days actually available
    double value = 0.0;         ///< Offending value (T, F, variance, ...) where meaningful
    ExpiryLeg leg = ExpiryLeg::None;
};

/// True for routine "no estimate this hour/day" outcomes
[[nodiscard]] constexpr bool is_insufficient_data(DvolErrorCode code) noexcept {
    switch (code) {
        case DvolErrorCode::NonFiniteInput:
        case DvolErrorCode::InvalidStrike:
        case DvolErrorCode::UnsortedInput:
        case DvolErrorCode::InvalidConfig:
            return false;
        default:
            return true;
    }
}

[[nodiscard]] constexpr bool is_insufficient_data(const DvolError& error) noexcept {
    return is_insufficient_data(error.code);
}

/// Error codes for parameter and configuration validation failures
enum class ValidationErrorCode {
    InvalidStrike,
    InvalidSpotPrice,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidWindow,
    InvalidThreshold,
    InvalidBounds,
    OutOfRange,
    UnsortedInput,
    UnknownAsset
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Optional index for array errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Configuration rejected by a validate_*_config() check
[[nodiscard]] inline DvolError invalid_config_error(const ValidationError& err) {
    return DvolError{.code = DvolErrorCode::InvalidConfig,
                     .achieved_count = static_cast<size_t>(err.code),
                     .value = err.value};
}

std::string_view to_string(DvolErrorCode code) noexcept;

/// Output stream operator for DvolError
inline std::ostream& operator<<(std::ostream& os, const DvolError& err) {
    os << "DvolError{code=" << to_string(err.code)
       << ", achieved_count=" << err.achieved_count
       << ", value=" << err.value;
    if (err.leg != ExpiryLeg::None) {
        os << ", leg=" << (err.leg == ExpiryLeg::Near ? "near" : "far");
    }
    os << "}";
    return os;
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

}  // namespace dvolkit
