// SPDX-License-Identifier: MIT
#include "src/support/error_types.hpp"

namespace dvolkit {

std::string_view to_string(DvolErrorCode code) noexcept {
    switch (code) {
        case DvolErrorCode::EmptyInput: return "EmptyInput";
        case DvolErrorCode::NonPositiveTime: return "NonPositiveTime";
        case DvolErrorCode::NonPositiveForward: return "NonPositiveForward";
        case DvolErrorCode::NonPositiveSpot: return "NonPositiveSpot";
        case DvolErrorCode::TooFewStrikes: return "TooFewStrikes";
        case DvolErrorCode::TooFewOtmStrikes: return "TooFewOtmStrikes";
        case DvolErrorCode::TooFewContributions: return "TooFewContributions";
        case DvolErrorCode::NonPositiveVariance: return "NonPositiveVariance";
        case DvolErrorCode::TooFewExpiries: return "TooFewExpiries";
        case DvolErrorCode::NoBracketingPair: return "NoBracketingPair";
        case DvolErrorCode::TooFewCommonDays: return "TooFewCommonDays";
        case DvolErrorCode::NonFiniteInput: return "NonFiniteInput";
        case DvolErrorCode::InvalidStrike: return "InvalidStrike";
        case DvolErrorCode::UnsortedInput: return "UnsortedInput";
        case DvolErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

}  // namespace dvolkit
