// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/support/error_types.hpp"
#include <sstream>

namespace dvolkit {
namespace {

TEST(ErrorTypesTest, InsufficientDataCategory) {
    EXPECT_TRUE(is_insufficient_data(DvolErrorCode::TooFewStrikes));
    EXPECT_TRUE(is_insufficient_data(DvolErrorCode::TooFewOtmStrikes));
    EXPECT_TRUE(is_insufficient_data(DvolErrorCode::TooFewExpiries));
    EXPECT_TRUE(is_insufficient_data(DvolErrorCode::NonPositiveVariance));
    EXPECT_TRUE(is_insufficient_data(DvolErrorCode::TooFewCommonDays));
    EXPECT_TRUE(is_insufficient_data(DvolErrorCode::EmptyInput));
}

TEST(ErrorTypesTest, InvalidInputCategory) {
    EXPECT_FALSE(is_insufficient_data(DvolErrorCode::NonFiniteInput));
    EXPECT_FALSE(is_insufficient_data(DvolErrorCode::InvalidStrike));
    EXPECT_FALSE(is_insufficient_data(DvolErrorCode::UnsortedInput));
    EXPECT_FALSE(is_insufficient_data(DvolErrorCode::InvalidConfig));
}

TEST(ErrorTypesTest, CategoryIsCompileTime) {
    static_assert(is_insufficient_data(DvolError{.code = DvolErrorCode::TooFewStrikes}));
    static_assert(!is_insufficient_data(DvolError{.code = DvolErrorCode::InvalidStrike}));
}

TEST(ErrorTypesTest, DvolErrorStream) {
    DvolError err{.code = DvolErrorCode::TooFewOtmStrikes, .achieved_count = 2,
                  .value = 95.0, .leg = ExpiryLeg::Far};
    std::ostringstream os;
    os << err;
    EXPECT_EQ(os.str(), "DvolError{code=TooFewOtmStrikes, achieved_count=2, value=95, leg=far}");
}

TEST(ErrorTypesTest, DvolErrorStreamWithoutLeg) {
    std::ostringstream os;
    os << DvolError{.code = DvolErrorCode::TooFewExpiries, .achieved_count = 1};
    EXPECT_EQ(os.str(), "DvolError{code=TooFewExpiries, achieved_count=1, value=0}");
}

TEST(ErrorTypesTest, EveryCodeHasAName) {
    for (int c = static_cast<int>(DvolErrorCode::EmptyInput);
         c <= static_cast<int>(DvolErrorCode::InvalidConfig); ++c) {
        EXPECT_NE(to_string(static_cast<DvolErrorCode>(c)), "Unknown") << c;
    }
}

TEST(ErrorTypesTest, ValidationErrorDefaults) {
    ValidationError err(ValidationErrorCode::InvalidWindow);
    EXPECT_EQ(err.code, ValidationErrorCode::InvalidWindow);
    EXPECT_EQ(err.value, 0.0);
    EXPECT_EQ(err.index, 0u);
}

}  // namespace
}  // namespace dvolkit
