// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/dvol/dvol_config.hpp"
#include "src/vov/vov_series.hpp"
#include <limits>

namespace dvolkit {
namespace {

TEST(DvolConfigTest, DefaultsAreValid) {
    DvolConfig config;
    EXPECT_TRUE(validate_dvol_config(config).has_value());
    EXPECT_NEAR(config.target_tau(), 30.0 / 365.25, 1e-15);
    EXPECT_NEAR(config.min_tau(), 2.0 / 365.25, 1e-15);
    EXPECT_NEAR(config.max_tau(), 90.0 / 365.25, 1e-15);
}

TEST(DvolConfigTest, RejectsInvertedMaturityBounds) {
    DvolConfig config;
    config.min_days = 60.0;
    config.max_days = 30.0;
    auto result = validate_dvol_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidBounds);
}

TEST(DvolConfigTest, RejectsBadVolatilityCap) {
    DvolConfig config;
    config.max_iv = 0.0;
    auto result = validate_dvol_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidVolatility);
}

TEST(DvolConfigTest, RejectsInconsistentQualityThresholds) {
    DvolConfig config;
    config.medium_quality_strikes = 8;
    auto result = validate_dvol_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidThreshold);
}

TEST(DvolConfigTest, RejectsNonFiniteRate) {
    DvolConfig config;
    config.rate = std::numeric_limits<double>::infinity();
    auto result = validate_dvol_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidRate);
}

TEST(VovConfigTest, DefaultsAreValid) {
    EXPECT_TRUE(validate_vov_config(VovConfig{}).has_value());
}

TEST(VovConfigTest, MinimumReturnsCannotExceedWindow) {
    VovConfig config;
    config.window = 10;
    config.min_valid_returns = 20;
    auto result = validate_vov_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidWindow);
}

TEST(VovConfigTest, RejectsNonPositiveCap) {
    VovConfig config;
    config.f_vov_cap = 0.0;
    auto result = validate_vov_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidBounds);
}

}  // namespace
}  // namespace dvolkit
