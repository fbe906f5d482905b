// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/market/asset_config.hpp"
#include "src/market/option_quote.hpp"
#include <cmath>
#include <limits>

namespace dvolkit {
namespace {

TEST(NormalizeVolQuoteTest, DecimalPassesThrough) {
    EXPECT_DOUBLE_EQ(*normalize_vol_quote(0.55), 0.55);
    EXPECT_DOUBLE_EQ(*normalize_vol_quote(5.0), 5.0);
}

TEST(NormalizeVolQuoteTest, PercentIsDividedByHundred) {
    EXPECT_DOUBLE_EQ(*normalize_vol_quote(55.0), 0.55);
    EXPECT_DOUBLE_EQ(*normalize_vol_quote(5.01), 0.0501);
    EXPECT_DOUBLE_EQ(*normalize_vol_quote(500.0), 5.0);
}

TEST(NormalizeVolQuoteTest, UnusableValues) {
    EXPECT_FALSE(normalize_vol_quote(0.0).has_value());
    EXPECT_FALSE(normalize_vol_quote(-12.0).has_value());
    EXPECT_FALSE(normalize_vol_quote(501.0).has_value());
    EXPECT_FALSE(normalize_vol_quote(std::numeric_limits<double>::quiet_NaN()).has_value());
    EXPECT_FALSE(normalize_vol_quote(std::numeric_limits<double>::infinity()).has_value());
}

TEST(ParseOptionTypeTest, Letters) {
    EXPECT_EQ(parse_option_type("C"), OptionType::CALL);
    EXPECT_EQ(parse_option_type("p"), OptionType::PUT);
    EXPECT_FALSE(parse_option_type("X").has_value());
    EXPECT_FALSE(parse_option_type("").has_value());
}

TEST(ParseInstrumentNameTest, InverseOption) {
    auto info = parse_instrument_name("BTC-25SEP20-6000-C");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->asset, "BTC");
    EXPECT_EQ(info->expiry, make_utc_time(2020, 9, 25, 8));
    EXPECT_DOUBLE_EQ(info->strike, 6000.0);
    EXPECT_EQ(info->type, OptionType::CALL);
}

TEST(ParseInstrumentNameTest, LinearOptionWithFractionalStrike) {
    auto info = parse_instrument_name("SOL_USDC-7MAR25-150.5-P");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->asset, "SOL");
    EXPECT_EQ(info->expiry, make_utc_time(2025, 3, 7, 8));
    EXPECT_DOUBLE_EQ(info->strike, 150.5);
    EXPECT_EQ(info->type, OptionType::PUT);
}

TEST(ParseInstrumentNameTest, FourDigitYear) {
    auto info = parse_instrument_name("ETH-1JAN2026-3000-C");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->expiry, make_utc_time(2026, 1, 1, 8));
}

TEST(ParseInstrumentNameTest, RejectsMalformedNames) {
    EXPECT_FALSE(parse_instrument_name("BTC-PERPETUAL").has_value());
    EXPECT_FALSE(parse_instrument_name("BTC-25SEP20").has_value());
    EXPECT_FALSE(parse_instrument_name("BTC-25SEP20-6000-X").has_value());
    EXPECT_FALSE(parse_instrument_name("BTC-25Sep20-6000-C").has_value());
    EXPECT_FALSE(parse_instrument_name("BTC-31FEB21-6000-C").has_value());
    EXPECT_FALSE(parse_instrument_name("BTC-25SEP20-6e3-C").has_value());
    EXPECT_FALSE(parse_instrument_name("BTC-25SEP20-6000-C-extra").has_value());
    EXPECT_FALSE(parse_instrument_name("").has_value());
}

TEST(AssetConfigTest, DefaultTable) {
    auto assets = default_assets();
    ASSERT_EQ(assets.size(), 4u);
    EXPECT_EQ(assets[0].name, "BTC");
    EXPECT_TRUE(assets[0].is_inverse);
}

TEST(AssetConfigTest, FindAsset) {
    auto eth = find_asset("ETH");
    ASSERT_TRUE(eth.has_value());
    EXPECT_TRUE(eth->is_inverse);
    EXPECT_EQ(eth->min_snapshot_instruments, 50u);

    auto xrp = find_asset("XRP");
    ASSERT_TRUE(xrp.has_value());
    EXPECT_FALSE(xrp->is_inverse);
    EXPECT_EQ(xrp->min_snapshot_instruments, 5u);
}

TEST(AssetConfigTest, UnknownAsset) {
    auto doge = find_asset("DOGE");
    ASSERT_FALSE(doge.has_value());
    EXPECT_EQ(doge.error().code, ValidationErrorCode::UnknownAsset);
}

}  // namespace
}  // namespace dvolkit
