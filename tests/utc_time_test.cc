// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/market/utc_time.hpp"

namespace dvolkit {
namespace {

TEST(UtcTimeTest, EpochRoundTrip) {
    UtcTime t = from_epoch_ms(1'709'294'400'123);
    EXPECT_EQ(to_epoch_ms(t), 1'709'294'400'123);
}

TEST(UtcTimeTest, MakeUtcTimeMatchesEpoch) {
    // 2024-03-01T12:00:00Z
    EXPECT_EQ(to_epoch_ms(make_utc_time(2024, 3, 1, 12)), 1'709'294'400'000);
}

TEST(UtcTimeTest, FloorToHour) {
    UtcTime t = make_utc_time(2024, 3, 1, 12, 59, 59) + std::chrono::milliseconds{999};
    EXPECT_EQ(floor_to_hour(t), make_utc_time(2024, 3, 1, 12));
    EXPECT_EQ(floor_to_hour(make_utc_time(2024, 3, 1, 13)), make_utc_time(2024, 3, 1, 13));
}

TEST(UtcTimeTest, DayKey) {
    EXPECT_EQ(utc_day_key(make_utc_time(2024, 2, 29, 23, 59, 59)), "2024-02-29");
    EXPECT_EQ(utc_day_key(make_utc_time(2024, 3, 1, 0, 0, 0)), "2024-03-01");
}

TEST(UtcTimeTest, IsoString) {
    EXPECT_EQ(to_iso_string(make_utc_time(2020, 9, 25, 8)), "2020-09-25T08:00:00+00:00");
}

TEST(UtcTimeTest, ParseIsoVariants) {
    UtcTime expected = make_utc_time(2020, 9, 25, 8);

    auto full = parse_iso_utc("2020-09-25T08:00:00");
    ASSERT_TRUE(full.has_value()) << full.error();
    EXPECT_EQ(*full, expected);

    auto zulu = parse_iso_utc("2020-09-25T08:00:00Z");
    ASSERT_TRUE(zulu.has_value()) << zulu.error();
    EXPECT_EQ(*zulu, expected);

    auto offset = parse_iso_utc("2020-09-25T08:00:00+00:00");
    ASSERT_TRUE(offset.has_value()) << offset.error();
    EXPECT_EQ(*offset, expected);

    auto date_only = parse_iso_utc("2020-09-25");
    ASSERT_TRUE(date_only.has_value()) << date_only.error();
    EXPECT_EQ(*date_only, make_utc_time(2020, 9, 25));
}

TEST(UtcTimeTest, ParseRejectsGarbageAndOffsets) {
    EXPECT_FALSE(parse_iso_utc("not a date").has_value());
    EXPECT_FALSE(parse_iso_utc("2020-09-25T08:00:00+02:00").has_value());
}

TEST(UtcTimeTest, YearFraction) {
    UtcTime from = make_utc_time(2024, 1, 1);
    auto one_year = year_fraction(from, from + std::chrono::hours{24 * 365} + std::chrono::hours{6});
    ASSERT_TRUE(one_year.has_value());
    EXPECT_NEAR(*one_year, 1.0, 1e-12);

    auto thirty_days = year_fraction(from, from + 30 * kDay);
    ASSERT_TRUE(thirty_days.has_value());
    EXPECT_NEAR(*thirty_days, 30.0 / 365.25, 1e-12);
}

TEST(UtcTimeTest, YearFractionRequiresFutureExpiry) {
    UtcTime t = make_utc_time(2024, 1, 1);
    EXPECT_FALSE(year_fraction(t, t).has_value());
    EXPECT_FALSE(year_fraction(t, t - kHour).has_value());
}

}  // namespace
}  // namespace dvolkit
