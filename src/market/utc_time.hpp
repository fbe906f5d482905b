// SPDX-License-Identifier: MIT
/**
 * @file utc_time.hpp
 * @brief UTC timestamps at millisecond resolution and calendar helpers
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace dvolkit {

/// Point in time, UTC, millisecond resolution
using UtcTime = std::chrono::sys_time<std::chrono::milliseconds>;

/// Calendar days per year used for every time-to-expiry computation
inline constexpr double kDaysPerYear = 365.25;

inline constexpr std::chrono::milliseconds kHour{3'600'000};
inline constexpr std::chrono::milliseconds kDay{86'400'000};

[[nodiscard]] inline UtcTime from_epoch_ms(int64_t ms) {
    return UtcTime{std::chrono::milliseconds{ms}};
}

[[nodiscard]] inline int64_t to_epoch_ms(UtcTime t) {
    return t.time_since_epoch().count();
}

/// Round down to the start of the UTC hour
[[nodiscard]] UtcTime floor_to_hour(UtcTime t);

/// Build a UTC time from calendar fields
[[nodiscard]] UtcTime make_utc_time(int year, unsigned month, unsigned day,
                                    int hour = 0, int minute = 0, int second = 0);

/// UTC calendar day as "YYYY-MM-DD"
[[nodiscard]] std::string utc_day_key(UtcTime t);

/// ISO-8601 rendering, "YYYY-MM-DDTHH:MM:SS+00:00"
[[nodiscard]] std::string to_iso_string(UtcTime t);

/// Parse "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS" with optional "Z" or "+00:00"
///
/// Offsets other than UTC are rejected; every upstream feed is UTC.
[[nodiscard]] std::expected<UtcTime, std::string> parse_iso_utc(const std::string& s);

/// Time from `from` to `to` in years of 365.25 days
///
/// @return Year fraction, or nullopt when `to` is not after `from`
[[nodiscard]] std::optional<double> year_fraction(UtcTime from, UtcTime to);

}  // namespace dvolkit
