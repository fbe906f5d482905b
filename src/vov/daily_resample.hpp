// SPDX-License-Identifier: MIT
#pragma once

#include "src/market/utc_time.hpp"
#include <span>
#include <string>
#include <vector>

namespace dvolkit {

/// One hourly DVOL value
struct DvolObservation {
    UtcTime timestamp;
    double dvol = 0.0;
};

/// Daily close of the DVOL series
struct DailyDvol {
    std::string date;     ///< UTC calendar day, "YYYY-MM-DD"
    UtcTime timestamp;    ///< Timestamp of the hour that closed the day
    double dvol = 0.0;
};

/**
 * @brief Last positive DVOL value per UTC calendar day
 *
 * Non-positive and NaN values are skipped. Within a day, a value replaces
 * the current close only if its timestamp is strictly later, so input
 * order does not matter.
 *
 * @return One record per day, ascending by date
 */
[[nodiscard]] std::vector<DailyDvol> resample_dvol_daily(std::span<const DvolObservation> hourly);

}  // namespace dvolkit
