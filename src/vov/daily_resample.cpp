// SPDX-License-Identifier: MIT
#include "src/vov/daily_resample.hpp"
#include <map>

namespace dvolkit {

std::vector<DailyDvol> resample_dvol_daily(std::span<const DvolObservation> hourly) {
    // "YYYY-MM-DD" sorts chronologically
    std::map<std::string, DailyDvol> by_day;
    for (const auto& obs : hourly) {
        if (!(obs.dvol > 0.0)) continue;
        std::string day = utc_day_key(obs.timestamp);
        auto it = by_day.find(day);
        if (it == by_day.end()) {
            by_day.emplace(day, DailyDvol{day, obs.timestamp, obs.dvol});
        } else if (obs.timestamp > it->second.timestamp) {
            it->second.timestamp = obs.timestamp;
            it->second.dvol = obs.dvol;
        }
    }

    std::vector<DailyDvol> daily;
    daily.reserve(by_day.size());
    for (auto& [day, record] : by_day) {
        daily.push_back(std::move(record));
    }
    return daily;
}

}  // namespace dvolkit
