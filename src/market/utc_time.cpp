// SPDX-License-Identifier: MIT
#include "src/market/utc_time.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dvolkit {

namespace {

std::tm to_tm(UtcTime t) {
    auto secs = std::chrono::floor<std::chrono::seconds>(t);
    std::time_t time = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&time, &tm);  // Thread-safe POSIX version
    return tm;
}

}  // namespace

UtcTime floor_to_hour(UtcTime t) {
    return std::chrono::floor<std::chrono::hours>(t);
}

UtcTime make_utc_time(int year, unsigned month, unsigned day,
                      int hour, int minute, int second) {
    using namespace std::chrono;
    sys_days date{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
    return UtcTime{date} + hours{hour} + minutes{minute} + seconds{second};
}

std::string utc_day_key(UtcTime t) {
    std::tm tm = to_tm(t);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d");
    return ss.str();
}

std::string to_iso_string(UtcTime t) {
    std::tm tm = to_tm(t);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "+00:00";
    return ss.str();
}

std::expected<UtcTime, std::string> parse_iso_utc(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);

    // Try with time component first
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        // Try date only
        tm = {};
        ss.clear();
        ss.str(s);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            return std::unexpected("Failed to parse ISO timestamp: " + s);
        }
    }

    std::string rest;
    std::getline(ss, rest);
    if (!rest.empty() && rest != "Z" && rest != "+00:00" && rest != "+0000") {
        return std::unexpected("Non-UTC offset in timestamp: " + s);
    }

    auto time = timegm(&tm);
    if (time == -1) {
        return std::unexpected("Invalid timestamp: " + s);
    }

    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::from_time_t(time));
}

std::optional<double> year_fraction(UtcTime from, UtcTime to) {
    auto delta = to - from;
    if (delta.count() <= 0) {
        return std::nullopt;
    }
    double seconds = static_cast<double>(delta.count()) / 1000.0;
    return seconds / (kDaysPerYear * 24.0 * 3600.0);
}

}  // namespace dvolkit
