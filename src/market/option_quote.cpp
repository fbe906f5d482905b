// SPDX-License-Identifier: MIT
#include "src/market/option_quote.hpp"
#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <vector>

namespace dvolkit {

namespace {

constexpr std::array<std::string_view, 12> kMonths = {
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN",
    "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"
};

std::vector<std::string_view> split_dash(std::string_view s) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find('-', start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool is_word(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

// "25SEP20" -> (25, 9, 2020)
std::optional<std::chrono::year_month_day> parse_expiry_token(std::string_view tok) {
    size_t n_day = 0;
    while (n_day < tok.size() && n_day < 2 && tok[n_day] >= '0' && tok[n_day] <= '9') {
        ++n_day;
    }
    if (n_day == 0 || tok.size() < n_day + 3 + 2) return std::nullopt;

    std::string_view day_str = tok.substr(0, n_day);
    std::string_view mon_str = tok.substr(n_day, 3);
    std::string_view year_str = tok.substr(n_day + 3);

    if (!all_digits(year_str) || (year_str.size() != 2 && year_str.size() != 4)) {
        return std::nullopt;
    }

    unsigned month = 0;
    for (size_t i = 0; i < kMonths.size(); ++i) {
        if (kMonths[i] == mon_str) {
            month = static_cast<unsigned>(i + 1);
            break;
        }
    }
    if (month == 0) return std::nullopt;

    unsigned day = 0;
    int year = 0;
    std::from_chars(day_str.data(), day_str.data() + day_str.size(), day);
    std::from_chars(year_str.data(), year_str.data() + year_str.size(), year);
    if (year < 100) year += 2000;

    std::chrono::year_month_day ymd{
        std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok()) return std::nullopt;
    return ymd;
}

}  // namespace

std::optional<OptionType> parse_option_type(std::string_view s) noexcept {
    if (s == "C" || s == "c") return OptionType::CALL;
    if (s == "P" || s == "p") return OptionType::PUT;
    return std::nullopt;
}

std::optional<double> normalize_vol_quote(double raw) noexcept {
    if (!std::isfinite(raw) || raw <= 0.0) {
        return std::nullopt;
    }
    double vol = raw;
    if (vol > kMaxDecimalVol) {
        vol /= 100.0;
    }
    if (vol > kMaxDecimalVol || vol <= 0.0) {
        return std::nullopt;
    }
    return vol;
}

std::optional<InstrumentInfo> parse_instrument_name(std::string_view name) {
    auto parts = split_dash(name);
    if (parts.size() != 4) return std::nullopt;

    std::string_view prefix = parts[0];
    if (!is_word(prefix)) return std::nullopt;

    auto ymd = parse_expiry_token(parts[1]);
    if (!ymd) return std::nullopt;

    // Strike: digits with an optional fractional part
    std::string_view strike_str = parts[2];
    size_t dot = strike_str.find('.');
    std::string_view int_part = strike_str.substr(0, dot);
    if (!all_digits(int_part)) return std::nullopt;
    if (dot != std::string_view::npos && !all_digits(strike_str.substr(dot + 1))) {
        return std::nullopt;
    }
    double strike = 0.0;
    auto [ptr, ec] = std::from_chars(strike_str.data(), strike_str.data() + strike_str.size(), strike);
    if (ec != std::errc{} || ptr != strike_str.data() + strike_str.size()) {
        return std::nullopt;
    }

    if (parts[3] != "C" && parts[3] != "P") return std::nullopt;

    InstrumentInfo info;
    info.asset = std::string(prefix.substr(0, prefix.find('_')));
    info.expiry = UtcTime{std::chrono::sys_days{*ymd}} + std::chrono::hours{kExpiryCutoffHour};
    info.strike = strike;
    info.type = parts[3] == "C" ? OptionType::CALL : OptionType::PUT;
    return info;
}

}  // namespace dvolkit
