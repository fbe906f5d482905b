// SPDX-License-Identifier: MIT
#include "src/validation/index_comparator.hpp"
#include "src/market/option_quote.hpp"
#include "src/math/statistics.hpp"
#include "src/support/dvol_trace.h"
#include <algorithm>
#include <limits>
#include <map>
#include <string>

namespace dvolkit {

namespace {

struct DailyClose {
    UtcTime timestamp;
    double value = 0.0;
};

void keep_latest(std::map<std::string, DailyClose>& by_day, UtcTime t, double value) {
    auto [it, inserted] = by_day.try_emplace(utc_day_key(t), DailyClose{t, value});
    if (!inserted && t > it->second.timestamp) {
        it->second = DailyClose{t, value};
    }
}

}  // namespace

std::expected<void, ValidationError> validate_comparator_config(const ComparatorConfig& config) {
    if (config.min_common_days < 2) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidWindow,
                                               static_cast<double>(config.min_common_days)));
    }
    if (!(config.pass_correlation >= -1.0 && config.pass_correlation <= 1.0)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidThreshold,
                                               config.pass_correlation));
    }
    if (config.accepted_quality.empty()) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidBounds));
    }
    return {};
}

std::expected<ComparisonReport, DvolError>
compare_with_official_index(std::span<const IndexObservation> official,
                            std::span<const QualifiedDvol> computed,
                            const ComparatorConfig& config) {
    DVOLKIT_TRACE_ALGO_START(MODULE_COMPARATOR, official.size(), computed.size(), config.min_common_days);

    if (auto valid = validate_comparator_config(config); !valid) {
        DVOLKIT_TRACE_VALIDATION_ERROR(MODULE_COMPARATOR, static_cast<int>(valid.error().code),
                                       valid.error().value, 0);
        return std::unexpected(invalid_config_error(valid.error()));
    }

    std::map<std::string, DailyClose> official_daily;
    for (const auto& obs : official) {
        if (auto v = normalize_vol_quote(obs.value)) {
            keep_latest(official_daily, obs.timestamp, *v);
        }
    }

    std::map<std::string, DailyClose> computed_daily;
    for (const auto& c : computed) {
        bool accepted = std::find(config.accepted_quality.begin(), config.accepted_quality.end(),
                                  c.quality) != config.accepted_quality.end();
        if (!accepted || !(c.dvol > 0.0)) continue;
        keep_latest(computed_daily, c.timestamp, c.dvol);
    }

    std::vector<double> off;
    std::vector<double> comp;
    for (const auto& [day, close] : computed_daily) {
        auto it = official_daily.find(day);
        if (it == official_daily.end()) continue;
        comp.push_back(close.value);
        off.push_back(it->second.value);
    }

    const size_t n = off.size();
    if (n < config.min_common_days) {
        DVOLKIT_TRACE_INSUFFICIENT_DATA(MODULE_COMPARATOR,
                                        static_cast<int>(DvolErrorCode::TooFewCommonDays), n, 0.0);
        return std::unexpected(DvolError{.code = DvolErrorCode::TooFewCommonDays,
                                         .achieved_count = n});
    }

    std::vector<double> diff(n);
    for (size_t i = 0; i < n; ++i) diff[i] = comp[i] - off[i];

    ComparisonReport report;
    report.n_days = n;
    report.correlation = pearson_correlation(comp, off);
    report.mae = *mean_absolute_error(comp, off);
    report.rmse = *root_mean_squared_error(comp, off);
    report.bias = *mean(diff);
    report.passed = report.correlation && *report.correlation > config.pass_correlation;

    DVOLKIT_TRACE_COMPARISON_RESULT(n,
                                    report.correlation.value_or(std::numeric_limits<double>::quiet_NaN()),
                                    report.mae, report.rmse, report.passed ? 1 : 0);
    DVOLKIT_TRACE_ALGO_COMPLETE(MODULE_COMPARATOR, n, report.correlation.value_or(0.0));
    return report;
}

}  // namespace dvolkit
