// SPDX-License-Identifier: MIT
#include "src/vov/vov_series.hpp"
#include "src/math/statistics.hpp"
#include "src/support/dvol_trace.h"
#include "src/support/parallel.hpp"
#include <algorithm>
#include <cmath>

namespace dvolkit {

std::expected<void, ValidationError> validate_vov_config(const VovConfig& config) {
    if (config.window < 2) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidWindow,
                                               static_cast<double>(config.window)));
    }
    if (config.min_valid_returns < 2 || config.min_valid_returns > config.window) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidWindow,
                                               static_cast<double>(config.min_valid_returns)));
    }
    if (!(config.annualization_days > 0.0)) {
        return std::unexpected(ValidationError(ValidationErrorCode::OutOfRange,
                                               config.annualization_days));
    }
    if (!(config.alpha > 0.0)) {
        return std::unexpected(ValidationError(ValidationErrorCode::OutOfRange, config.alpha));
    }
    if (!(config.f_vov_cap > 0.0)) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidBounds, config.f_vov_cap));
    }
    return {};
}

std::vector<VovRecord> compute_vov_series(std::span<const DailyDvol> daily,
                                          const VovConfig& config) {
    if (auto valid = validate_vov_config(config); !valid) {
        DVOLKIT_TRACE_VALIDATION_ERROR(MODULE_VOV, static_cast<int>(valid.error().code),
                                       valid.error().value, 0);
        return {};
    }
    if (daily.size() < 2) {
        DVOLKIT_TRACE_INSUFFICIENT_DATA(MODULE_VOV, static_cast<int>(DvolErrorCode::EmptyInput),
                                        daily.size(), 0.0);
        return {};
    }
    DVOLKIT_TRACE_ALGO_START(MODULE_VOV, daily.size(), config.window, config.min_valid_returns);

    std::vector<VovRecord> records;
    records.reserve(daily.size());
    for (size_t i = 0; i < daily.size(); ++i) {
        VovRecord rec;
        rec.date = daily[i].date;
        rec.timestamp = daily[i].timestamp;
        rec.dvol_daily = daily[i].dvol;
        if (i > 0) {
            double prev = daily[i - 1].dvol;
            double curr = daily[i].dvol;
            if (prev > 0.0 && curr > 0.0) {
                rec.log_return = std::log(curr / prev);
            }
        }
        records.push_back(std::move(rec));
    }

    const double annualize = std::sqrt(config.annualization_days);
    size_t n_vov = 0;
    std::vector<double> returns;
    returns.reserve(config.window);
    for (size_t i = config.window; i < records.size(); ++i) {
        returns.clear();
        for (size_t j = i + 1 - config.window; j <= i; ++j) {
            if (records[j].log_return) returns.push_back(*records[j].log_return);
        }
        if (returns.size() < config.min_valid_returns) {
            records[i].f_vov = 1.0;
            continue;
        }
        records[i].vov = *sample_stddev(returns) * annualize;
        ++n_vov;
    }

    DVOLKIT_TRACE_ALGO_COMPLETE(MODULE_VOV, n_vov, 0.0);
    return records;
}

double compute_vov_bar(std::span<const VovRecord> records) {
    std::vector<double> valid;
    valid.reserve(records.size());
    for (const auto& r : records) {
        if (r.vov && !std::isnan(*r.vov)) valid.push_back(*r.vov);
    }
    double bar = mean(valid).value_or(1.0);
    DVOLKIT_TRACE_VOV_BAR(valid.size(), bar);
    return bar;
}

double compute_f_vov(std::optional<double> vov, double vov_bar, const VovConfig& config) {
    if (!vov || !(*vov > 0.0) || !(vov_bar > 0.0)) {
        return 1.0;
    }
    return std::min(std::pow(*vov / vov_bar, config.alpha), config.f_vov_cap);
}

void add_f_vov_to_series(std::vector<VovRecord>& records, const VovConfig& config) {
    const double vov_bar = compute_vov_bar(records);
    for (auto& rec : records) {
        rec.f_vov = compute_f_vov(rec.vov, vov_bar, config);
    }
}

std::vector<VovRecord> compute_vov_pipeline(std::span<const DvolObservation> hourly,
                                            const VovConfig& config) {
    auto daily = resample_dvol_daily(hourly);
    auto records = compute_vov_series(daily, config);
    add_f_vov_to_series(records, config);
    return records;
}

std::map<std::string, std::vector<VovRecord>>
compute_vov_by_asset(const std::map<std::string, std::vector<DvolObservation>>& hourly_by_asset,
                     const VovConfig& config) {
    std::vector<const std::string*> assets;
    std::vector<const std::vector<DvolObservation>*> series;
    for (const auto& [asset, hourly] : hourly_by_asset) {
        assets.push_back(&asset);
        series.push_back(&hourly);
    }

    const size_t n = assets.size();
    std::vector<std::vector<VovRecord>> results(n);

    DVOLKIT_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < n; ++i) {
        results[i] = compute_vov_pipeline(*series[i], config);
    }

    std::map<std::string, std::vector<VovRecord>> by_asset;
    for (size_t i = 0; i < n; ++i) {
        by_asset.emplace(*assets[i], std::move(results[i]));
    }
    return by_asset;
}

}  // namespace dvolkit
