// SPDX-License-Identifier: MIT
#include "src/dvol/dvol_batch.hpp"
#include "src/support/dvol_trace.h"
#include "src/support/parallel.hpp"
#include <map>

namespace dvolkit {

std::vector<DvolWorkItem>
make_work_items(const std::string& asset,
                std::span<const OptionSnapshot> options,
                std::span<const ForwardSnapshot> forwards) {
    std::map<UtcTime, const ForwardCurve*> curve_by_hour;
    for (const auto& fs : forwards) {
        curve_by_hour[fs.hour] = &fs.curve;
    }

    std::vector<DvolWorkItem> items;
    items.reserve(options.size());
    for (const auto& snap : options) {
        if (!snap.spot) continue;
        DvolWorkItem item;
        item.asset = asset;
        item.snapshot_hour = snap.hour;
        item.quotes = snap.quotes;
        item.spot = *snap.spot;
        if (auto it = curve_by_hour.find(snap.hour); it != curve_by_hour.end()) {
            item.forwards = *it->second;
        }
        items.push_back(std::move(item));
    }
    return items;
}

BatchDvolResult
compute_dvol_batch(std::span<const DvolWorkItem> items, const DvolConfig& config) {
    const size_t n = items.size();
    DVOLKIT_TRACE_ALGO_START(MODULE_DVOL_BATCH, n, max_parallel_threads(), 0);

    // Pre-size so each thread writes only its own slot
    std::vector<std::expected<DvolResult, DvolError>> results(
        n, std::unexpected(DvolError{.code = DvolErrorCode::EmptyInput}));

    if (auto valid = validate_dvol_config(config); !valid) {
        DVOLKIT_TRACE_VALIDATION_ERROR(MODULE_DVOL_BATCH, static_cast<int>(valid.error().code),
                                       valid.error().value, 0);
        for (auto& r : results) {
            r = std::unexpected(invalid_config_error(valid.error()));
        }
        return BatchDvolResult{.results = std::move(results), .failed_count = n};
    }

    DVOLKIT_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < n; ++i) {
        const auto& item = items[i];
        const ForwardCurve* curve = item.forwards.empty() ? nullptr : &item.forwards;
        results[i] = compute_dvol_at_hour(item.quotes, item.snapshot_hour, item.spot, curve, config);
    }

    size_t failed = 0;
    for (const auto& r : results) {
        if (!r) ++failed;
    }

    DVOLKIT_TRACE_BATCH_COMPLETE(n, n - failed);
    DVOLKIT_TRACE_ALGO_COMPLETE(MODULE_DVOL_BATCH, n, static_cast<double>(failed));
    return BatchDvolResult{.results = std::move(results), .failed_count = failed};
}

}  // namespace dvolkit
