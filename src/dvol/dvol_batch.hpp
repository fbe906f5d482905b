// SPDX-License-Identifier: MIT
/**
 * @file dvol_batch.hpp
 * @brief Parallel DVOL over many (asset, snapshot hour) work items
 */

#pragma once

#include "src/dvol/dvol_index.hpp"
#include "src/market/snapshot_assembler.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace dvolkit {

/// Everything needed to compute one hour of one asset
struct DvolWorkItem {
    std::string asset;
    UtcTime snapshot_hour;
    std::vector<OptionQuote> quotes;
    double spot = 0.0;
    ForwardCurve forwards;            ///< Empty when the asset has no dated futures
};

/// Batch result: one entry per work item, in input order
struct BatchDvolResult {
    std::vector<std::expected<DvolResult, DvolError>> results;
    size_t failed_count = 0;          ///< Items with no DVOL (any reason)

    bool all_succeeded() const { return failed_count == 0; }
};

/**
 * @brief Join option and forward snapshots by hour into work items
 *
 * Hours without a spot price are skipped since neither the forward
 * fallback nor the spot validation can be satisfied. Hours without a
 * forward snapshot get an empty curve.
 */
[[nodiscard]] std::vector<DvolWorkItem>
make_work_items(const std::string& asset,
                std::span<const OptionSnapshot> options,
                std::span<const ForwardSnapshot> forwards);

/**
 * @brief DVOL for every work item
 *
 * Items are independent and processed in parallel when OpenMP is
 * available. A failure in one item never affects another.
 */
[[nodiscard]] BatchDvolResult
compute_dvol_batch(std::span<const DvolWorkItem> items, const DvolConfig& config = {});

}  // namespace dvolkit
