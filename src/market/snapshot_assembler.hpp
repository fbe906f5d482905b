// SPDX-License-Identifier: MIT
/**
 * @file snapshot_assembler.hpp
 * @brief Hourly option and forward snapshots from time-ordered trade streams
 *
 * Exchanges report trades, not books. A snapshot for hour H is the latest
 * trade of every instrument seen before H+1h and not before H-24h,
 * which is how thinly traded strikes stay on the grid between prints.
 */

#pragma once

#include "src/market/asset_config.hpp"
#include "src/market/forward_curve.hpp"
#include "src/market/option_quote.hpp"
#include "src/support/error_types.hpp"
#include <expected>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace dvolkit {

/// One option trade as delivered by the collector layer
struct OptionTrade {
    UtcTime timestamp;
    std::string instrument;
    double strike = 0.0;
    UtcTime expiry;
    OptionType type = OptionType::CALL;
    double iv = 0.0;                      ///< Decimal or percent, see normalize_vol_quote()
    std::optional<double> mark_price;     ///< Base coin for inverse assets
    std::optional<double> index_price;
};

/// One dated-futures trade; perpetuals carry no expiry
struct FuturesTrade {
    UtcTime timestamp;
    std::string instrument;
    std::optional<UtcTime> expiry;
    double mark_price = 0.0;              ///< Quote currency for every asset
    std::optional<double> index_price;
};

/// Option quotes materialized for one snapshot hour
struct OptionSnapshot {
    UtcTime hour;
    std::vector<OptionQuote> quotes;
    std::optional<double> spot;           ///< Latest index price in the window
};

/// Forward curve materialized for one snapshot hour
struct ForwardSnapshot {
    UtcTime hour;
    ForwardCurve curve;
};

/**
 * @brief Sliding 24-hour window holding the latest trade per instrument
 *
 * Trades must arrive in non-decreasing timestamp order. Each time a trade
 * crosses into a later hour, the window is handed to `emit` once for every
 * hour in between, so quiet hours still produce snapshots.
 *
 * @tparam Trade Record with `timestamp` and `instrument` members
 */
template <typename Trade>
class HourlyWindow {
public:
    using Window = std::map<std::string, Trade>;

    /// Add a trade, emitting every completed hour before it
    template <typename Emit>
    std::expected<void, ValidationError> add(const Trade& trade, Emit&& emit) {
        if (last_timestamp_ && trade.timestamp < *last_timestamp_) {
            return std::unexpected(ValidationError(
                ValidationErrorCode::UnsortedInput,
                static_cast<double>(to_epoch_ms(trade.timestamp)), count_));
        }
        last_timestamp_ = trade.timestamp;
        ++count_;

        UtcTime trade_hour = floor_to_hour(trade.timestamp);
        if (!current_hour_) {
            current_hour_ = trade_hour;
        }
        while (*current_hour_ < trade_hour) {
            emit(*current_hour_, static_cast<const Window&>(window_));
            *current_hour_ += kHour;
            evict_before(*current_hour_ - kDay);
        }

        window_.insert_or_assign(trade.instrument, trade);
        return {};
    }

    /// Emit the hour holding the last trade
    template <typename Emit>
    void flush(Emit&& emit) {
        if (current_hour_) {
            emit(*current_hour_, static_cast<const Window&>(window_));
        }
    }

private:
    void evict_before(UtcTime cutoff) {
        std::erase_if(window_, [cutoff](const auto& entry) {
            return entry.second.timestamp < cutoff;
        });
    }

    Window window_;
    std::optional<UtcTime> current_hour_;
    std::optional<UtcTime> last_timestamp_;
    size_t count_ = 0;
};

/// Build hourly option snapshots for one asset
///
/// Trades whose IV does not normalize are dropped. Hours whose window holds
/// fewer than `asset.min_snapshot_instruments` instruments are skipped. Inverse assets have mark prices converted to
/// quote currency with the trade's index price.
///
/// @return Snapshots in hour order, or UnsortedInput if trades are out of order
[[nodiscard]] std::expected<std::vector<OptionSnapshot>, ValidationError>
assemble_option_snapshots(std::span<const OptionTrade> trades, const AssetConfig& asset);

/// Build hourly forward curves for one asset from dated-futures trades
///
/// Perpetuals (no expiry) and non-positive marks are ignored. Hours with no
/// dated future in the window are skipped.
[[nodiscard]] std::expected<std::vector<ForwardSnapshot>, ValidationError>
assemble_forward_snapshots(std::span<const FuturesTrade> trades);

}  // namespace dvolkit
