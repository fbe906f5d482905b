// SPDX-License-Identifier: MIT
#include "src/market/snapshot_assembler.hpp"
#include "src/support/dvol_trace.h"

namespace dvolkit {

namespace {

std::optional<double> to_quote_currency(std::optional<double> mark,
                                        std::optional<double> index,
                                        bool is_inverse) {
    if (mark && is_inverse && index && *index != 0.0) {
        return *mark * *index;
    }
    return mark;
}

}  // namespace

std::expected<std::vector<OptionSnapshot>, ValidationError>
assemble_option_snapshots(std::span<const OptionTrade> trades, const AssetConfig& asset) {
    std::vector<OptionSnapshot> snapshots;
    HourlyWindow<OptionTrade> window;

    auto emit = [&](UtcTime hour, const HourlyWindow<OptionTrade>::Window& w) {
        if (w.size() < asset.min_snapshot_instruments || w.empty()) {
            return;
        }

        OptionSnapshot snap;
        snap.hour = hour;
        snap.quotes.reserve(w.size());

        std::optional<UtcTime> spot_time;
        for (const auto& [name, trade] : w) {
            OptionQuote q;
            q.strike = trade.strike;
            q.expiry = trade.expiry;
            q.type = trade.type;
            q.mark_iv = trade.iv;
            q.mark_price = to_quote_currency(trade.mark_price, trade.index_price, asset.is_inverse);
            q.underlying_price = trade.index_price;
            snap.quotes.push_back(q);

            if (trade.index_price && (!spot_time || trade.timestamp >= *spot_time)) {
                spot_time = trade.timestamp;
                snap.spot = trade.index_price;
            }
        }

        DVOLKIT_TRACE_SNAPSHOT_EMITTED(to_epoch_ms(hour), w.size());
        snapshots.push_back(std::move(snap));
    };

    for (const auto& trade : trades) {
        // Trades with an unusable IV never enter the window
        auto iv = normalize_vol_quote(trade.iv);
        if (!iv) continue;
        OptionTrade normalized = trade;
        normalized.iv = *iv;

        auto added = window.add(normalized, emit);
        if (!added) {
            DVOLKIT_TRACE_VALIDATION_ERROR(MODULE_SNAPSHOT,
                static_cast<int>(added.error().code), added.error().value, added.error().index);
            return std::unexpected(added.error());
        }
    }
    window.flush(emit);

    return snapshots;
}

std::expected<std::vector<ForwardSnapshot>, ValidationError>
assemble_forward_snapshots(std::span<const FuturesTrade> trades) {
    std::vector<ForwardSnapshot> snapshots;
    HourlyWindow<FuturesTrade> window;

    auto emit = [&](UtcTime hour, const HourlyWindow<FuturesTrade>::Window& w) {
        ForwardSnapshot snap;
        snap.hour = hour;
        for (const auto& [name, trade] : w) {
            if (!trade.expiry) continue;
            if (!(trade.mark_price > 0.0)) continue;
            snap.curve.insert(*trade.expiry, trade.mark_price);
        }
        if (!snap.curve.empty()) {
            snapshots.push_back(std::move(snap));
        }
    };

    for (const auto& trade : trades) {
        auto added = window.add(trade, emit);
        if (!added) {
            DVOLKIT_TRACE_VALIDATION_ERROR(MODULE_SNAPSHOT,
                static_cast<int>(added.error().code), added.error().value, added.error().index);
            return std::unexpected(added.error());
        }
    }
    window.flush(emit);

    return snapshots;
}

}  // namespace dvolkit
