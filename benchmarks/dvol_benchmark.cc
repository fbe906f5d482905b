// SPDX-License-Identifier: MIT
#include <benchmark/benchmark.h>
#include <cmath>
#include <string>
#include <vector>
#include "src/dvol/dvol_batch.hpp"
#include "src/dvol/dvol_index.hpp"
#include "src/dvol/expiry_variance.hpp"
#include "src/support/parallel.hpp"
#include "src/vov/vov_series.hpp"

using namespace dvolkit;

namespace {

// Chain with `n_side` strikes per side around the forward, both types quoted
std::vector<OptionQuote> make_chain(UtcTime expiry, double forward, size_t n_side,
                                    double spacing, double iv) {
    std::vector<OptionQuote> quotes;
    for (size_t i = 0; i <= 2 * n_side; ++i) {
        double k = forward + (static_cast<double>(i) - static_cast<double>(n_side)) * spacing;
        double smile = iv + 0.1 * std::abs(k / forward - 1.0);
        quotes.push_back({k, expiry, OptionType::CALL, smile, std::nullopt, std::nullopt});
        quotes.push_back({k, expiry, OptionType::PUT, smile, std::nullopt, std::nullopt});
    }
    return quotes;
}

const UtcTime kHourStart = make_utc_time(2024, 3, 1, 12);

std::vector<OptionQuote> make_snapshot(size_t n_side) {
    std::vector<OptionQuote> quotes;
    for (int days : {1, 7, 14, 21, 28, 35, 63, 91, 182}) {
        auto chain = make_chain(kHourStart + days * kDay, 60000.0, n_side, 1000.0, 0.55);
        quotes.insert(quotes.end(), chain.begin(), chain.end());
    }
    return quotes;
}

}  // namespace

static void BM_ExpiryVariance(benchmark::State& state) {
    const size_t n_side = state.range(0);
    auto quotes = make_chain(kHourStart + 30 * kDay, 60000.0, n_side,
                             40000.0 / static_cast<double>(n_side), 0.55);

    for (auto _ : state) {
        auto result = compute_expiry_variance(quotes, 30.0 / kDaysPerYear, 60000.0);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * quotes.size());
}
BENCHMARK(BM_ExpiryVariance)->Arg(10)->Arg(40)->Arg(160);

static void BM_DvolAtHour(benchmark::State& state) {
    auto quotes = make_snapshot(state.range(0));

    for (auto _ : state) {
        auto result = compute_dvol_at_hour(quotes, kHourStart, 60000.0);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * quotes.size());
}
BENCHMARK(BM_DvolAtHour)->Arg(10)->Arg(40);

static void BM_DvolBatch(benchmark::State& state) {
    const size_t n_hours = state.range(0);
    std::vector<DvolWorkItem> items(n_hours);
    for (size_t h = 0; h < n_hours; ++h) {
        items[h].asset = "BTC";
        items[h].snapshot_hour = kHourStart + static_cast<int>(h % 12) * kHour;
        items[h].quotes = make_snapshot(20);
        items[h].spot = 60000.0 + static_cast<double>(h);
    }

    for (auto _ : state) {
        auto batch = compute_dvol_batch(items);
        benchmark::DoNotOptimize(batch.failed_count);
    }
    state.SetItemsProcessed(state.iterations() * n_hours);
    state.SetLabel("threads=" + std::to_string(max_parallel_threads()));
}
BENCHMARK(BM_DvolBatch)->Arg(24)->Arg(24 * 30);

static void BM_VovPipeline(benchmark::State& state) {
    const size_t n_days = state.range(0);
    std::vector<DvolObservation> hourly;
    for (size_t h = 0; h < n_days * 24; ++h) {
        double dvol = 0.5 + 0.1 * std::sin(static_cast<double>(h) / 50.0);
        hourly.push_back({kHourStart + static_cast<int>(h) * kHour, dvol});
    }

    for (auto _ : state) {
        auto records = compute_vov_pipeline(hourly);
        benchmark::DoNotOptimize(records.data());
    }
    state.SetItemsProcessed(state.iterations() * hourly.size());
}
BENCHMARK(BM_VovPipeline)->Arg(365)->Arg(365 * 4);

BENCHMARK_MAIN();
