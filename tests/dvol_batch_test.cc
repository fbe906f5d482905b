// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/dvol/dvol_batch.hpp"
#include "tests/synthetic_chain.hpp"

namespace dvolkit {
namespace {

using testing::test_hour;
using testing::two_expiry_snapshot;

DvolWorkItem make_item(double iv, size_t n_side, double spot = 100.0) {
    DvolWorkItem item;
    item.asset = "BTC";
    item.snapshot_hour = test_hour();
    item.quotes = two_expiry_snapshot(0.05, n_side, 0.10, n_side, iv);
    item.spot = spot;
    return item;
}

TEST(DvolBatchTest, MatchesSequentialInInputOrder) {
    std::vector<DvolWorkItem> items;
    for (int i = 0; i < 16; ++i) {
        items.push_back(make_item(0.3 + 0.05 * i, 10));
    }

    auto batch = compute_dvol_batch(items);
    ASSERT_EQ(batch.results.size(), items.size());
    EXPECT_TRUE(batch.all_succeeded());

    for (size_t i = 0; i < items.size(); ++i) {
        auto single = compute_dvol_at_hour(items[i].quotes, items[i].snapshot_hour, items[i].spot);
        ASSERT_TRUE(single.has_value());
        ASSERT_TRUE(batch.results[i].has_value()) << i;
        EXPECT_EQ(batch.results[i]->dvol, single->dvol) << i;
    }
}

TEST(DvolBatchTest, FailuresAreIsolated) {
    std::vector<DvolWorkItem> items = {
        make_item(0.5, 10),
        make_item(0.5, 2),          // too thin
        make_item(0.5, 10, -1.0),   // no spot
        make_item(0.7, 10),
    };

    auto batch = compute_dvol_batch(items);
    ASSERT_EQ(batch.results.size(), 4u);
    EXPECT_EQ(batch.failed_count, 2u);
    EXPECT_FALSE(batch.all_succeeded());

    EXPECT_TRUE(batch.results[0].has_value());
    ASSERT_FALSE(batch.results[1].has_value());
    EXPECT_EQ(batch.results[1].error().code, DvolErrorCode::TooFewOtmStrikes);
    ASSERT_FALSE(batch.results[2].has_value());
    EXPECT_EQ(batch.results[2].error().code, DvolErrorCode::NonPositiveSpot);
    EXPECT_TRUE(batch.results[3].has_value());
}

TEST(DvolBatchTest, EmptyBatch) {
    auto batch = compute_dvol_batch(std::span<const DvolWorkItem>{});
    EXPECT_TRUE(batch.results.empty());
    EXPECT_TRUE(batch.all_succeeded());
}

TEST(DvolBatchTest, UsesForwardCurveOfItem) {
    auto plain = make_item(0.6, 8);
    auto with_curve = plain;
    with_curve.forwards.insert(testing::expiry_after(test_hour(), 0.05), 103.0);

    std::vector<DvolWorkItem> items = {plain, with_curve};
    auto batch = compute_dvol_batch(items);
    ASSERT_TRUE(batch.results[0].has_value());
    ASSERT_TRUE(batch.results[1].has_value());
    EXPECT_NE(batch.results[0]->near_variance, batch.results[1]->near_variance);
    EXPECT_EQ(batch.results[0]->far_variance, batch.results[1]->far_variance);
}

TEST(MakeWorkItemsTest, JoinsSnapshotsByHour) {
    const UtcTime h0 = test_hour();
    const UtcTime h1 = h0 + kHour;

    std::vector<OptionSnapshot> options(3);
    options[0].hour = h0;
    options[0].spot = 100.0;
    options[1].hour = h1;
    options[1].spot = 101.0;
    options[2].hour = h1 + kHour;          // no spot: skipped

    std::vector<ForwardSnapshot> forwards(1);
    forwards[0].hour = h1;
    forwards[0].curve.insert(h1 + 30 * kDay, 102.0);

    auto items = make_work_items("ETH", options, forwards);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].asset, "ETH");
    EXPECT_EQ(items[0].snapshot_hour, h0);
    EXPECT_TRUE(items[0].forwards.empty());
    EXPECT_EQ(items[1].snapshot_hour, h1);
    EXPECT_DOUBLE_EQ(items[1].spot, 101.0);
    EXPECT_EQ(items[1].forwards.size(), 1u);
}

TEST(DvolBatchTest, InvalidConfigFailsEveryItem) {
    std::vector<DvolWorkItem> items = {make_item(0.5, 10), make_item(0.6, 10)};
    DvolConfig config;
    config.min_strikes = 0;

    auto batch = compute_dvol_batch(items, config);
    ASSERT_EQ(batch.results.size(), 2u);
    EXPECT_EQ(batch.failed_count, 2u);
    for (const auto& r : batch.results) {
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, DvolErrorCode::InvalidConfig);
    }
}

}  // namespace
}  // namespace dvolkit
