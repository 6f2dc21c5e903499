#include <gtest/gtest.h>
#include "risk/exposure_aggregator.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <random>
#include <vector>

using namespace riskwatch;
using riskwatch::test::make_transaction;

// ============================================================================
// Classification
// ============================================================================

TEST(ClassifyRiskTest, BandBoundaries) {
    const double threshold = 1'000'000.0;

    EXPECT_EQ(classify_risk(0.0, threshold), RiskLevel::Low);
    EXPECT_EQ(classify_risk(499'999.99, threshold), RiskLevel::Low);
    EXPECT_EQ(classify_risk(500'000.0, threshold), RiskLevel::Medium);
    EXPECT_EQ(classify_risk(799'999.99, threshold), RiskLevel::Medium);
    EXPECT_EQ(classify_risk(800'000.0, threshold), RiskLevel::High);
    EXPECT_EQ(classify_risk(999'999.99, threshold), RiskLevel::High);
    EXPECT_EQ(classify_risk(1'000'000.0, threshold), RiskLevel::Critical);
    EXPECT_EQ(classify_risk(5'000'000.0, threshold), RiskLevel::Critical);
}

TEST(ClassifyRiskTest, NonPositiveThresholdIsCritical) {
    EXPECT_EQ(classify_risk(0.0, 0.0), RiskLevel::Critical);
    EXPECT_EQ(classify_risk(10.0, -1.0), RiskLevel::Critical);
}

TEST(ClassifyRiskTest, CustomBands) {
    RiskBands bands{0.25, 0.5, 0.75};

    EXPECT_EQ(classify_risk(24.0, 100.0, bands), RiskLevel::Low);
    EXPECT_EQ(classify_risk(25.0, 100.0, bands), RiskLevel::Medium);
    EXPECT_EQ(classify_risk(50.0, 100.0, bands), RiskLevel::High);
    EXPECT_EQ(classify_risk(75.0, 100.0, bands), RiskLevel::Critical);
}

// ============================================================================
// Aggregation
// ============================================================================

class ExposureAggregatorTest : public ::testing::Test {
protected:
    ExposureAggregatorTest() : aggregator(thresholds()) {}

    static Config::Thresholds thresholds() {
        Config::Thresholds t;
        t.client_exposure = 1'000'000.0;
        t.symbol_exposure = 500'000.0;
        return t;
    }

    ExposureAggregator aggregator;
};

TEST_F(ExposureAggregatorTest, SingleTransactionCreatesBothAggregates) {
    auto update = aggregator.apply(make_transaction(1, 0, "CLIENT_0001", "AAPL", 100, 150.0));

    ASSERT_TRUE(update.has_value());
    EXPECT_DOUBLE_EQ(update->client.total_exposure, 15'000.0);
    EXPECT_EQ(update->client.position_count, 1);
    EXPECT_EQ(update->client.risk_level, RiskLevel::Low);
    EXPECT_EQ(update->client_previous, RiskLevel::Low);
    EXPECT_DOUBLE_EQ(update->symbol.total_exposure, 15'000.0);
    EXPECT_EQ(update->symbol.transaction_count, 1);
}

TEST_F(ExposureAggregatorTest, SellsAddToGrossExposure) {
    (void)aggregator.apply(make_transaction(1, 0, "C1", "AAPL", 100, 100.0, Side::Buy));
    (void)aggregator.apply(make_transaction(2, 1, "C1", "AAPL", 100, 100.0, Side::Sell));

    auto client = aggregator.client("C1");
    ASSERT_TRUE(client.has_value());
    EXPECT_DOUBLE_EQ(client->total_exposure, 20'000.0);
}

TEST_F(ExposureAggregatorTest, ReportsPreviousLevelOnBandCrossing) {
    (void)aggregator.apply(make_transaction(1, 0, "C1", "AAPL", 1000, 600.0));   // 600k MEDIUM
    auto update = aggregator.apply(make_transaction(2, 1, "C1", "MSFT", 1000, 300.0));  // 900k HIGH

    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->client_previous, RiskLevel::Medium);
    EXPECT_EQ(update->client.risk_level, RiskLevel::High);
}

TEST_F(ExposureAggregatorTest, ReplayedTransactionIsIgnored) {
    auto txn = make_transaction(7, 0, "C1", "AAPL", 10, 100.0);

    ASSERT_TRUE(aggregator.apply(txn).has_value());
    EXPECT_FALSE(aggregator.apply(txn).has_value());

    // An earlier transaction for the same client is also behind the watermark
    EXPECT_FALSE(aggregator.apply(make_transaction(3, 0, "C1", "MSFT", 1, 1.0)).has_value());

    EXPECT_DOUBLE_EQ(aggregator.client("C1")->total_exposure, 1'000.0);
    EXPECT_DOUBLE_EQ(aggregator.symbol("AAPL")->total_exposure, 1'000.0);
    EXPECT_FALSE(aggregator.symbol("MSFT").has_value());
}

TEST_F(ExposureAggregatorTest, ExposureIsOrderIndependent) {
    std::vector<Transaction> txns;
    double expected = 0.0;
    for (int i = 0; i < 40; ++i) {
        auto txn = make_transaction(i + 1, i, "C" + std::to_string(i % 4),
                                    i % 2 == 0 ? "AAPL" : "MSFT", 10 + i, 100.0 + i);
        expected += txn.total_value;
        txns.push_back(txn);
    }

    // Per client, feed order is kept; across clients the interleaving changes
    std::vector<Transaction> shuffled = txns;
    std::stable_sort(shuffled.begin(), shuffled.end(),
                     [](const Transaction& a, const Transaction& b) {
                         return a.client_id > b.client_id;
                     });

    ExposureAggregator other(thresholds());
    for (const auto& txn : txns) {
        (void)aggregator.apply(txn);
    }
    for (const auto& txn : shuffled) {
        (void)other.apply(txn);
    }

    EXPECT_NEAR(aggregator.summary().total_exposure, expected, 1e-6);
    EXPECT_NEAR(other.summary().total_exposure, expected, 1e-6);
    for (int c = 0; c < 4; ++c) {
        auto id = "C" + std::to_string(c);
        EXPECT_NEAR(aggregator.client(id)->total_exposure, other.client(id)->total_exposure, 1e-6);
    }
    EXPECT_NEAR(aggregator.symbol("AAPL")->total_exposure, other.symbol("AAPL")->total_exposure, 1e-6);
}

TEST_F(ExposureAggregatorTest, SummaryCountsActiveAndHighRisk) {
    (void)aggregator.apply(make_transaction(1, 0, "C1", "AAPL", 1000, 900.0));  // client 900k HIGH
    (void)aggregator.apply(make_transaction(2, 1, "C2", "MSFT", 10, 100.0));

    auto summary = aggregator.summary();

    EXPECT_EQ(summary.total_transactions, 2);
    EXPECT_DOUBLE_EQ(summary.total_exposure, 901'000.0);
    EXPECT_EQ(summary.active_clients, 2);
    EXPECT_EQ(summary.active_symbols, 2);
    EXPECT_EQ(summary.high_risk_clients, 1);
    EXPECT_EQ(summary.high_risk_symbols, 1);  // AAPL 900k against 500k
}

TEST_F(ExposureAggregatorTest, PerEntityOverrideThreshold) {
    auto t = thresholds();
    t.client_overrides["WHALE"] = 10'000'000.0;
    ExposureAggregator custom(t);

    auto update = custom.apply(make_transaction(1, 0, "WHALE", "AAPL", 10000, 120.0));

    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->client.risk_level, RiskLevel::Low);
    EXPECT_DOUBLE_EQ(custom.client_threshold("WHALE"), 10'000'000.0);
}

TEST_F(ExposureAggregatorTest, HydrateRestoresStateAndWatermark) {
    ClientExposure stored;
    stored.client_id = "C1";
    stored.total_exposure = 850'000.0;
    stored.position_count = 12;
    stored.risk_level = RiskLevel::Low;  // recomputed on hydrate
    stored.last_applied = make_transaction(5, 10, "C1", "AAPL", 1, 1.0).marker();

    SymbolExposure symbol;
    symbol.symbol = "AAPL";
    symbol.total_exposure = 850'000.0;
    symbol.transaction_count = 12;

    aggregator.hydrate({stored}, {symbol});

    auto client = aggregator.client("C1");
    ASSERT_TRUE(client.has_value());
    EXPECT_EQ(client->risk_level, RiskLevel::High);
    EXPECT_EQ(aggregator.symbol("AAPL")->risk_level, RiskLevel::Critical);

    // Already applied before the restart
    EXPECT_FALSE(aggregator.apply(make_transaction(5, 10, "C1", "AAPL", 1, 1.0)).has_value());
    EXPECT_TRUE(aggregator.apply(make_transaction(6, 11, "C1", "AAPL", 1, 1.0)).has_value());
}
