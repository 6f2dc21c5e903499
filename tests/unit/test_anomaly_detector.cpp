#include <gtest/gtest.h>
#include "risk/anomaly_detector.hpp"

using namespace riskwatch;

TEST(AnomalyDetectorTest, NoScoreBeforeMinimumSamples) {
    AnomalyDetector detector(100, 5, 3.0);

    // Four prior observations: still no baseline, even for an extreme value
    for (double v : {95.0, 105.0, 95.0, 105.0}) {
        EXPECT_FALSE(detector.score("AAPL", v).has_value());
    }
    EXPECT_FALSE(detector.score("AAPL", 10000.0).has_value());
    EXPECT_EQ(detector.sample_count("AAPL"), 5u);
}

TEST(AnomalyDetectorTest, OutlierAgainstBaseline) {
    AnomalyDetector detector(100, 5, 3.0);

    // Baseline mean 100, population std dev 5
    for (double v : {95.0, 105.0, 95.0, 105.0, 95.0, 105.0}) {
        (void)detector.score("AAPL", v);
    }

    auto score = detector.score("AAPL", 1000.0);

    ASSERT_TRUE(score.has_value());
    EXPECT_NEAR(score->mean, 100.0, 1e-9);
    EXPECT_NEAR(score->std_dev, 5.0, 1e-9);
    EXPECT_NEAR(score->z_score, 180.0, 1e-6);
    EXPECT_EQ(score->samples, 6u);
    EXPECT_TRUE(detector.is_anomalous(*score));
}

TEST(AnomalyDetectorTest, ValueNearMeanIsNotAnomalous) {
    AnomalyDetector detector(100, 5, 3.0);
    for (double v : {95.0, 105.0, 95.0, 105.0, 95.0, 105.0}) {
        (void)detector.score("AAPL", v);
    }

    auto score = detector.score("AAPL", 110.0);

    ASSERT_TRUE(score.has_value());
    EXPECT_NEAR(score->z_score, 2.0, 1e-9);
    EXPECT_FALSE(detector.is_anomalous(*score));
}

TEST(AnomalyDetectorTest, LowOutlierIsAnomalous) {
    AnomalyDetector detector(100, 5, 3.0);
    for (double v : {95.0, 105.0, 95.0, 105.0, 95.0, 105.0}) {
        (void)detector.score("AAPL", v);
    }

    auto score = detector.score("AAPL", 50.0);

    ASSERT_TRUE(score.has_value());
    EXPECT_LT(score->z_score, -3.0);
    EXPECT_TRUE(detector.is_anomalous(*score));
}

TEST(AnomalyDetectorTest, ZeroSpreadDoesNotScore) {
    AnomalyDetector detector(100, 5, 3.0);
    for (int i = 0; i < 10; ++i) {
        (void)detector.score("MSFT", 100.0);
    }

    EXPECT_FALSE(detector.score("MSFT", 5000.0).has_value());
}

TEST(AnomalyDetectorTest, SymbolsHaveSeparateBaselines) {
    AnomalyDetector detector(100, 5, 3.0);
    for (double v : {95.0, 105.0, 95.0, 105.0, 95.0}) {
        (void)detector.score("AAPL", v);
    }

    EXPECT_FALSE(detector.score("TSLA", 1000.0).has_value());
    EXPECT_EQ(detector.sample_count("TSLA"), 1u);
}
