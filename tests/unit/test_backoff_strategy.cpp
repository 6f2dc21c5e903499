#include <gtest/gtest.h>
#include "engine/backoff_strategy.hpp"

using namespace riskwatch;
using std::chrono::milliseconds;

TEST(BackoffStrategyTest, DoublesUntilCap) {
    BackoffStrategy backoff(milliseconds{100}, milliseconds{1000}, 2.0, 0.0);

    EXPECT_EQ(backoff.next_delay().count(), 100);
    EXPECT_EQ(backoff.next_delay().count(), 200);
    EXPECT_EQ(backoff.next_delay().count(), 400);
    EXPECT_EQ(backoff.next_delay().count(), 800);
    EXPECT_EQ(backoff.next_delay().count(), 1000);
    EXPECT_EQ(backoff.next_delay().count(), 1000);
    EXPECT_EQ(backoff.attempt_count(), 6u);
}

TEST(BackoffStrategyTest, ResetReturnsToBase) {
    BackoffStrategy backoff(milliseconds{100}, milliseconds{1000}, 2.0, 0.0);

    (void)backoff.next_delay();
    (void)backoff.next_delay();
    backoff.reset();

    EXPECT_EQ(backoff.attempt_count(), 0u);
    EXPECT_EQ(backoff.current_delay().count(), 100);
    EXPECT_EQ(backoff.next_delay().count(), 100);
}

TEST(BackoffStrategyTest, JitterStaysWithinBounds) {
    BackoffStrategy backoff(milliseconds{1000}, milliseconds{1000}, 2.0, 0.3);

    for (int i = 0; i < 100; ++i) {
        auto delay = backoff.next_delay().count();
        EXPECT_GE(delay, 700);
        EXPECT_LE(delay, 1300);
    }
}

TEST(BackoffStrategyTest, StorePolicyFollowsEngineSettings) {
    Config::Engine engine;
    engine.retry_delay_initial = milliseconds{250};
    engine.retry_delay_max = milliseconds{600};
    engine.retry_backoff_multiplier = 3.0;
    engine.retry_jitter_factor = 0.0;

    auto backoff = BackoffStrategy::for_store(engine);

    EXPECT_EQ(backoff.next_delay().count(), 250);
    EXPECT_EQ(backoff.next_delay().count(), 600);
    EXPECT_EQ(backoff.next_delay().count(), 600);
}

TEST(BackoffStrategyTest, RedeliveryDoublesUpToEightTimesTheBase) {
    auto backoff = BackoffStrategy::for_redelivery(milliseconds{500});

    EXPECT_EQ(backoff.next_delay().count(), 500);
    EXPECT_EQ(backoff.next_delay().count(), 1000);
    EXPECT_EQ(backoff.next_delay().count(), 2000);
    EXPECT_EQ(backoff.next_delay().count(), 4000);
    EXPECT_EQ(backoff.next_delay().count(), 4000);
}
