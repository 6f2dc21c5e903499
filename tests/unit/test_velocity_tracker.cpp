#include <gtest/gtest.h>
#include "risk/velocity_tracker.hpp"

using namespace riskwatch;
using std::chrono::seconds;

namespace {

const WallTime kStart{seconds{1'700'000'000}};

}  // namespace

TEST(VelocityTrackerTest, ElevenInOneMinute) {
    VelocityTracker tracker(seconds{60});

    std::size_t count = 0;
    for (int i = 0; i < 11; ++i) {
        count = tracker.record("CLIENT_0001", kStart + seconds{i * 5});
    }

    EXPECT_EQ(count, 11u);
}

TEST(VelocityTrackerTest, SpacedTransactionsNeverAccumulate) {
    VelocityTracker tracker(seconds{60});

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(tracker.record("CLIENT_0001", kStart + seconds{i * 61}), 1u);
    }
}

TEST(VelocityTrackerTest, ClientsAreIndependent) {
    VelocityTracker tracker(seconds{60});

    tracker.record("A", kStart);
    tracker.record("A", kStart + seconds{1});
    tracker.record("B", kStart + seconds{2});

    EXPECT_EQ(tracker.count("A", kStart + seconds{2}), 2u);
    EXPECT_EQ(tracker.count("B", kStart + seconds{2}), 1u);
    EXPECT_EQ(tracker.tracked_clients(), 2u);
}

TEST(VelocityTrackerTest, CountForUnknownClientIsZero) {
    VelocityTracker tracker(seconds{60});

    EXPECT_EQ(tracker.count("nobody", kStart), 0u);
    EXPECT_EQ(tracker.tracked_clients(), 0u);
}
