#include <gtest/gtest.h>
#include "risk/keyed_store.hpp"
#include <string>
#include <thread>
#include <vector>

using namespace riskwatch;

TEST(KeyedStoreTest, CreatesEntriesWithFactory) {
    KeyedStore<std::string> store([](const std::string& key) { return "init:" + key; });

    auto value = store.with_entry("A", [](std::string& v) { return v; });

    EXPECT_EQ(value, "init:A");
    EXPECT_TRUE(store.contains("A"));
    EXPECT_FALSE(store.contains("B"));
    EXPECT_EQ(store.size(), 1u);
}

TEST(KeyedStoreTest, FindDoesNotCreate) {
    KeyedStore<int> store;

    EXPECT_FALSE(store.find("missing").has_value());
    EXPECT_EQ(store.size(), 0u);

    store.insert_or_assign("present", 7);
    ASSERT_TRUE(store.find("present").has_value());
    EXPECT_EQ(*store.find("present"), 7);
}

TEST(KeyedStoreTest, ForEachVisitsEveryEntry) {
    KeyedStore<int> store;
    for (int i = 0; i < 50; ++i) {
        store.insert_or_assign("key" + std::to_string(i), i);
    }

    int sum = 0;
    std::size_t visited = 0;
    store.for_each([&](const std::string&, const int& value) {
        sum += value;
        ++visited;
    });

    EXPECT_EQ(visited, 50u);
    EXPECT_EQ(sum, 49 * 50 / 2);
}

TEST(KeyedStoreTest, ConcurrentUpdatesToSameKeyAreSerialized) {
    KeyedStore<long> store;
    constexpr int kThreads = 8;
    constexpr int kIncrements = 10000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < kIncrements; ++i) {
                store.with_entry("shared", [](long& v) { ++v; });
                store.with_entry("own" + std::to_string(t), [](long& v) { ++v; });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(*store.find("shared"), static_cast<long>(kThreads) * kIncrements);
    EXPECT_EQ(*store.find("own3"), kIncrements);
    EXPECT_EQ(store.size(), static_cast<std::size_t>(kThreads) + 1);
}
