#include <benchmark/benchmark.h>
#include "risk/anomaly_detector.hpp"
#include "risk/rolling_stats.hpp"
#include "risk/velocity_tracker.hpp"
#include <random>
#include <string>
#include <vector>

using namespace riskwatch;

// Benchmark single value addition with window sliding
static void BM_RollingStatsAdd(benchmark::State& state) {
    auto window_size = static_cast<std::size_t>(state.range(0));
    RollingStats stats(window_size);

    for (std::size_t i = 0; i < window_size; ++i) {
        stats.add(1000.0 + static_cast<double>(i));
    }

    double value = 1000.0;
    for (auto _ : state) {
        stats.add(value);
        benchmark::DoNotOptimize(stats.std_dev());
        value += 0.5;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RollingStatsAdd)->Range(10, 1000);

// Benchmark anomaly scoring across a realistic symbol universe
static void BM_AnomalyScore(benchmark::State& state) {
    AnomalyDetector detector(100, 5, 3.0);

    std::vector<std::string> symbols;
    for (int i = 0; i < 50; ++i) {
        symbols.push_back("SYM" + std::to_string(i));
    }

    std::mt19937 rng(42);
    std::lognormal_distribution<double> value_dist(9.0, 1.0);

    for (const auto& symbol : symbols) {
        for (int i = 0; i < 100; ++i) {
            (void)detector.score(symbol, value_dist(rng));
        }
    }

    std::size_t n = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(detector.score(symbols[n % symbols.size()], value_dist(rng)));
        ++n;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AnomalyScore);

// Benchmark velocity counting for a busy client
static void BM_VelocityRecord(benchmark::State& state) {
    VelocityTracker tracker(std::chrono::seconds{60});
    const ClientId client = "CLIENT_0001";

    WallTime now = std::chrono::system_clock::now();
    for (auto _ : state) {
        benchmark::DoNotOptimize(tracker.record(client, now));
        now += std::chrono::milliseconds{100};
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_VelocityRecord);
