#include <benchmark/benchmark.h>
#include "risk/exposure_aggregator.hpp"
#include <random>
#include <string>
#include <vector>

using namespace riskwatch;

namespace {

std::vector<Transaction> make_transactions(std::size_t count, std::size_t clients,
                                           std::size_t symbols) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<std::size_t> client_dist(0, clients - 1);
    std::uniform_int_distribution<std::size_t> symbol_dist(0, symbols - 1);
    std::uniform_int_distribution<std::int64_t> qty_dist(1, 1000);
    std::uniform_real_distribution<double> price_dist(10.0, 500.0);

    auto start = std::chrono::system_clock::now();
    std::vector<Transaction> result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        Transaction txn;
        txn.id = static_cast<TransactionId>(i + 1);
        txn.timestamp = start + std::chrono::milliseconds{static_cast<std::int64_t>(i)};
        txn.client_id = "CLIENT_" + std::to_string(client_dist(rng));
        txn.symbol = "SYM" + std::to_string(symbol_dist(rng));
        txn.side = Side::Buy;
        txn.quantity = qty_dist(rng);
        txn.price = price_dist(rng);
        txn.total_value = static_cast<double>(txn.quantity) * txn.price;
        result.push_back(std::move(txn));
    }
    return result;
}

}  // namespace

// Benchmark applying fresh transactions across many clients
static void BM_ExposureApply(benchmark::State& state) {
    auto clients = static_cast<std::size_t>(state.range(0));
    auto transactions = make_transactions(100'000, clients, 50);

    for (auto _ : state) {
        state.PauseTiming();
        ExposureAggregator aggregator(Config::Thresholds{});
        state.ResumeTiming();

        for (const auto& txn : transactions) {
            benchmark::DoNotOptimize(aggregator.apply(txn));
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(transactions.size()));
}
BENCHMARK(BM_ExposureApply)->Arg(10)->Arg(1000)->Arg(10000);

// Benchmark replayed transactions (watermark rejection path)
static void BM_ExposureReplay(benchmark::State& state) {
    auto transactions = make_transactions(10'000, 100, 50);
    ExposureAggregator aggregator(Config::Thresholds{});
    for (const auto& txn : transactions) {
        (void)aggregator.apply(txn);
    }

    std::size_t n = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(aggregator.apply(transactions[n % transactions.size()]));
        ++n;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ExposureReplay);

// Benchmark the metrics rollup over all entities
static void BM_ExposureSummary(benchmark::State& state) {
    auto clients = static_cast<std::size_t>(state.range(0));
    auto transactions = make_transactions(clients * 10, clients, 500);
    ExposureAggregator aggregator(Config::Thresholds{});
    for (const auto& txn : transactions) {
        (void)aggregator.apply(txn);
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(aggregator.summary());
    }
}
BENCHMARK(BM_ExposureSummary)->Range(100, 10000);
