#include <benchmark/benchmark.h>
#include "alert/alert_sink.hpp"
#include "engine/batch_pipeline.hpp"
#include "engine/risk_engine.hpp"
#include "storage/sqlite_store.hpp"
#include <random>
#include <string>
#include <vector>

using namespace riskwatch;

// Benchmark one feed batch through the dependency-ordered worker pool
static void BM_PipelineBatch(benchmark::State& state) {
    auto workers = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t kBatchSize = 1000;

    auto opened = storage::SqliteStore::open(":memory:");
    if (opened.is_err()) {
        state.SkipWithError(opened.error().describe().c_str());
        return;
    }
    auto store = std::move(opened).take_value();

    // Thresholds high enough that the benchmark measures evaluation, not alert I/O
    Config config = Config::defaults();
    config.thresholds.client_exposure = 1e15;
    config.thresholds.symbol_exposure = 1e15;
    config.thresholds.velocity = 1'000'000;
    config.thresholds.anomaly_stddev = 1e9;

    AlertSink sink(*store, nullptr);
    RiskEngine engine(config, sink);
    BatchPipeline pipeline(engine, workers);

    std::mt19937 rng(42);
    std::uniform_int_distribution<int> client_dist(0, 199);
    std::uniform_int_distribution<int> symbol_dist(0, 49);
    auto start = std::chrono::system_clock::now();

    TransactionId next_id = 1;
    std::vector<Transaction> batch(kBatchSize);
    for (auto _ : state) {
        state.PauseTiming();
        for (auto& txn : batch) {
            txn.id = next_id;
            txn.timestamp = start + std::chrono::milliseconds{next_id};
            txn.client_id = "CLIENT_" + std::to_string(client_dist(rng));
            txn.symbol = "SYM" + std::to_string(symbol_dist(rng));
            txn.side = Side::Buy;
            txn.quantity = 10;
            txn.price = 100.0;
            txn.total_value = 1000.0;
            ++next_id;
        }
        state.ResumeTiming();

        benchmark::DoNotOptimize(pipeline.run(batch));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(kBatchSize));
}
BENCHMARK(BM_PipelineBatch)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->UseRealTime();
