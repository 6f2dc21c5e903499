#pragma once

#include "core/records.hpp"
#include "engine/risk_engine.hpp"
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <set>
#include <vector>

namespace riskwatch {

/// Summary of one executed batch
struct BatchReport {
    std::size_t processed{0};   // transactions applied
    std::size_t duplicates{0};  // transactions already applied earlier
    std::size_t failed{0};      // transactions that threw inside the engine
    std::size_t alerts{0};      // alerts admitted
    std::set<ClientId> touched_clients;
    std::set<Symbol> touched_symbols;
};

/// Runs a feed batch through the engine with bounded parallelism
///
/// Each transaction waits for the previous transaction in the batch with the
/// same client and the previous one with the same symbol, so every key sees
/// its transactions in feed order while unrelated keys run in parallel.
class BatchPipeline {
public:
    /// @param engine Engine to drive (must outlive the pipeline)
    /// @param worker_threads Size of the worker pool
    BatchPipeline(RiskEngine& engine, std::size_t worker_threads);
    ~BatchPipeline();

    BatchPipeline(const BatchPipeline&) = delete;
    BatchPipeline& operator=(const BatchPipeline&) = delete;

    /// Process batch and return once every transaction has completed
    [[nodiscard]] BatchReport run(const std::vector<Transaction>& batch);

    /// Join the worker pool; run() must not be called afterwards
    void stop();

private:
    RiskEngine& engine_;
    boost::asio::thread_pool pool_;
};

}  // namespace riskwatch
