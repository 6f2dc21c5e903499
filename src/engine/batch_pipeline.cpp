#include "engine/batch_pipeline.hpp"
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace riskwatch {

namespace {

struct NodeResult {
    bool applied{false};
    bool failed{false};
    std::size_t alerts{0};
};

/// Dependency graph and completion tracking for one batch
struct BatchGraph {
    explicit BatchGraph(std::size_t n)
        : successors(n)
        , remaining(std::make_unique<std::atomic<int>[]>(n))
        , results(n)
    {}

    std::vector<std::vector<std::size_t>> successors;
    std::unique_ptr<std::atomic<int>[]> remaining;
    std::vector<NodeResult> results;

    std::mutex done_mutex;
    std::condition_variable done_cv;
    std::size_t done{0};
};

}  // namespace

BatchPipeline::BatchPipeline(RiskEngine& engine, std::size_t worker_threads)
    : engine_(engine)
    , pool_(worker_threads == 0 ? 1 : worker_threads)
{}

BatchPipeline::~BatchPipeline() {
    stop();
}

void BatchPipeline::stop() {
    pool_.join();
}

BatchReport BatchPipeline::run(const std::vector<Transaction>& batch) {
    BatchReport report;
    const std::size_t n = batch.size();
    if (n == 0) {
        return report;
    }

    BatchGraph graph(n);

    std::unordered_map<ClientId, std::size_t> last_client;
    std::unordered_map<Symbol, std::size_t> last_symbol;
    for (std::size_t i = 0; i < n; ++i) {
        int deps = 0;

        auto client_it = last_client.find(batch[i].client_id);
        std::size_t client_prev = n;
        if (client_it != last_client.end()) {
            client_prev = client_it->second;
            graph.successors[client_prev].push_back(i);
            ++deps;
        }

        auto symbol_it = last_symbol.find(batch[i].symbol);
        if (symbol_it != last_symbol.end() && symbol_it->second != client_prev) {
            graph.successors[symbol_it->second].push_back(i);
            ++deps;
        }

        graph.remaining[i].store(deps, std::memory_order_relaxed);
        last_client[batch[i].client_id] = i;
        last_symbol[batch[i].symbol] = i;
    }

    // Self-referencing task: runs node i, then releases its successors
    std::function<void(std::size_t)> run_node = [&](std::size_t i) {
        NodeResult& result = graph.results[i];
        std::optional<std::string> failure;
        try {
            auto outcome = engine_.process(batch[i]);
            result.applied = outcome.applied;
            result.alerts = outcome.alerts.size();
        } catch (const std::exception& e) {
            failure = e.what();
        }

        if (failure) {
            result.failed = true;
            spdlog::error("Transaction {} failed in the engine: {}", batch[i].id, *failure);
            try {
                if (engine_.report_failure(batch[i], *failure)) {
                    ++result.alerts;
                }
            } catch (const std::exception& e) {
                spdlog::critical("No failure alert for transaction {}: {}", batch[i].id, e.what());
            }
        }

        for (std::size_t next : graph.successors[i]) {
            if (graph.remaining[next].fetch_sub(1, std::memory_order_acq_rel) == 1) {
                boost::asio::post(pool_, [&run_node, next]() { run_node(next); });
            }
        }

        std::lock_guard<std::mutex> lock(graph.done_mutex);
        if (++graph.done == n) {
            graph.done_cv.notify_one();
        }
    };

    for (std::size_t i = 0; i < n; ++i) {
        if (graph.remaining[i].load(std::memory_order_relaxed) == 0) {
            boost::asio::post(pool_, [&run_node, i]() { run_node(i); });
        }
    }

    {
        std::unique_lock<std::mutex> lock(graph.done_mutex);
        graph.done_cv.wait(lock, [&graph, n]() { return graph.done == n; });
    }

    for (std::size_t i = 0; i < n; ++i) {
        const NodeResult& result = graph.results[i];
        if (result.failed) {
            ++report.failed;
        } else if (result.applied) {
            ++report.processed;
        } else {
            ++report.duplicates;
        }
        // Every key is re-persisted: replayed ones may have been applied in
        // memory by a cycle that failed to store them, failed ones may have
        // been applied before the engine threw
        report.touched_clients.insert(batch[i].client_id);
        report.touched_symbols.insert(batch[i].symbol);
        report.alerts += result.alerts;
    }

    return report;
}

}  // namespace riskwatch
