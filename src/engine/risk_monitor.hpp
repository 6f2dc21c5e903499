#pragma once

#include "alert/alert_sink.hpp"
#include "core/config.hpp"
#include "engine/backoff_strategy.hpp"
#include "engine/batch_pipeline.hpp"
#include "engine/metrics_snapshotter.hpp"
#include "engine/risk_engine.hpp"
#include "feed/transaction_feed.hpp"
#include "notify/notifier.hpp"
#include "output/console_logger.hpp"
#include "output/websocket_server.hpp"
#include "storage/risk_store.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <memory>
#include <mutex>

namespace riskwatch {

/// Outcome of one poll cycle
struct CycleReport {
    std::size_t fetched{0};   // rows read from the store
    std::size_t rejected{0};  // malformed rows skipped
    BatchReport batch;
    bool full{false};         // more rows are probably waiting
    FeedMarker cursor;        // checkpointed position
};

/// The risk monitoring service
/// Owns the components, the poll and snapshot timers, and shutdown handling
class RiskMonitor {
public:
    /// @param config Application configuration (thresholds may be overridden from the store)
    /// @param store Persistence (must outlive the monitor)
    RiskMonitor(Config config, storage::RiskStore& store);

    ~RiskMonitor();

    RiskMonitor(const RiskMonitor&) = delete;
    RiskMonitor& operator=(const RiskMonitor&) = delete;

    /// Apply stored thresholds, validate, build components and restore state
    /// A ConfigError here is fatal; other errors come from the store
    [[nodiscard]] Status initialize();

    /// Run until shutdown is requested (blocks)
    void run();

    /// Request graceful shutdown (thread-safe)
    void request_shutdown();

    /// Check if shutdown was requested
    [[nodiscard]] bool shutdown_requested() const noexcept;

    /// Poll once, process the batch, then commit exposures, pending alerts
    /// and the checkpoint in one store transaction
    /// On error nothing from the batch is stored and the cursor is left where it was
    [[nodiscard]] Result<CycleReport> run_cycle();

    /// Store and broadcast a metrics snapshot
    [[nodiscard]] Result<RiskMetricsSnapshot> publish_snapshot();

    /// Flush alerts, final snapshot, drain notifications, stop outputs
    void finish();

    [[nodiscard]] const Config& config() const noexcept {
        return config_;
    }

    [[nodiscard]] FeedMarker cursor() const;

    [[nodiscard]] RiskEngine& engine() noexcept {
        return *engine_;
    }

    [[nodiscard]] AlertSink& sink() noexcept {
        return *sink_;
    }

    [[nodiscard]] MetricsSnapshotter& snapshotter() noexcept {
        return *snapshotter_;
    }

private:
    [[nodiscard]] Status build_notifier();
    [[nodiscard]] Status restore_state();
    [[nodiscard]] storage::BatchCommit collect_exposures(const BatchReport& report) const;
    void wire_outputs();

    void schedule_poll(std::chrono::milliseconds delay);
    void on_poll_timer(boost::system::error_code ec);
    void schedule_snapshot();
    void on_snapshot_timer(boost::system::error_code ec);

    Config config_;
    storage::RiskStore& store_;

    // Components, built by initialize()
    std::unique_ptr<notify::Notifier> notifier_;
    std::unique_ptr<AlertSink> sink_;
    std::unique_ptr<RiskEngine> engine_;
    std::unique_ptr<BatchPipeline> pipeline_;
    std::unique_ptr<TransactionFeed> feed_;
    std::unique_ptr<MetricsSnapshotter> snapshotter_;
    std::unique_ptr<output::ConsoleLogger> console_;
    std::unique_ptr<output::WebSocketServer> ws_server_;

    // Scheduling
    boost::asio::io_context ioc_;
    boost::asio::strand<boost::asio::io_context::executor_type> poll_strand_;
    boost::asio::strand<boost::asio::io_context::executor_type> snapshot_strand_;
    boost::asio::steady_timer poll_timer_;
    boost::asio::steady_timer snapshot_timer_;
    std::unique_ptr<boost::asio::signal_set> signals_;
    BackoffStrategy backoff_;

    mutable std::mutex cursor_mutex_;
    FeedMarker cursor_;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> finished_{false};
};

}  // namespace riskwatch
