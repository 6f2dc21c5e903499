#include "engine/metrics_snapshotter.hpp"

namespace riskwatch {

MetricsSnapshotter::MetricsSnapshotter(const ExposureAggregator& aggregator,
                                       storage::RiskStore& store,
                                       const AlertSink& sink)
    : aggregator_(aggregator)
    , store_(store)
    , sink_(sink)
{}

void MetricsSnapshotter::add_listener(SnapshotListener listener) {
    listeners_.push_back(std::move(listener));
}

RiskMetricsSnapshot MetricsSnapshotter::take(WallTime now) const {
    ExposureSummary summary = aggregator_.summary();

    return RiskMetricsSnapshot{
        .timestamp = now,
        .total_transactions = summary.total_transactions,
        .total_exposure = summary.total_exposure,
        .active_clients = summary.active_clients,
        .active_symbols = summary.active_symbols,
        .high_risk_clients = summary.high_risk_clients,
        .high_risk_symbols = summary.high_risk_symbols,
        .alerts_generated = sink_.emitted()
    };
}

Result<RiskMetricsSnapshot> MetricsSnapshotter::publish(WallTime now) {
    RiskMetricsSnapshot snapshot = take(now);

    auto stored = store_.insert_metrics_snapshot(snapshot);
    if (stored.is_err()) {
        return Result<RiskMetricsSnapshot>::Err(stored.error());
    }

    {
        std::lock_guard<std::mutex> lock(latest_mutex_);
        latest_ = snapshot;
    }

    for (const auto& listener : listeners_) {
        listener(snapshot);
    }

    return Result<RiskMetricsSnapshot>::Ok(snapshot);
}

std::optional<RiskMetricsSnapshot> MetricsSnapshotter::latest() const {
    std::lock_guard<std::mutex> lock(latest_mutex_);
    return latest_;
}

}  // namespace riskwatch
