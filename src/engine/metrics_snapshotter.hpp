#pragma once

#include "alert/alert_sink.hpp"
#include "core/records.hpp"
#include "risk/exposure_aggregator.hpp"
#include "storage/risk_store.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace riskwatch {

/// Materializes RiskMetricsSnapshot rows from live aggregator state
/// Reads never mutate the aggregator
class MetricsSnapshotter {
public:
    using SnapshotListener = std::function<void(const RiskMetricsSnapshot&)>;

    MetricsSnapshotter(const ExposureAggregator& aggregator,
                       storage::RiskStore& store,
                       const AlertSink& sink);

    MetricsSnapshotter(const MetricsSnapshotter&) = delete;
    MetricsSnapshotter& operator=(const MetricsSnapshotter&) = delete;

    /// Register a listener for published snapshots (before start)
    void add_listener(SnapshotListener listener);

    /// Compute a snapshot without storing it
    [[nodiscard]] RiskMetricsSnapshot take(WallTime now) const;

    /// Compute, store and announce a snapshot
    /// Listeners only run once the snapshot is stored
    [[nodiscard]] Result<RiskMetricsSnapshot> publish(WallTime now);

    /// Last published snapshot, if any
    [[nodiscard]] std::optional<RiskMetricsSnapshot> latest() const;

private:
    const ExposureAggregator& aggregator_;
    storage::RiskStore& store_;
    const AlertSink& sink_;
    std::vector<SnapshotListener> listeners_;

    mutable std::mutex latest_mutex_;
    std::optional<RiskMetricsSnapshot> latest_;
};

}  // namespace riskwatch
