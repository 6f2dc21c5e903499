#pragma once

#include "core/records.hpp"
#include "core/status.hpp"
#include "notify/notifier.hpp"
#include "storage/risk_store.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace riskwatch {

/// Persists admitted alerts, then fans them out to listeners and the notifier
///
/// Persistence comes first: an alert is only announced once it is stored.
/// Alerts whose insert failed stay pending until the next batch commit
/// stores them (committed()) or flush_pending() retries them one by one.
/// A listener that throws is logged and never stops the others.
class AlertSink {
public:
    /// Called for every persisted alert (console, dashboards)
    using AlertListener = std::function<void(const Alert&)>;

    /// @param store Alert storage (must outlive the sink)
    /// @param notifier Delivery queue, or nullptr for no external channels
    AlertSink(storage::RiskStore& store, notify::Notifier* notifier);

    AlertSink(const AlertSink&) = delete;
    AlertSink& operator=(const AlertSink&) = delete;

    /// Register a listener (before processing starts)
    void add_listener(AlertListener listener);

    /// Persist and announce one alert (thread-safe)
    /// A store failure is returned and the alert is kept for flush_pending()
    [[nodiscard]] Status emit(const Alert& alert);

    /// Retry alerts whose persistence failed
    /// @return Alerts still pending afterwards
    std::size_t flush_pending();

    [[nodiscard]] std::size_t pending_count() const;

    /// Copy of the alerts still waiting for persistence, oldest first
    [[nodiscard]] std::vector<Alert> pending() const;

    /// A batch commit stored these alerts: drop them from pending and announce them
    void committed(const std::vector<Alert>& alerts);

    /// Alerts stored before this run plus alerts emitted during it
    [[nodiscard]] std::int64_t emitted() const noexcept {
        return emitted_.load(std::memory_order_relaxed);
    }

    /// Seed the emitted counter with the alerts already in the store
    void set_baseline(std::int64_t stored_alerts) noexcept {
        emitted_.store(stored_alerts, std::memory_order_relaxed);
    }

private:
    [[nodiscard]] Status persist_and_announce(const Alert& alert);
    void announce(const Alert& alert);

    storage::RiskStore& store_;
    notify::Notifier* notifier_;
    std::vector<AlertListener> listeners_;

    mutable std::mutex pending_mutex_;
    std::vector<Alert> pending_;

    std::atomic<std::int64_t> emitted_{0};
};

}  // namespace riskwatch
