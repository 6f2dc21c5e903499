#pragma once

#include "alert/alert_sink.hpp"
#include "core/config.hpp"
#include "core/records.hpp"
#include "risk/alert_deduplicator.hpp"
#include "risk/anomaly_detector.hpp"
#include "risk/exposure_aggregator.hpp"
#include "risk/rule_evaluator.hpp"
#include "risk/velocity_tracker.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace riskwatch {

/// What processing one transaction did
struct ProcessOutcome {
    bool applied{false};        // false: already applied earlier (replay)
    std::vector<Alert> alerts;  // alerts admitted by the deduplicator
};

/// Per-transaction orchestration of the risk components
///
/// apply exposure -> record velocity -> score anomaly -> evaluate rules ->
/// deduplicate -> emit. Safe to call concurrently for transactions that do
/// not share a client or symbol; the batch pipeline guarantees that.
class RiskEngine {
public:
    /// @param config Thresholds and engine settings
    /// @param sink Destination for admitted alerts (must outlive the engine)
    /// @param evaluator Rule evaluator to use; nullptr builds the default one
    RiskEngine(const Config& config, AlertSink& sink,
               std::unique_ptr<RuleEvaluator> evaluator = nullptr);

    RiskEngine(const RiskEngine&) = delete;
    RiskEngine& operator=(const RiskEngine&) = delete;

    /// Run one validated transaction through every rule
    [[nodiscard]] ProcessOutcome process(const Transaction& txn);

    /// Raise a RULE_EVALUATION_FAILURE alert for a transaction whose
    /// processing threw
    /// @return The alert if the deduplicator admitted it
    std::optional<Alert> report_failure(const Transaction& txn, const std::string& what);

    [[nodiscard]] ExposureAggregator& aggregator() noexcept {
        return aggregator_;
    }

    [[nodiscard]] const ExposureAggregator& aggregator() const noexcept {
        return aggregator_;
    }

    [[nodiscard]] const VelocityTracker& velocity() const noexcept {
        return velocity_;
    }

    [[nodiscard]] const AnomalyDetector& anomaly() const noexcept {
        return anomaly_;
    }

    [[nodiscard]] std::uint64_t processed() const noexcept {
        return processed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t duplicates() const noexcept {
        return duplicates_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t alerts_admitted() const noexcept {
        return alerts_admitted_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t alerts_suppressed() const noexcept {
        return alerts_suppressed_.load(std::memory_order_relaxed);
    }

private:
    /// Deduplicate and emit; false if suppressed
    bool admit(const Alert& alert);

    ExposureAggregator aggregator_;
    VelocityTracker velocity_;
    AnomalyDetector anomaly_;
    std::unique_ptr<RuleEvaluator> evaluator_;
    AlertDeduplicator dedup_;
    AlertSink& sink_;

    std::atomic<std::uint64_t> processed_{0};
    std::atomic<std::uint64_t> duplicates_{0};
    std::atomic<std::uint64_t> alerts_admitted_{0};
    std::atomic<std::uint64_t> alerts_suppressed_{0};
};

}  // namespace riskwatch
