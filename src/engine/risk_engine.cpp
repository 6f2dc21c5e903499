#include "engine/risk_engine.hpp"
#include <spdlog/spdlog.h>

namespace riskwatch {

RiskEngine::RiskEngine(const Config& config, AlertSink& sink,
                       std::unique_ptr<RuleEvaluator> evaluator)
    : aggregator_(config.thresholds)
    , velocity_(config.thresholds.velocity_window)
    , anomaly_(config.engine.anomaly_window,
               config.engine.anomaly_min_samples,
               config.thresholds.anomaly_stddev)
    , evaluator_(evaluator ? std::move(evaluator)
                           : std::make_unique<RuleEvaluator>(config.thresholds))
    , dedup_(config.engine.alert_cooldown)
    , sink_(sink)
{}

ProcessOutcome RiskEngine::process(const Transaction& txn) {
    ProcessOutcome outcome;

    auto update = aggregator_.apply(txn);
    if (!update) {
        duplicates_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Transaction {} already applied for {}", txn.id, txn.client_id);
        return outcome;
    }
    outcome.applied = true;
    processed_.fetch_add(1, std::memory_order_relaxed);

    std::size_t velocity_count = velocity_.record(txn.client_id, txn.timestamp);
    auto score = anomaly_.score(txn.symbol, txn.total_value);

    RuleInputs inputs{txn, *update, velocity_count, score};
    for (auto& alert : evaluator_->evaluate(inputs)) {
        if (admit(alert)) {
            outcome.alerts.push_back(std::move(alert));
        }
    }

    return outcome;
}

std::optional<Alert> RiskEngine::report_failure(const Transaction& txn, const std::string& what) {
    Alert alert = RuleEvaluator::make_failure_alert("engine", txn, what);
    if (!admit(alert)) {
        return std::nullopt;
    }
    return alert;
}

bool RiskEngine::admit(const Alert& alert) {
    if (dedup_.admit(alert) == DedupDecision::Suppressed) {
        alerts_suppressed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Suppressed {} for {} (cooldown)",
                      to_string(alert.alert_type), alert.entity_id);
        return false;
    }

    alerts_admitted_.fetch_add(1, std::memory_order_relaxed);
    // A store failure keeps the alert queued in the sink
    if (sink_.emit(alert).is_err()) {
        spdlog::debug("Alert {} queued for retry", alert.id);
    }
    return true;
}

}  // namespace riskwatch
