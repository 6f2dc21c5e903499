#include "risk/rule_evaluator.hpp"
#include "output/alert_text.hpp"
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>

namespace riskwatch {

namespace {

// Only an upward move into HIGH or CRITICAL alerts
bool entered_high_band(RiskLevel previous, RiskLevel current) {
    return current >= RiskLevel::High && previous < current;
}

std::string exposure_message(const std::string& label, const std::string& id,
                             double exposure, double threshold) {
    std::ostringstream oss;
    oss << label << " " << id << " exposure " << output::format_money(exposure);
    if (exposure >= threshold) {
        oss << " exceeds threshold " << output::format_money(threshold);
    } else {
        oss << " at " << std::fixed << std::setprecision(0)
            << (threshold > 0.0 ? exposure / threshold * 100.0 : 0.0)
            << "% of threshold " << output::format_money(threshold);
    }
    return oss.str();
}

}  // namespace

RuleEvaluator::RuleEvaluator(const Config::Thresholds& thresholds)
    : thresholds_(thresholds)
{}

std::vector<Alert> RuleEvaluator::evaluate(const RuleInputs& inputs) const {
    using Check = std::optional<Alert> (RuleEvaluator::*)(const RuleInputs&) const;
    struct Family {
        const char* name;
        Check check;
    };
    static constexpr Family families[] = {
        {"client_exposure", &RuleEvaluator::check_client_exposure},
        {"symbol_exposure", &RuleEvaluator::check_symbol_exposure},
        {"velocity", &RuleEvaluator::check_velocity},
        {"anomaly", &RuleEvaluator::check_anomaly},
    };

    std::vector<Alert> alerts;
    for (const auto& family : families) {
        try {
            if (auto alert = (this->*family.check)(inputs)) {
                alerts.push_back(std::move(*alert));
            }
        } catch (const std::exception& e) {
            alerts.push_back(make_failure_alert(family.name, inputs.txn, e.what()));
        }
    }
    return alerts;
}

Severity RuleEvaluator::velocity_severity(std::size_t count, std::size_t threshold) noexcept {
    return count <= 2 * threshold ? Severity::Medium : Severity::High;
}

Severity RuleEvaluator::anomaly_severity(double z_score) noexcept {
    return std::abs(z_score) < 5.0 ? Severity::High : Severity::Critical;
}

Alert RuleEvaluator::make_failure_alert(const std::string& rule,
                                        const Transaction& txn,
                                        const std::string& what) {
    std::string entity = rule + "_rule";
    Alert alert;
    alert.id = make_alert_id(AlertType::RuleEvaluationFailure, entity, txn.id);
    alert.timestamp = txn.timestamp;
    alert.alert_type = AlertType::RuleEvaluationFailure;
    alert.severity = Severity::Critical;
    alert.entity_type = EntityType::System;
    alert.entity_id = entity;
    alert.message = "Rule " + rule + " failed on transaction " +
                    std::to_string(txn.id) + ": " + what;
    return alert;
}

std::optional<Alert> RuleEvaluator::check_client_exposure(const RuleInputs& inputs) const {
    const ClientExposure& client = inputs.exposure.client;
    if (!entered_high_band(inputs.exposure.client_previous, client.risk_level)) {
        return std::nullopt;
    }

    double threshold = thresholds_.client_threshold(client.client_id);
    Alert alert;
    alert.id = make_alert_id(AlertType::HighClientExposure, client.client_id, inputs.txn.id);
    alert.timestamp = inputs.txn.timestamp;
    alert.alert_type = AlertType::HighClientExposure;
    alert.severity = to_severity(client.risk_level);
    alert.entity_type = EntityType::Client;
    alert.entity_id = client.client_id;
    alert.message = exposure_message("Client", client.client_id, client.total_exposure, threshold);
    alert.threshold_value = threshold;
    alert.current_value = client.total_exposure;
    return alert;
}

std::optional<Alert> RuleEvaluator::check_symbol_exposure(const RuleInputs& inputs) const {
    const SymbolExposure& symbol = inputs.exposure.symbol;
    if (!entered_high_band(inputs.exposure.symbol_previous, symbol.risk_level)) {
        return std::nullopt;
    }

    double threshold = thresholds_.symbol_threshold(symbol.symbol);
    Alert alert;
    alert.id = make_alert_id(AlertType::HighSymbolExposure, symbol.symbol, inputs.txn.id);
    alert.timestamp = inputs.txn.timestamp;
    alert.alert_type = AlertType::HighSymbolExposure;
    alert.severity = to_severity(symbol.risk_level);
    alert.entity_type = EntityType::Symbol;
    alert.entity_id = symbol.symbol;
    alert.message = exposure_message("Symbol", symbol.symbol, symbol.total_exposure, threshold);
    alert.threshold_value = threshold;
    alert.current_value = symbol.total_exposure;
    return alert;
}

std::optional<Alert> RuleEvaluator::check_velocity(const RuleInputs& inputs) const {
    std::size_t threshold = thresholds_.velocity;
    if (inputs.velocity_count <= threshold) {
        return std::nullopt;
    }

    const ClientId& client_id = inputs.txn.client_id;
    std::ostringstream message;
    message << "CLIENT " << client_id << " has " << inputs.velocity_count
            << " transactions in last " << thresholds_.velocity_window.count()
            << "s (threshold: " << threshold << ")";

    Alert alert;
    alert.id = make_alert_id(AlertType::HighTransactionVelocity, client_id, inputs.txn.id);
    alert.timestamp = inputs.txn.timestamp;
    alert.alert_type = AlertType::HighTransactionVelocity;
    alert.severity = velocity_severity(inputs.velocity_count, threshold);
    alert.entity_type = EntityType::Client;
    alert.entity_id = client_id;
    alert.message = message.str();
    alert.threshold_value = static_cast<double>(threshold);
    alert.current_value = static_cast<double>(inputs.velocity_count);
    return alert;
}

std::optional<Alert> RuleEvaluator::check_anomaly(const RuleInputs& inputs) const {
    if (!inputs.anomaly || std::abs(inputs.anomaly->z_score) <= thresholds_.anomaly_stddev) {
        return std::nullopt;
    }

    const AnomalyScore& score = *inputs.anomaly;
    const Transaction& txn = inputs.txn;

    std::ostringstream message;
    message << "Anomalous transaction value " << output::format_money(txn.total_value)
            << " detected (z-score: " << std::fixed << std::setprecision(2) << score.z_score
            << ", mean: " << output::format_money(score.mean)
            << ", std: " << output::format_money(score.std_dev) << ")";

    double bound = score.z_score >= 0.0 ? score.mean + thresholds_.anomaly_stddev * score.std_dev
                                        : score.mean - thresholds_.anomaly_stddev * score.std_dev;

    Alert alert;
    alert.id = make_alert_id(AlertType::AnomalyDetected, txn.symbol, txn.id);
    alert.timestamp = txn.timestamp;
    alert.alert_type = AlertType::AnomalyDetected;
    alert.severity = anomaly_severity(score.z_score);
    alert.entity_type = EntityType::Symbol;
    alert.entity_id = txn.symbol;
    alert.message = message.str();
    alert.threshold_value = bound;
    alert.current_value = txn.total_value;
    return alert;
}

}  // namespace riskwatch
