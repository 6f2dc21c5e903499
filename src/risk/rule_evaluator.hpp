#pragma once

#include "core/config.hpp"
#include "core/records.hpp"
#include "risk/anomaly_detector.hpp"
#include "risk/exposure_aggregator.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace riskwatch {

/// Everything the rules need to judge one transaction
struct RuleInputs {
    const Transaction& txn;
    const ExposureUpdate& exposure;
    std::size_t velocity_count;
    std::optional<AnomalyScore> anomaly;
};

/// Turns per-transaction observations into candidate alerts
///
/// Rule families run in a fixed order: client exposure, symbol exposure,
/// velocity, anomaly. A family that throws produces a
/// RULE_EVALUATION_FAILURE alert and the remaining families still run.
class RuleEvaluator {
public:
    explicit RuleEvaluator(const Config::Thresholds& thresholds);
    virtual ~RuleEvaluator() = default;

    RuleEvaluator(const RuleEvaluator&) = delete;
    RuleEvaluator& operator=(const RuleEvaluator&) = delete;

    /// Candidate alerts in rule order (before deduplication)
    [[nodiscard]] virtual std::vector<Alert> evaluate(const RuleInputs& inputs) const;

    /// MEDIUM up to twice the threshold, HIGH beyond
    [[nodiscard]] static Severity velocity_severity(std::size_t count, std::size_t threshold) noexcept;

    /// HIGH below 5 sigma, CRITICAL from 5 sigma
    [[nodiscard]] static Severity anomaly_severity(double z_score) noexcept;

    /// SYSTEM alert describing a rule family that threw
    [[nodiscard]] static Alert make_failure_alert(const std::string& rule,
                                                  const Transaction& txn,
                                                  const std::string& what);

protected:
    [[nodiscard]] virtual std::optional<Alert> check_client_exposure(const RuleInputs& inputs) const;
    [[nodiscard]] virtual std::optional<Alert> check_symbol_exposure(const RuleInputs& inputs) const;
    [[nodiscard]] virtual std::optional<Alert> check_velocity(const RuleInputs& inputs) const;
    [[nodiscard]] virtual std::optional<Alert> check_anomaly(const RuleInputs& inputs) const;

private:
    Config::Thresholds thresholds_;
};

}  // namespace riskwatch
