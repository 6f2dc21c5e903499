#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace riskwatch {

// Monetary amounts in account currency
using Money = double;

// Wall clock time; transaction and alert timestamps
using WallTime = std::chrono::system_clock::time_point;

// High-resolution timestamp for internal rate limiting
using Timestamp = std::chrono::steady_clock::time_point;

// Store-assigned transaction identifier
using TransactionId = std::int64_t;

using ClientId = std::string;
using Symbol = std::string;

/// Trade direction
enum class Side {
    Buy,
    Sell
};

/// Ordinal exposure classification; ordering is meaningful
enum class RiskLevel {
    Low,
    Medium,
    High,
    Critical
};

/// Alert severity; ordering is meaningful (escalation compares severities)
enum class Severity {
    Low,
    Medium,
    High,
    Critical
};

enum class AlertType {
    HighClientExposure,
    HighSymbolExposure,
    HighTransactionVelocity,
    AnomalyDetected,
    RuleEvaluationFailure
};

enum class EntityType {
    Client,
    Symbol,
    System
};

[[nodiscard]] constexpr std::string_view to_string(Side side) noexcept {
    switch (side) {
        case Side::Buy:  return "BUY";
        case Side::Sell: return "SELL";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(RiskLevel level) noexcept {
    switch (level) {
        case RiskLevel::Low:      return "LOW";
        case RiskLevel::Medium:   return "MEDIUM";
        case RiskLevel::High:     return "HIGH";
        case RiskLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:      return "LOW";
        case Severity::Medium:   return "MEDIUM";
        case Severity::High:     return "HIGH";
        case Severity::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(AlertType type) noexcept {
    switch (type) {
        case AlertType::HighClientExposure:      return "HIGH_CLIENT_EXPOSURE";
        case AlertType::HighSymbolExposure:      return "HIGH_SYMBOL_EXPOSURE";
        case AlertType::HighTransactionVelocity: return "HIGH_TRANSACTION_VELOCITY";
        case AlertType::AnomalyDetected:         return "ANOMALY_DETECTED";
        case AlertType::RuleEvaluationFailure:   return "RULE_EVALUATION_FAILURE";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(EntityType type) noexcept {
    switch (type) {
        case EntityType::Client: return "CLIENT";
        case EntityType::Symbol: return "SYMBOL";
        case EntityType::System: return "SYSTEM";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::optional<Side> parse_side(std::string_view s) noexcept {
    if (s == "BUY") return Side::Buy;
    if (s == "SELL") return Side::Sell;
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<RiskLevel> parse_risk_level(std::string_view s) noexcept {
    if (s == "LOW") return RiskLevel::Low;
    if (s == "MEDIUM") return RiskLevel::Medium;
    if (s == "HIGH") return RiskLevel::High;
    if (s == "CRITICAL") return RiskLevel::Critical;
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<Severity> parse_severity(std::string_view s) noexcept {
    if (s == "LOW") return Severity::Low;
    if (s == "MEDIUM") return Severity::Medium;
    if (s == "HIGH") return Severity::High;
    if (s == "CRITICAL") return Severity::Critical;
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<AlertType> parse_alert_type(std::string_view s) noexcept {
    if (s == "HIGH_CLIENT_EXPOSURE") return AlertType::HighClientExposure;
    if (s == "HIGH_SYMBOL_EXPOSURE") return AlertType::HighSymbolExposure;
    if (s == "HIGH_TRANSACTION_VELOCITY") return AlertType::HighTransactionVelocity;
    if (s == "ANOMALY_DETECTED") return AlertType::AnomalyDetected;
    if (s == "RULE_EVALUATION_FAILURE") return AlertType::RuleEvaluationFailure;
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<EntityType> parse_entity_type(std::string_view s) noexcept {
    if (s == "CLIENT") return EntityType::Client;
    if (s == "SYMBOL") return EntityType::Symbol;
    if (s == "SYSTEM") return EntityType::System;
    return std::nullopt;
}

/// Exposure levels map one-to-one onto alert severities
[[nodiscard]] constexpr Severity to_severity(RiskLevel level) noexcept {
    return static_cast<Severity>(static_cast<int>(level));
}

// Conversion utilities
namespace convert {

[[nodiscard]] inline std::int64_t to_epoch_ms(WallTime t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

[[nodiscard]] inline WallTime from_epoch_ms(std::int64_t ms) {
    return WallTime{std::chrono::milliseconds{ms}};
}

}  // namespace convert

}  // namespace riskwatch
