#pragma once

#include "core/types.hpp"
#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace riskwatch {

/// Position in the transaction stream: rows are ordered by (timestamp, id)
struct FeedMarker {
    std::int64_t timestamp_ms{0};
    TransactionId id{0};

    auto operator<=>(const FeedMarker&) const = default;
};

/// Raw transaction row as held by the store (side still textual)
struct TransactionRecord {
    TransactionId id{0};
    std::int64_t timestamp_ms{0};
    std::string client_id;
    std::string symbol;
    std::string side;
    std::int64_t quantity{0};
    double price{0.0};
    double total_value{0.0};
    std::string broker_id;
    std::string market;
};

/// Validated brokerage transaction; immutable once built by the feed
struct Transaction {
    TransactionId id{0};
    WallTime timestamp;
    ClientId client_id;
    Symbol symbol;
    Side side{Side::Buy};
    std::int64_t quantity{0};
    Money price{0.0};
    Money total_value{0.0};
    std::string broker_id;
    std::string market;

    [[nodiscard]] FeedMarker marker() const {
        return FeedMarker{convert::to_epoch_ms(timestamp), id};
    }
};

/// Running exposure for one client
struct ClientExposure {
    ClientId client_id;
    Money total_exposure{0.0};
    std::int64_t position_count{0};
    RiskLevel risk_level{RiskLevel::Low};
    WallTime last_updated;
    FeedMarker last_applied;  // idempotence watermark
};

/// Running exposure for one symbol
struct SymbolExposure {
    Symbol symbol;
    Money total_exposure{0.0};
    std::int64_t transaction_count{0};
    RiskLevel risk_level{RiskLevel::Low};
    WallTime last_updated;
};

/// Risk alert as produced by the rule evaluator
struct Alert {
    std::string id;  // natural key: TYPE:entity_id:transaction_id
    WallTime timestamp;
    AlertType alert_type{AlertType::HighClientExposure};
    Severity severity{Severity::Low};
    EntityType entity_type{EntityType::Client};
    std::string entity_id;
    std::string message;
    double threshold_value{0.0};
    double current_value{0.0};
    bool acknowledged{false};
};

/// Alert as read back from the store
struct StoredAlert {
    std::int64_t row_id{0};
    Alert alert;
    std::optional<WallTime> acknowledged_at;
    std::optional<std::string> acknowledged_by;
};

/// Point-in-time rollup for dashboards
struct RiskMetricsSnapshot {
    WallTime timestamp;
    std::int64_t total_transactions{0};
    Money total_exposure{0.0};
    std::int64_t active_clients{0};
    std::int64_t active_symbols{0};
    std::int64_t high_risk_clients{0};
    std::int64_t high_risk_symbols{0};
    std::int64_t alerts_generated{0};
};

/// Builds the natural key used to make alert persistence idempotent
[[nodiscard]] inline std::string make_alert_id(AlertType type,
                                               const std::string& entity_id,
                                               TransactionId transaction_id) {
    return std::string(to_string(type)) + ":" + entity_id + ":" +
           std::to_string(transaction_id);
}

}  // namespace riskwatch
