#pragma once

#include "core/records.hpp"
#include "core/status.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace riskwatch::storage {

/// Optional filters for listing stored alerts; newest first
struct AlertFilter {
    std::optional<bool> acknowledged;
    std::optional<Severity> severity;
    std::optional<EntityType> entity_type;
    std::optional<WallTime> since;
    std::size_t limit = 100;
};

/// Alert counts; the breakdowns cover unacknowledged alerts only
struct AlertSummary {
    std::int64_t total{0};
    std::int64_t unacknowledged{0};
    std::map<std::string, std::int64_t> by_severity;
    std::map<std::string, std::int64_t> by_type;
};

/// Everything one poll cycle makes durable
struct BatchCommit {
    std::vector<ClientExposure> clients;
    std::vector<SymbolExposure> symbols;
    std::vector<Alert> alerts;          // alerts not stored yet
    std::optional<FeedMarker> cursor;   // new checkpoint, if it moved

    [[nodiscard]] bool empty() const noexcept {
        return clients.empty() && symbols.empty() && alerts.empty() && !cursor;
    }
};

/// Persistence consumed by the engine and the alert-management CLI
/// Every operation reports store failures as TransientIO or Internal errors
class RiskStore {
public:
    virtual ~RiskStore() = default;

    /// Transactions strictly after marker, ordered by (timestamp, id)
    [[nodiscard]] virtual Result<std::vector<TransactionRecord>>
    read_transactions_since(const FeedMarker& marker, std::size_t limit) = 0;

    [[nodiscard]] virtual Status upsert_client_exposure(const ClientExposure& exposure) = 0;
    [[nodiscard]] virtual Status upsert_symbol_exposure(const SymbolExposure& exposure) = 0;

    /// Write a cycle's exposures, alerts and checkpoint as one unit
    /// On error none of it is stored
    [[nodiscard]] virtual Status commit_batch(const BatchCommit& commit) = 0;

    /// Insert an alert; a second insert with the same alert id is a no-op
    /// @return Row id of the stored alert
    [[nodiscard]] virtual Result<std::int64_t> insert_alert(const Alert& alert) = 0;

    [[nodiscard]] virtual Status insert_metrics_snapshot(const RiskMetricsSnapshot& snapshot) = 0;

    /// Threshold values configured in the store, keyed by name
    [[nodiscard]] virtual Result<std::map<std::string, double>> read_thresholds_config() = 0;

    [[nodiscard]] virtual Result<std::optional<FeedMarker>> load_cursor() = 0;
    [[nodiscard]] virtual Status save_cursor(const FeedMarker& marker) = 0;

    [[nodiscard]] virtual Result<std::vector<ClientExposure>> list_client_exposures() = 0;
    [[nodiscard]] virtual Result<std::vector<SymbolExposure>> list_symbol_exposures() = 0;

    [[nodiscard]] virtual Result<std::vector<StoredAlert>> list_alerts(const AlertFilter& filter) = 0;

    /// Most recent snapshots first
    [[nodiscard]] virtual Result<std::vector<RiskMetricsSnapshot>>
    list_metrics_snapshots(std::size_t limit) = 0;

    [[nodiscard]] virtual Result<AlertSummary> alert_summary() = 0;

    /// @return false if no alert has that row id
    [[nodiscard]] virtual Result<bool> acknowledge_alert(std::int64_t row_id,
                                                         const std::string& acknowledged_by) = 0;

    /// Acknowledge several alerts together
    /// @return Row ids that matched no alert
    [[nodiscard]] virtual Result<std::vector<std::int64_t>>
    acknowledge_alerts(const std::vector<std::int64_t>& row_ids,
                       const std::string& acknowledged_by) = 0;

    /// Delete acknowledged alerts raised before cutoff
    /// @return Number of alerts deleted
    [[nodiscard]] virtual Result<std::int64_t> delete_acknowledged_alerts(WallTime cutoff) = 0;
};

}  // namespace riskwatch::storage
