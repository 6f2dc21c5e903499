#pragma once

#include "core/config.hpp"
#include "core/records.hpp"
#include "risk/keyed_store.hpp"
#include <optional>
#include <vector>

namespace riskwatch {

/// Band boundaries as fractions of an entity's exposure threshold
struct RiskBands {
    double medium = 0.5;
    double high = 0.8;
    double critical = 1.0;

    [[nodiscard]] static RiskBands from(const Config::Thresholds& thresholds) noexcept {
        return RiskBands{thresholds.medium_ratio, thresholds.high_ratio, thresholds.critical_ratio};
    }
};

/// Classify exposure against a threshold
/// LOW below medium, MEDIUM below high, HIGH below critical, CRITICAL otherwise
[[nodiscard]] RiskLevel classify_risk(double exposure, double threshold,
                                      const RiskBands& bands = RiskBands{}) noexcept;

/// Aggregates before/after one transaction was applied
struct ExposureUpdate {
    ClientExposure client;
    RiskLevel client_previous{RiskLevel::Low};
    SymbolExposure symbol;
    RiskLevel symbol_previous{RiskLevel::Low};
};

/// Totals across all aggregates, read in one pass
struct ExposureSummary {
    std::int64_t total_transactions{0};
    Money total_exposure{0.0};
    std::int64_t active_clients{0};
    std::int64_t active_symbols{0};
    std::int64_t high_risk_clients{0};
    std::int64_t high_risk_symbols{0};
};

/// Running exposure per client and per symbol
/// Sole owner of ClientExposure/SymbolExposure state; updates are incremental
class ExposureAggregator {
public:
    explicit ExposureAggregator(const Config::Thresholds& thresholds);

    ExposureAggregator(const ExposureAggregator&) = delete;
    ExposureAggregator& operator=(const ExposureAggregator&) = delete;

    /// Add a transaction to its client and symbol aggregates
    /// @return nullopt if the client already applied this or a later transaction
    [[nodiscard]] std::optional<ExposureUpdate> apply(const Transaction& txn);

    [[nodiscard]] std::optional<ClientExposure> client(const ClientId& client_id) const;
    [[nodiscard]] std::optional<SymbolExposure> symbol(const Symbol& symbol) const;

    /// Read-only copies of every aggregate
    [[nodiscard]] std::vector<ClientExposure> clients() const;
    [[nodiscard]] std::vector<SymbolExposure> symbols() const;

    [[nodiscard]] ExposureSummary summary() const;

    /// Restore persisted aggregates at startup; risk levels are recomputed
    void hydrate(const std::vector<ClientExposure>& clients,
                 const std::vector<SymbolExposure>& symbols);

    [[nodiscard]] double client_threshold(const ClientId& client_id) const;
    [[nodiscard]] double symbol_threshold(const Symbol& symbol) const;

private:
    Config::Thresholds thresholds_;
    RiskBands bands_;
    KeyedStore<ClientExposure> clients_;
    KeyedStore<SymbolExposure> symbols_;
};

}  // namespace riskwatch
