#pragma once

#include "storage/risk_store.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace riskwatch::storage {

/// RiskStore backed by a single SQLite database file
///
/// Creates its tables on open. One connection is shared by all callers and
/// serialized by a mutex; busy, locked and I/O conditions surface as
/// TransientIO errors so the caller can retry with its marker unchanged.
class SqliteStore final : public RiskStore {
public:
    /// Open (or create) the database and its schema
    /// @param path File path, or ":memory:" for a private in-memory database
    /// @param busy_timeout How long SQLite waits on a locked database
    [[nodiscard]] static Result<std::unique_ptr<SqliteStore>> open(
        const std::string& path,
        std::chrono::milliseconds busy_timeout = std::chrono::milliseconds{5000});

    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    [[nodiscard]] Result<std::vector<TransactionRecord>>
    read_transactions_since(const FeedMarker& marker, std::size_t limit) override;

    [[nodiscard]] Status upsert_client_exposure(const ClientExposure& exposure) override;
    [[nodiscard]] Status upsert_symbol_exposure(const SymbolExposure& exposure) override;
    [[nodiscard]] Status commit_batch(const BatchCommit& commit) override;
    [[nodiscard]] Result<std::int64_t> insert_alert(const Alert& alert) override;
    [[nodiscard]] Status insert_metrics_snapshot(const RiskMetricsSnapshot& snapshot) override;
    [[nodiscard]] Result<std::map<std::string, double>> read_thresholds_config() override;
    [[nodiscard]] Result<std::optional<FeedMarker>> load_cursor() override;
    [[nodiscard]] Status save_cursor(const FeedMarker& marker) override;
    [[nodiscard]] Result<std::vector<ClientExposure>> list_client_exposures() override;
    [[nodiscard]] Result<std::vector<SymbolExposure>> list_symbol_exposures() override;
    [[nodiscard]] Result<std::vector<StoredAlert>> list_alerts(const AlertFilter& filter) override;
    [[nodiscard]] Result<std::vector<RiskMetricsSnapshot>>
    list_metrics_snapshots(std::size_t limit) override;
    [[nodiscard]] Result<AlertSummary> alert_summary() override;
    [[nodiscard]] Result<bool> acknowledge_alert(std::int64_t row_id,
                                                 const std::string& acknowledged_by) override;
    [[nodiscard]] Result<std::vector<std::int64_t>>
    acknowledge_alerts(const std::vector<std::int64_t>& row_ids,
                       const std::string& acknowledged_by) override;
    [[nodiscard]] Result<std::int64_t> delete_acknowledged_alerts(WallTime cutoff) override;

    /// Append a transaction row (the generator's write path)
    /// A zero id lets SQLite assign one
    /// @return Row id of the inserted transaction
    [[nodiscard]] Result<TransactionId> insert_transaction(const TransactionRecord& record);

    /// Write one named threshold into the configuration table
    [[nodiscard]] Status set_threshold(const std::string& name, double value);

private:
    struct ConnectionCloser {
        void operator()(sqlite3* db) const noexcept;
    };

    struct StatementFinalizer {
        void operator()(sqlite3_stmt* stmt) const noexcept;
    };

    using Connection = std::unique_ptr<sqlite3, ConnectionCloser>;
    using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

    explicit SqliteStore(Connection db);

    [[nodiscard]] Status create_schema();

    // Single statements; the caller holds mutex_
    [[nodiscard]] Status write_client_exposure(const ClientExposure& exposure);
    [[nodiscard]] Status write_symbol_exposure(const SymbolExposure& exposure);
    [[nodiscard]] Result<std::int64_t> write_alert(const Alert& alert);
    [[nodiscard]] Status write_cursor(const FeedMarker& marker);
    [[nodiscard]] Result<bool> write_acknowledgement(std::int64_t row_id,
                                                     const std::string& acknowledged_by,
                                                     std::int64_t at_ms);

    /// Run body inside BEGIN IMMEDIATE ... COMMIT, rolling back on any error
    /// The caller holds mutex_
    [[nodiscard]] Status in_transaction(const std::function<Status()>& body);

    [[nodiscard]] Status exec(const char* sql);
    [[nodiscard]] Result<Statement> prepare(std::string_view sql);
    [[nodiscard]] Error error_from(int rc, std::string_view context) const;

    Connection db_;
    std::mutex mutex_;
};

}  // namespace riskwatch::storage
