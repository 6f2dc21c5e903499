#include "storage/sqlite_store.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace riskwatch::storage {

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS transactions (
    transaction_id   INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp_ms     INTEGER NOT NULL,
    client_id        TEXT NOT NULL,
    symbol           TEXT NOT NULL,
    transaction_type TEXT NOT NULL,
    quantity         INTEGER NOT NULL,
    price            REAL NOT NULL,
    total_value      REAL NOT NULL,
    broker_id        TEXT NOT NULL DEFAULT '',
    market           TEXT NOT NULL DEFAULT ''
);
CREATE INDEX IF NOT EXISTS idx_transactions_order ON transactions(timestamp_ms, transaction_id);
CREATE INDEX IF NOT EXISTS idx_transactions_client ON transactions(client_id);
CREATE INDEX IF NOT EXISTS idx_transactions_symbol ON transactions(symbol);

CREATE TABLE IF NOT EXISTS client_exposures (
    client_id       TEXT PRIMARY KEY,
    total_exposure  REAL NOT NULL DEFAULT 0,
    position_count  INTEGER NOT NULL DEFAULT 0,
    risk_level      TEXT NOT NULL DEFAULT 'LOW'
                    CHECK (risk_level IN ('LOW', 'MEDIUM', 'HIGH', 'CRITICAL')),
    last_updated_ms INTEGER NOT NULL DEFAULT 0,
    last_txn_ts_ms  INTEGER NOT NULL DEFAULT 0,
    last_txn_id     INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_client_exposures_risk ON client_exposures(risk_level);

CREATE TABLE IF NOT EXISTS symbol_exposures (
    symbol            TEXT PRIMARY KEY,
    total_exposure    REAL NOT NULL DEFAULT 0,
    transaction_count INTEGER NOT NULL DEFAULT 0,
    risk_level        TEXT NOT NULL DEFAULT 'LOW'
                      CHECK (risk_level IN ('LOW', 'MEDIUM', 'HIGH', 'CRITICAL')),
    last_updated_ms   INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_symbol_exposures_risk ON symbol_exposures(risk_level);

CREATE TABLE IF NOT EXISTS alerts (
    alert_id           INTEGER PRIMARY KEY AUTOINCREMENT,
    alert_key          TEXT NOT NULL UNIQUE,
    timestamp_ms       INTEGER NOT NULL,
    alert_type         TEXT NOT NULL,
    severity           TEXT NOT NULL CHECK (severity IN ('LOW', 'MEDIUM', 'HIGH', 'CRITICAL')),
    entity_type        TEXT NOT NULL CHECK (entity_type IN ('CLIENT', 'SYMBOL', 'SYSTEM')),
    entity_id          TEXT NOT NULL,
    message            TEXT NOT NULL,
    threshold_value    REAL,
    current_value      REAL,
    acknowledged       INTEGER NOT NULL DEFAULT 0,
    acknowledged_at_ms INTEGER,
    acknowledged_by    TEXT
);
CREATE INDEX IF NOT EXISTS idx_alerts_timestamp ON alerts(timestamp_ms DESC);
CREATE INDEX IF NOT EXISTS idx_alerts_severity ON alerts(severity);
CREATE INDEX IF NOT EXISTS idx_alerts_acknowledged ON alerts(acknowledged);

CREATE TABLE IF NOT EXISTS risk_metrics (
    metric_id          INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp_ms       INTEGER NOT NULL,
    total_transactions INTEGER NOT NULL DEFAULT 0,
    total_exposure     REAL NOT NULL DEFAULT 0,
    active_clients     INTEGER NOT NULL DEFAULT 0,
    active_symbols     INTEGER NOT NULL DEFAULT 0,
    high_risk_clients  INTEGER NOT NULL DEFAULT 0,
    high_risk_symbols  INTEGER NOT NULL DEFAULT 0,
    alerts_generated   INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS risk_thresholds (
    name  TEXT PRIMARY KEY,
    value REAL NOT NULL
);

CREATE TABLE IF NOT EXISTS engine_cursor (
    id             INTEGER PRIMARY KEY CHECK (id = 1),
    timestamp_ms   INTEGER NOT NULL,
    transaction_id INTEGER NOT NULL
);
)SQL";

/// Binds parameters left to right, remembering the first failure
class Binder {
public:
    explicit Binder(sqlite3_stmt* stmt) : stmt_(stmt) {}

    Binder& text(const std::string& value) {
        check(sqlite3_bind_text(stmt_, ++index_, value.c_str(),
                                static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }

    Binder& integer(std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, ++index_, value));
        return *this;
    }

    Binder& real(double value) {
        check(sqlite3_bind_double(stmt_, ++index_, value));
        return *this;
    }

    Binder& null() {
        check(sqlite3_bind_null(stmt_, ++index_));
        return *this;
    }

    [[nodiscard]] int rc() const noexcept {
        return rc_;
    }

private:
    void check(int rc) {
        if (rc_ == SQLITE_OK) {
            rc_ = rc;
        }
    }

    sqlite3_stmt* stmt_;
    int index_{0};
    int rc_{SQLITE_OK};
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text != nullptr ? reinterpret_cast<const char*>(text) : std::string{};
}

bool is_transient(int rc) {
    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
        case SQLITE_FULL:
        case SQLITE_PROTOCOL:
        case SQLITE_NOMEM:
            return true;
        default:
            return false;
    }
}

StoredAlert read_alert_row(sqlite3_stmt* stmt) {
    StoredAlert stored;
    stored.row_id = sqlite3_column_int64(stmt, 0);

    Alert& alert = stored.alert;
    alert.id = column_text(stmt, 1);
    alert.timestamp = convert::from_epoch_ms(sqlite3_column_int64(stmt, 2));
    alert.alert_type = parse_alert_type(column_text(stmt, 3)).value_or(AlertType::RuleEvaluationFailure);
    alert.severity = parse_severity(column_text(stmt, 4)).value_or(Severity::Low);
    alert.entity_type = parse_entity_type(column_text(stmt, 5)).value_or(EntityType::System);
    alert.entity_id = column_text(stmt, 6);
    alert.message = column_text(stmt, 7);
    alert.threshold_value = sqlite3_column_double(stmt, 8);
    alert.current_value = sqlite3_column_double(stmt, 9);
    alert.acknowledged = sqlite3_column_int(stmt, 10) != 0;

    if (sqlite3_column_type(stmt, 11) != SQLITE_NULL) {
        stored.acknowledged_at = convert::from_epoch_ms(sqlite3_column_int64(stmt, 11));
    }
    if (sqlite3_column_type(stmt, 12) != SQLITE_NULL) {
        stored.acknowledged_by = column_text(stmt, 12);
    }
    return stored;
}

}  // namespace

void SqliteStore::ConnectionCloser::operator()(sqlite3* db) const noexcept {
    sqlite3_close_v2(db);
}

void SqliteStore::StatementFinalizer::operator()(sqlite3_stmt* stmt) const noexcept {
    sqlite3_finalize(stmt);
}

Result<std::unique_ptr<SqliteStore>> SqliteStore::open(const std::string& path,
                                                       std::chrono::milliseconds busy_timeout) {
    using R = Result<std::unique_ptr<SqliteStore>>;

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    Connection db(raw);
    if (rc != SQLITE_OK) {
        std::string msg = "Failed to open database " + path + ": " +
                          (db ? sqlite3_errmsg(db.get()) : sqlite3_errstr(rc));
        return R::Err(is_transient(rc) ? Error::transient_io(std::move(msg))
                                       : Error::internal(std::move(msg)));
    }

    sqlite3_busy_timeout(db.get(), static_cast<int>(busy_timeout.count()));

    std::unique_ptr<SqliteStore> store(new SqliteStore(std::move(db)));

    auto pragmas = store->exec("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;");
    if (pragmas.is_err()) {
        return R::Err(pragmas.error());
    }

    auto schema = store->create_schema();
    if (schema.is_err()) {
        return R::Err(schema.error());
    }

    return R::Ok(std::move(store));
}

SqliteStore::SqliteStore(Connection db)
    : db_(std::move(db))
{}

SqliteStore::~SqliteStore() = default;

Status SqliteStore::create_schema() {
    return exec(kSchema);
}

Status SqliteStore::exec(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        return Status::Err(error_from(rc, msg));
    }
    return ok_status();
}

Result<SqliteStore::Statement> SqliteStore::prepare(std::string_view sql) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_.get(), sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
    Statement stmt(raw);
    if (rc != SQLITE_OK) {
        return Result<Statement>::Err(error_from(rc, "prepare"));
    }
    return Result<Statement>::Ok(std::move(stmt));
}

Error SqliteStore::error_from(int rc, std::string_view context) const {
    std::string msg = std::string(context) + ": " + sqlite3_errstr(rc);
    const char* detail = sqlite3_errmsg(db_.get());
    if (detail != nullptr && msg.find(detail) == std::string::npos) {
        msg += " (";
        msg += detail;
        msg += ")";
    }
    return is_transient(rc) ? Error::transient_io(std::move(msg))
                            : Error::internal(std::move(msg));
}

Result<std::vector<TransactionRecord>>
SqliteStore::read_transactions_since(const FeedMarker& marker, std::size_t limit) {
    using R = Result<std::vector<TransactionRecord>>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(
        "SELECT transaction_id, timestamp_ms, client_id, symbol, transaction_type, "
        "quantity, price, total_value, broker_id, market FROM transactions "
        "WHERE (timestamp_ms, transaction_id) > (?, ?) "
        "ORDER BY timestamp_ms, transaction_id LIMIT ?");
    if (stmt.is_err()) {
        return R::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    Binder bind(s);
    bind.integer(marker.timestamp_ms).integer(marker.id).integer(static_cast<std::int64_t>(limit));
    if (bind.rc() != SQLITE_OK) {
        return R::Err(error_from(bind.rc(), "bind transactions query"));
    }

    std::vector<TransactionRecord> rows;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        TransactionRecord row;
        row.id = sqlite3_column_int64(s, 0);
        row.timestamp_ms = sqlite3_column_int64(s, 1);
        row.client_id = column_text(s, 2);
        row.symbol = column_text(s, 3);
        row.side = column_text(s, 4);
        row.quantity = sqlite3_column_int64(s, 5);
        row.price = sqlite3_column_double(s, 6);
        row.total_value = sqlite3_column_double(s, 7);
        row.broker_id = column_text(s, 8);
        row.market = column_text(s, 9);
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        return R::Err(error_from(rc, "read transactions"));
    }
    return R::Ok(std::move(rows));
}

Status SqliteStore::upsert_client_exposure(const ClientExposure& exposure) {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_client_exposure(exposure);
}

Status SqliteStore::write_client_exposure(const ClientExposure& exposure) {
    auto stmt = prepare(
        "INSERT INTO client_exposures (client_id, total_exposure, position_count, risk_level, "
        "last_updated_ms, last_txn_ts_ms, last_txn_id) VALUES (?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(client_id) DO UPDATE SET "
        "total_exposure = excluded.total_exposure, "
        "position_count = excluded.position_count, "
        "risk_level = excluded.risk_level, "
        "last_updated_ms = excluded.last_updated_ms, "
        "last_txn_ts_ms = excluded.last_txn_ts_ms, "
        "last_txn_id = excluded.last_txn_id");
    if (stmt.is_err()) {
        return Status::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    Binder bind(s);
    bind.text(exposure.client_id)
        .real(exposure.total_exposure)
        .integer(exposure.position_count)
        .text(std::string(to_string(exposure.risk_level)))
        .integer(convert::to_epoch_ms(exposure.last_updated))
        .integer(exposure.last_applied.timestamp_ms)
        .integer(exposure.last_applied.id);
    if (bind.rc() != SQLITE_OK) {
        return Status::Err(error_from(bind.rc(), "bind client exposure"));
    }

    int rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return Status::Err(error_from(rc, "upsert client exposure " + exposure.client_id));
    }
    return ok_status();
}

Status SqliteStore::upsert_symbol_exposure(const SymbolExposure& exposure) {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_symbol_exposure(exposure);
}

Status SqliteStore::write_symbol_exposure(const SymbolExposure& exposure) {
    auto stmt = prepare(
        "INSERT INTO symbol_exposures (symbol, total_exposure, transaction_count, risk_level, "
        "last_updated_ms) VALUES (?, ?, ?, ?, ?) "
        "ON CONFLICT(symbol) DO UPDATE SET "
        "total_exposure = excluded.total_exposure, "
        "transaction_count = excluded.transaction_count, "
        "risk_level = excluded.risk_level, "
        "last_updated_ms = excluded.last_updated_ms");
    if (stmt.is_err()) {
        return Status::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    Binder bind(s);
    bind.text(exposure.symbol)
        .real(exposure.total_exposure)
        .integer(exposure.transaction_count)
        .text(std::string(to_string(exposure.risk_level)))
        .integer(convert::to_epoch_ms(exposure.last_updated));
    if (bind.rc() != SQLITE_OK) {
        return Status::Err(error_from(bind.rc(), "bind symbol exposure"));
    }

    int rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return Status::Err(error_from(rc, "upsert symbol exposure " + exposure.symbol));
    }
    return ok_status();
}

Status SqliteStore::commit_batch(const BatchCommit& commit) {
    std::lock_guard<std::mutex> lock(mutex_);

    return in_transaction([&]() {
        for (const auto& client : commit.clients) {
            auto status = write_client_exposure(client);
            if (status.is_err()) {
                return status;
            }
        }
        for (const auto& symbol : commit.symbols) {
            auto status = write_symbol_exposure(symbol);
            if (status.is_err()) {
                return status;
            }
        }
        for (const auto& alert : commit.alerts) {
            auto row_id = write_alert(alert);
            if (row_id.is_err()) {
                return Status::Err(row_id.error());
            }
        }
        if (commit.cursor) {
            return write_cursor(*commit.cursor);
        }
        return ok_status();
    });
}

Status SqliteStore::in_transaction(const std::function<Status()>& body) {
    // IMMEDIATE takes the write lock up front, so busy shows up here and not mid-batch
    auto begun = exec("BEGIN IMMEDIATE");
    if (begun.is_err()) {
        return begun;
    }

    auto status = body();
    if (status.is_ok()) {
        status = exec("COMMIT");
    }
    if (status.is_err()) {
        auto rolled_back = exec("ROLLBACK");
        if (rolled_back.is_err()) {
            spdlog::error("SQLite rollback failed: {}", rolled_back.error().describe());
        }
    }
    return status;
}

Result<std::int64_t> SqliteStore::insert_alert(const Alert& alert) {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_alert(alert);
}

Result<std::int64_t> SqliteStore::write_alert(const Alert& alert) {
    using R = Result<std::int64_t>;

    auto insert = prepare(
        "INSERT INTO alerts (alert_key, timestamp_ms, alert_type, severity, entity_type, "
        "entity_id, message, threshold_value, current_value, acknowledged) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(alert_key) DO NOTHING");
    if (insert.is_err()) {
        return R::Err(insert.error());
    }
    sqlite3_stmt* s = insert.value().get();

    Binder bind(s);
    bind.text(alert.id)
        .integer(convert::to_epoch_ms(alert.timestamp))
        .text(std::string(to_string(alert.alert_type)))
        .text(std::string(to_string(alert.severity)))
        .text(std::string(to_string(alert.entity_type)))
        .text(alert.entity_id)
        .text(alert.message)
        .real(alert.threshold_value)
        .real(alert.current_value)
        .integer(alert.acknowledged ? 1 : 0);
    if (bind.rc() != SQLITE_OK) {
        return R::Err(error_from(bind.rc(), "bind alert"));
    }

    int rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return R::Err(error_from(rc, "insert alert " + alert.id));
    }
    if (sqlite3_changes(db_.get()) > 0) {
        return R::Ok(sqlite3_last_insert_rowid(db_.get()));
    }

    // Already stored under this key
    auto existing = prepare("SELECT alert_id FROM alerts WHERE alert_key = ?");
    if (existing.is_err()) {
        return R::Err(existing.error());
    }
    sqlite3_stmt* e = existing.value().get();

    Binder key(e);
    key.text(alert.id);
    if (key.rc() != SQLITE_OK) {
        return R::Err(error_from(key.rc(), "bind alert key"));
    }

    rc = sqlite3_step(e);
    if (rc != SQLITE_ROW) {
        return R::Err(error_from(rc, "look up alert " + alert.id));
    }
    return R::Ok(sqlite3_column_int64(e, 0));
}

Status SqliteStore::insert_metrics_snapshot(const RiskMetricsSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(
        "INSERT INTO risk_metrics (timestamp_ms, total_transactions, total_exposure, "
        "active_clients, active_symbols, high_risk_clients, high_risk_symbols, alerts_generated) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    if (stmt.is_err()) {
        return Status::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    Binder bind(s);
    bind.integer(convert::to_epoch_ms(snapshot.timestamp))
        .integer(snapshot.total_transactions)
        .real(snapshot.total_exposure)
        .integer(snapshot.active_clients)
        .integer(snapshot.active_symbols)
        .integer(snapshot.high_risk_clients)
        .integer(snapshot.high_risk_symbols)
        .integer(snapshot.alerts_generated);
    if (bind.rc() != SQLITE_OK) {
        return Status::Err(error_from(bind.rc(), "bind metrics snapshot"));
    }

    int rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return Status::Err(error_from(rc, "insert metrics snapshot"));
    }
    return ok_status();
}

Result<std::map<std::string, double>> SqliteStore::read_thresholds_config() {
    using R = Result<std::map<std::string, double>>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare("SELECT name, value FROM risk_thresholds");
    if (stmt.is_err()) {
        return R::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    std::map<std::string, double> values;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        values[column_text(s, 0)] = sqlite3_column_double(s, 1);
    }
    if (rc != SQLITE_DONE) {
        return R::Err(error_from(rc, "read thresholds"));
    }
    return R::Ok(std::move(values));
}

Result<std::optional<FeedMarker>> SqliteStore::load_cursor() {
    using R = Result<std::optional<FeedMarker>>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare("SELECT timestamp_ms, transaction_id FROM engine_cursor WHERE id = 1");
    if (stmt.is_err()) {
        return R::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    int rc = sqlite3_step(s);
    if (rc == SQLITE_DONE) {
        return R::Ok(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        return R::Err(error_from(rc, "load cursor"));
    }
    return R::Ok(FeedMarker{sqlite3_column_int64(s, 0), sqlite3_column_int64(s, 1)});
}

Status SqliteStore::save_cursor(const FeedMarker& marker) {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_cursor(marker);
}

Status SqliteStore::write_cursor(const FeedMarker& marker) {
    auto stmt = prepare(
        "INSERT INTO engine_cursor (id, timestamp_ms, transaction_id) VALUES (1, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET "
        "timestamp_ms = excluded.timestamp_ms, transaction_id = excluded.transaction_id");
    if (stmt.is_err()) {
        return Status::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    Binder bind(s);
    bind.integer(marker.timestamp_ms).integer(marker.id);
    if (bind.rc() != SQLITE_OK) {
        return Status::Err(error_from(bind.rc(), "bind cursor"));
    }

    int rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return Status::Err(error_from(rc, "save cursor"));
    }
    return ok_status();
}

Result<std::vector<ClientExposure>> SqliteStore::list_client_exposures() {
    using R = Result<std::vector<ClientExposure>>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(
        "SELECT client_id, total_exposure, position_count, risk_level, last_updated_ms, "
        "last_txn_ts_ms, last_txn_id FROM client_exposures ORDER BY total_exposure DESC");
    if (stmt.is_err()) {
        return R::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    std::vector<ClientExposure> rows;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        ClientExposure row;
        row.client_id = column_text(s, 0);
        row.total_exposure = sqlite3_column_double(s, 1);
        row.position_count = sqlite3_column_int64(s, 2);
        row.risk_level = parse_risk_level(column_text(s, 3)).value_or(RiskLevel::Low);
        row.last_updated = convert::from_epoch_ms(sqlite3_column_int64(s, 4));
        row.last_applied = FeedMarker{sqlite3_column_int64(s, 5), sqlite3_column_int64(s, 6)};
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        return R::Err(error_from(rc, "list client exposures"));
    }
    return R::Ok(std::move(rows));
}

Result<std::vector<SymbolExposure>> SqliteStore::list_symbol_exposures() {
    using R = Result<std::vector<SymbolExposure>>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(
        "SELECT symbol, total_exposure, transaction_count, risk_level, last_updated_ms "
        "FROM symbol_exposures ORDER BY total_exposure DESC");
    if (stmt.is_err()) {
        return R::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    std::vector<SymbolExposure> rows;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        SymbolExposure row;
        row.symbol = column_text(s, 0);
        row.total_exposure = sqlite3_column_double(s, 1);
        row.transaction_count = sqlite3_column_int64(s, 2);
        row.risk_level = parse_risk_level(column_text(s, 3)).value_or(RiskLevel::Low);
        row.last_updated = convert::from_epoch_ms(sqlite3_column_int64(s, 4));
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        return R::Err(error_from(rc, "list symbol exposures"));
    }
    return R::Ok(std::move(rows));
}

Result<std::vector<StoredAlert>> SqliteStore::list_alerts(const AlertFilter& filter) {
    using R = Result<std::vector<StoredAlert>>;
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql =
        "SELECT alert_id, alert_key, timestamp_ms, alert_type, severity, entity_type, entity_id, "
        "message, threshold_value, current_value, acknowledged, acknowledged_at_ms, acknowledged_by "
        "FROM alerts WHERE 1 = 1";
    if (filter.acknowledged) {
        sql += " AND acknowledged = ?";
    }
    if (filter.severity) {
        sql += " AND severity = ?";
    }
    if (filter.entity_type) {
        sql += " AND entity_type = ?";
    }
    if (filter.since) {
        sql += " AND timestamp_ms >= ?";
    }
    sql += " ORDER BY timestamp_ms DESC, alert_id DESC LIMIT ?";

    auto stmt = prepare(sql);
    if (stmt.is_err()) {
        return R::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    // Same order as the clauses above
    Binder bind(s);
    if (filter.acknowledged) {
        bind.integer(*filter.acknowledged ? 1 : 0);
    }
    if (filter.severity) {
        bind.text(std::string(to_string(*filter.severity)));
    }
    if (filter.entity_type) {
        bind.text(std::string(to_string(*filter.entity_type)));
    }
    if (filter.since) {
        bind.integer(convert::to_epoch_ms(*filter.since));
    }
    bind.integer(static_cast<std::int64_t>(filter.limit));
    if (bind.rc() != SQLITE_OK) {
        return R::Err(error_from(bind.rc(), "bind alert filter"));
    }

    std::vector<StoredAlert> rows;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        rows.push_back(read_alert_row(s));
    }
    if (rc != SQLITE_DONE) {
        return R::Err(error_from(rc, "list alerts"));
    }
    return R::Ok(std::move(rows));
}

Result<std::vector<RiskMetricsSnapshot>> SqliteStore::list_metrics_snapshots(std::size_t limit) {
    using R = Result<std::vector<RiskMetricsSnapshot>>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(
        "SELECT timestamp_ms, total_transactions, total_exposure, active_clients, active_symbols, "
        "high_risk_clients, high_risk_symbols, alerts_generated FROM risk_metrics "
        "ORDER BY timestamp_ms DESC, metric_id DESC LIMIT ?");
    if (stmt.is_err()) {
        return R::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    Binder bind(s);
    bind.integer(static_cast<std::int64_t>(limit));
    if (bind.rc() != SQLITE_OK) {
        return R::Err(error_from(bind.rc(), "bind snapshot limit"));
    }

    std::vector<RiskMetricsSnapshot> rows;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        RiskMetricsSnapshot row;
        row.timestamp = convert::from_epoch_ms(sqlite3_column_int64(s, 0));
        row.total_transactions = sqlite3_column_int64(s, 1);
        row.total_exposure = sqlite3_column_double(s, 2);
        row.active_clients = sqlite3_column_int64(s, 3);
        row.active_symbols = sqlite3_column_int64(s, 4);
        row.high_risk_clients = sqlite3_column_int64(s, 5);
        row.high_risk_symbols = sqlite3_column_int64(s, 6);
        row.alerts_generated = sqlite3_column_int64(s, 7);
        rows.push_back(row);
    }
    if (rc != SQLITE_DONE) {
        return R::Err(error_from(rc, "list metrics snapshots"));
    }
    return R::Ok(std::move(rows));
}

Result<AlertSummary> SqliteStore::alert_summary() {
    using R = Result<AlertSummary>;
    std::lock_guard<std::mutex> lock(mutex_);

    AlertSummary summary;

    auto counts = prepare(
        "SELECT COUNT(*), COALESCE(SUM(CASE WHEN acknowledged = 0 THEN 1 ELSE 0 END), 0) "
        "FROM alerts");
    if (counts.is_err()) {
        return R::Err(counts.error());
    }
    int rc = sqlite3_step(counts.value().get());
    if (rc != SQLITE_ROW) {
        return R::Err(error_from(rc, "count alerts"));
    }
    summary.total = sqlite3_column_int64(counts.value().get(), 0);
    summary.unacknowledged = sqlite3_column_int64(counts.value().get(), 1);

    struct Breakdown {
        const char* sql;
        std::map<std::string, std::int64_t>* into;
    };
    const Breakdown breakdowns[] = {
        {"SELECT severity, COUNT(*) FROM alerts WHERE acknowledged = 0 GROUP BY severity",
         &summary.by_severity},
        {"SELECT alert_type, COUNT(*) FROM alerts WHERE acknowledged = 0 GROUP BY alert_type",
         &summary.by_type},
    };

    for (const auto& breakdown : breakdowns) {
        auto stmt = prepare(breakdown.sql);
        if (stmt.is_err()) {
            return R::Err(stmt.error());
        }
        sqlite3_stmt* s = stmt.value().get();
        while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
            (*breakdown.into)[column_text(s, 0)] = sqlite3_column_int64(s, 1);
        }
        if (rc != SQLITE_DONE) {
            return R::Err(error_from(rc, "summarize alerts"));
        }
    }

    return R::Ok(std::move(summary));
}

Result<bool> SqliteStore::acknowledge_alert(std::int64_t row_id, const std::string& acknowledged_by) {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_acknowledgement(row_id, acknowledged_by,
                                 convert::to_epoch_ms(std::chrono::system_clock::now()));
}

Result<std::vector<std::int64_t>> SqliteStore::acknowledge_alerts(
    const std::vector<std::int64_t>& row_ids, const std::string& acknowledged_by) {
    using R = Result<std::vector<std::int64_t>>;
    std::lock_guard<std::mutex> lock(mutex_);

    // One timestamp for the whole group
    const std::int64_t now_ms = convert::to_epoch_ms(std::chrono::system_clock::now());
    std::vector<std::int64_t> missing;

    auto status = in_transaction([&]() {
        for (std::int64_t row_id : row_ids) {
            auto updated = write_acknowledgement(row_id, acknowledged_by, now_ms);
            if (updated.is_err()) {
                return Status::Err(updated.error());
            }
            if (!updated.value()) {
                missing.push_back(row_id);
            }
        }
        return ok_status();
    });
    if (status.is_err()) {
        return R::Err(status.error());
    }
    return R::Ok(std::move(missing));
}

Result<bool> SqliteStore::write_acknowledgement(std::int64_t row_id,
                                                const std::string& acknowledged_by,
                                                std::int64_t at_ms) {
    using R = Result<bool>;

    auto stmt = prepare(
        "UPDATE alerts SET acknowledged = 1, acknowledged_at_ms = ?, acknowledged_by = ? "
        "WHERE alert_id = ?");
    if (stmt.is_err()) {
        return R::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    Binder bind(s);
    bind.integer(at_ms)
        .text(acknowledged_by)
        .integer(row_id);
    if (bind.rc() != SQLITE_OK) {
        return R::Err(error_from(bind.rc(), "bind acknowledgement"));
    }

    int rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return R::Err(error_from(rc, "acknowledge alert " + std::to_string(row_id)));
    }
    return R::Ok(sqlite3_changes(db_.get()) > 0);
}

Result<std::int64_t> SqliteStore::delete_acknowledged_alerts(WallTime cutoff) {
    using R = Result<std::int64_t>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare("DELETE FROM alerts WHERE acknowledged = 1 AND timestamp_ms < ?");
    if (stmt.is_err()) {
        return R::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    Binder bind(s);
    bind.integer(convert::to_epoch_ms(cutoff));
    if (bind.rc() != SQLITE_OK) {
        return R::Err(error_from(bind.rc(), "bind cleanup cutoff"));
    }

    int rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return R::Err(error_from(rc, "delete acknowledged alerts"));
    }
    return R::Ok(static_cast<std::int64_t>(sqlite3_changes(db_.get())));
}

Result<TransactionId> SqliteStore::insert_transaction(const TransactionRecord& record) {
    using R = Result<TransactionId>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(
        "INSERT INTO transactions (transaction_id, timestamp_ms, client_id, symbol, "
        "transaction_type, quantity, price, total_value, broker_id, market) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (stmt.is_err()) {
        return R::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    Binder bind(s);
    if (record.id > 0) {
        bind.integer(record.id);
    } else {
        // NULL into an INTEGER PRIMARY KEY assigns the next id
        bind.null();
    }
    bind.integer(record.timestamp_ms)
        .text(record.client_id)
        .text(record.symbol)
        .text(record.side)
        .integer(record.quantity)
        .real(record.price)
        .real(record.total_value)
        .text(record.broker_id)
        .text(record.market);
    if (bind.rc() != SQLITE_OK) {
        return R::Err(error_from(bind.rc(), "bind transaction"));
    }

    int rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return R::Err(error_from(rc, "insert transaction"));
    }
    return R::Ok(sqlite3_last_insert_rowid(db_.get()));
}

Status SqliteStore::set_threshold(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(
        "INSERT INTO risk_thresholds (name, value) VALUES (?, ?) "
        "ON CONFLICT(name) DO UPDATE SET value = excluded.value");
    if (stmt.is_err()) {
        return Status::Err(stmt.error());
    }
    sqlite3_stmt* s = stmt.value().get();

    Binder bind(s);
    bind.text(name).real(value);
    if (bind.rc() != SQLITE_OK) {
        return Status::Err(error_from(bind.rc(), "bind threshold"));
    }

    int rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return Status::Err(error_from(rc, "set threshold " + name));
    }
    return ok_status();
}

}  // namespace riskwatch::storage
