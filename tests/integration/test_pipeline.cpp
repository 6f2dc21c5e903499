#include <gtest/gtest.h>

#include "engine/risk_monitor.hpp"
#include "flaky_store.hpp"
#include "storage/sqlite_store.hpp"
#include "temp_database.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace riskwatch;
using riskwatch::test::FlakyStore;
using riskwatch::test::make_record;
using riskwatch::test::TempDatabase;

namespace {

Config test_config() {
    Config config = Config::defaults();
    config.output.ws_server_port = 0;
    config.engine.worker_threads = 4;
    return config;
}

}  // namespace

// ============================================================================
// End-to-end: store rows in, exposures, alerts and cursor out
// ============================================================================

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = storage::SqliteStore::open(":memory:");
        ASSERT_TRUE(opened.is_ok()) << opened.error().describe();
        db_ = std::move(opened).take_value();
    }

    void insert(const TransactionRecord& record) {
        auto id = db_->insert_transaction(record);
        ASSERT_TRUE(id.is_ok()) << id.error().describe();
    }

    std::unique_ptr<RiskMonitor> start_monitor(Config config, storage::RiskStore& store) {
        auto monitor = std::make_unique<RiskMonitor>(std::move(config), store);
        auto status = monitor->initialize();
        EXPECT_TRUE(status.is_ok()) << status.error().describe();
        return monitor;
    }

    std::unique_ptr<RiskMonitor> start_monitor(Config config = test_config()) {
        return start_monitor(std::move(config), *db_);
    }

    std::vector<Alert> alerts_of(AlertType type) {
        storage::AlertFilter filter;
        filter.limit = 1000;
        auto stored = db_->list_alerts(filter);
        EXPECT_TRUE(stored.is_ok());

        std::vector<Alert> result;
        if (stored.is_ok()) {
            for (const auto& row : stored.value()) {
                if (row.alert.alert_type == type) {
                    result.push_back(row.alert);
                }
            }
        }
        return result;
    }

    std::optional<ClientExposure> stored_client(const std::string& client_id) {
        auto clients = db_->list_client_exposures();
        EXPECT_TRUE(clients.is_ok());
        if (clients.is_ok()) {
            for (const auto& client : clients.value()) {
                if (client.client_id == client_id) {
                    return client;
                }
            }
        }
        return std::nullopt;
    }

    std::optional<SymbolExposure> stored_symbol(const std::string& symbol) {
        auto symbols = db_->list_symbol_exposures();
        EXPECT_TRUE(symbols.is_ok());
        if (symbols.is_ok()) {
            for (const auto& exposure : symbols.value()) {
                if (exposure.symbol == symbol) {
                    return exposure;
                }
            }
        }
        return std::nullopt;
    }

    std::unique_ptr<storage::SqliteStore> db_;
};

TEST_F(PipelineTest, ExposureBreachRaisesCriticalClientAlert) {
    insert(make_record(1, 0, "CLIENT_0001", "AAPL", 10'000, 120.0));
    auto monitor = start_monitor();

    auto cycle = monitor->run_cycle();

    ASSERT_TRUE(cycle.is_ok()) << cycle.error().describe();
    EXPECT_EQ(cycle.value().fetched, 1u);
    EXPECT_EQ(cycle.value().batch.processed, 1u);

    auto client_alerts = alerts_of(AlertType::HighClientExposure);
    ASSERT_EQ(client_alerts.size(), 1u);
    EXPECT_EQ(client_alerts[0].severity, Severity::Critical);
    EXPECT_EQ(client_alerts[0].entity_id, "CLIENT_0001");
    EXPECT_DOUBLE_EQ(client_alerts[0].threshold_value, 1'000'000.0);
    EXPECT_DOUBLE_EQ(client_alerts[0].current_value, 1'200'000.0);
    EXPECT_EQ(client_alerts[0].message,
              "Client CLIENT_0001 exposure $1,200,000.00 exceeds threshold $1,000,000.00");

    auto client = stored_client("CLIENT_0001");
    ASSERT_TRUE(client.has_value());
    EXPECT_DOUBLE_EQ(client->total_exposure, 1'200'000.0);
    EXPECT_EQ(client->position_count, 1);
    EXPECT_EQ(client->risk_level, RiskLevel::Critical);

    auto saved = db_->load_cursor();
    ASSERT_TRUE(saved.is_ok());
    ASSERT_TRUE(saved.value().has_value());
    EXPECT_EQ(saved.value()->id, 1);
    EXPECT_EQ(monitor->cursor(), *saved.value());
}

TEST_F(PipelineTest, SymbolBreachRaisesSymbolAlert) {
    insert(make_record(1, 0, "CLIENT_0001", "AAPL", 10'000, 120.0));
    auto monitor = start_monitor();

    ASSERT_TRUE(monitor->run_cycle().is_ok());

    auto symbol_alerts = alerts_of(AlertType::HighSymbolExposure);
    ASSERT_EQ(symbol_alerts.size(), 1u);
    EXPECT_EQ(symbol_alerts[0].entity_type, EntityType::Symbol);
    EXPECT_EQ(symbol_alerts[0].entity_id, "AAPL");
    EXPECT_DOUBLE_EQ(symbol_alerts[0].threshold_value, 500'000.0);
}

TEST_F(PipelineTest, StoredThresholdOverridesConfig) {
    ASSERT_TRUE(db_->set_threshold("client_exposure_threshold", 2'000'000.0).is_ok());
    insert(make_record(1, 0, "CLIENT_0001", "AAPL", 10'000, 120.0));
    auto monitor = start_monitor();

    EXPECT_DOUBLE_EQ(monitor->config().thresholds.client_exposure, 2'000'000.0);
    ASSERT_TRUE(monitor->run_cycle().is_ok());

    // 60% of the raised threshold is only MEDIUM
    EXPECT_TRUE(alerts_of(AlertType::HighClientExposure).empty());
    auto client = stored_client("CLIENT_0001");
    ASSERT_TRUE(client.has_value());
    EXPECT_EQ(client->risk_level, RiskLevel::Medium);
}

TEST_F(PipelineTest, UnknownStoredThresholdFailsInitialization) {
    ASSERT_TRUE(db_->set_threshold("max_leverage", 4.0).is_ok());
    RiskMonitor monitor(test_config(), *db_);

    auto status = monitor.initialize();

    ASSERT_TRUE(status.is_err());
    EXPECT_EQ(status.error().kind, ErrorKind::Config);
}

TEST_F(PipelineTest, EscalationWithinCooldownIsEmitted) {
    Config config = test_config();
    config.thresholds.symbol_exposure = 1e12;
    insert(make_record(1, 0, "CLIENT_0002", "MSFT", 8'500, 100.0));
    insert(make_record(2, 1, "CLIENT_0002", "MSFT", 3'500, 100.0));
    auto monitor = start_monitor(config);

    ASSERT_TRUE(monitor->run_cycle().is_ok());

    // Newest first
    auto client_alerts = alerts_of(AlertType::HighClientExposure);
    ASSERT_EQ(client_alerts.size(), 2u);
    EXPECT_EQ(client_alerts[0].severity, Severity::Critical);
    EXPECT_EQ(client_alerts[1].severity, Severity::High);
    EXPECT_EQ(client_alerts[1].message,
              "Client CLIENT_0002 exposure $850,000.00 at 85% of threshold $1,000,000.00");
}

TEST_F(PipelineTest, VelocityAlertFiresOnceWithinCooldown) {
    for (int i = 0; i < 12; ++i) {
        insert(make_record(i + 1, i, "CLIENT_0003", "VELO", 10, 100.0));
    }
    auto monitor = start_monitor();

    auto cycle = monitor->run_cycle();
    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().batch.processed, 12u);

    auto velocity = alerts_of(AlertType::HighTransactionVelocity);
    ASSERT_EQ(velocity.size(), 1u);
    EXPECT_EQ(velocity[0].entity_id, "CLIENT_0003");
    EXPECT_EQ(velocity[0].severity, Severity::Medium);
    EXPECT_DOUBLE_EQ(velocity[0].current_value, 11.0);
    EXPECT_EQ(velocity[0].message,
              "CLIENT CLIENT_0003 has 11 transactions in last 60s (threshold: 10)");
    EXPECT_EQ(monitor->engine().alerts_suppressed(), 1u);
}

TEST_F(PipelineTest, SpacedTransactionsRaiseNoVelocityAlert) {
    for (int i = 0; i < 11; ++i) {
        insert(make_record(i + 1, i * 61, "CLIENT_0004", "SLOW", 10, 100.0));
    }
    auto monitor = start_monitor();

    ASSERT_TRUE(monitor->run_cycle().is_ok());

    EXPECT_TRUE(alerts_of(AlertType::HighTransactionVelocity).empty());
}

TEST_F(PipelineTest, OutlierValueRaisesAnomalyAlert) {
    const double prices[] = {95.0, 105.0, 95.0, 105.0, 95.0, 105.0};
    for (int i = 0; i < 6; ++i) {
        insert(make_record(i + 1, i * 10, "CLIENT_0005", "ANOM", 1, prices[i]));
    }
    insert(make_record(7, 70, "CLIENT_0005", "ANOM", 10, 100.0));
    auto monitor = start_monitor();

    ASSERT_TRUE(monitor->run_cycle().is_ok());

    auto anomalies = alerts_of(AlertType::AnomalyDetected);
    ASSERT_EQ(anomalies.size(), 1u);
    EXPECT_EQ(anomalies[0].entity_type, EntityType::Symbol);
    EXPECT_EQ(anomalies[0].entity_id, "ANOM");
    EXPECT_EQ(anomalies[0].severity, Severity::Critical);
    EXPECT_DOUBLE_EQ(anomalies[0].current_value, 1000.0);
    EXPECT_GT(anomalies[0].threshold_value, 100.0);
}

TEST_F(PipelineTest, MalformedRowIsSkippedAndCursorAdvances) {
    insert(make_record(1, 0, "CLIENT_0006", "IBM", 10, 100.0));
    insert(make_record(2, 1, "CLIENT_0006", "IBM", 10, 100.0, "HOLD"));
    insert(make_record(3, 2, "CLIENT_0006", "IBM", 10, 100.0));
    auto monitor = start_monitor();

    auto cycle = monitor->run_cycle();

    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().fetched, 3u);
    EXPECT_EQ(cycle.value().rejected, 1u);
    EXPECT_EQ(cycle.value().batch.processed, 2u);
    EXPECT_EQ(cycle.value().cursor.id, 3);

    auto client = stored_client("CLIENT_0006");
    ASSERT_TRUE(client.has_value());
    EXPECT_DOUBLE_EQ(client->total_exposure, 2'000.0);
}

TEST_F(PipelineTest, BatchSizeLimitsEachCycle) {
    Config config = test_config();
    config.engine.batch_size = 2;
    for (int i = 0; i < 3; ++i) {
        insert(make_record(i + 1, i, "CLIENT_0007", "ORCL", 1, 50.0));
    }
    auto monitor = start_monitor(config);

    auto first = monitor->run_cycle();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().fetched, 2u);
    EXPECT_TRUE(first.value().full);

    auto second = monitor->run_cycle();
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().fetched, 1u);
    EXPECT_FALSE(second.value().full);

    auto idle = monitor->run_cycle();
    ASSERT_TRUE(idle.is_ok());
    EXPECT_EQ(idle.value().fetched, 0u);
    EXPECT_EQ(idle.value().cursor.id, 3);
}

TEST_F(PipelineTest, ReplayAfterRestartDoesNotDoubleExposure) {
    for (int i = 0; i < 3; ++i) {
        insert(make_record(i + 1, i, "CLIENT_0008", "NFLX", 1'000, 100.0));
    }
    {
        auto monitor = start_monitor();
        ASSERT_TRUE(monitor->run_cycle().is_ok());
    }

    // Lose the checkpoint so every row is read again
    ASSERT_TRUE(db_->save_cursor(FeedMarker{}).is_ok());

    auto monitor = start_monitor();
    auto hydrated = monitor->engine().aggregator().client("CLIENT_0008");
    ASSERT_TRUE(hydrated.has_value());
    EXPECT_DOUBLE_EQ(hydrated->total_exposure, 300'000.0);

    auto cycle = monitor->run_cycle();

    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().batch.processed, 0u);
    EXPECT_EQ(cycle.value().batch.duplicates, 3u);
    EXPECT_EQ(cycle.value().cursor.id, 3);

    auto client = stored_client("CLIENT_0008");
    ASSERT_TRUE(client.has_value());
    EXPECT_DOUBLE_EQ(client->total_exposure, 300'000.0);
    EXPECT_EQ(client->position_count, 3);
}

TEST_F(PipelineTest, RestartResumesFromCheckpoint) {
    insert(make_record(1, 0, "CLIENT_0009", "AMZN", 10, 10.0));
    {
        auto monitor = start_monitor();
        ASSERT_TRUE(monitor->run_cycle().is_ok());
    }
    insert(make_record(2, 1, "CLIENT_0009", "AMZN", 10, 10.0));

    auto monitor = start_monitor();
    EXPECT_EQ(monitor->cursor().id, 1);

    auto cycle = monitor->run_cycle();

    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().fetched, 1u);
    auto client = stored_client("CLIENT_0009");
    ASSERT_TRUE(client.has_value());
    EXPECT_DOUBLE_EQ(client->total_exposure, 200.0);
}

TEST_F(PipelineTest, SnapshotCountsAlertsAndTransactions) {
    insert(make_record(1, 0, "CLIENT_0001", "AAPL", 10'000, 120.0));
    auto monitor = start_monitor();
    ASSERT_TRUE(monitor->run_cycle().is_ok());

    auto snapshot = monitor->publish_snapshot();

    ASSERT_TRUE(snapshot.is_ok()) << snapshot.error().describe();
    EXPECT_EQ(snapshot.value().total_transactions, 1);
    EXPECT_DOUBLE_EQ(snapshot.value().total_exposure, 1'200'000.0);
    EXPECT_EQ(snapshot.value().active_clients, 1);
    EXPECT_EQ(snapshot.value().high_risk_clients, 1);
    // Client and symbol breach
    EXPECT_EQ(snapshot.value().alerts_generated, 2);

    auto stored = db_->list_metrics_snapshots(10);
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().size(), 1u);
}

// ============================================================================
// Store outages
// ============================================================================

class PipelineOutageTest : public PipelineTest {
protected:
    void SetUp() override {
        PipelineTest::SetUp();
        flaky_ = std::make_unique<FlakyStore>(*db_);
    }

    std::unique_ptr<FlakyStore> flaky_;
};

TEST_F(PipelineOutageTest, ReadFailureLeavesCursorUnchanged) {
    insert(make_record(1, 0, "CLIENT_0010", "TSLA", 10, 100.0));
    auto monitor = start_monitor(test_config(), *flaky_);

    flaky_->fail_reads = true;
    auto failed = monitor->run_cycle();

    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error().kind, ErrorKind::TransientIO);
    EXPECT_EQ(monitor->cursor(), FeedMarker{});

    flaky_->fail_reads = false;
    auto recovered = monitor->run_cycle();

    ASSERT_TRUE(recovered.is_ok());
    EXPECT_EQ(recovered.value().batch.processed, 1u);
    EXPECT_EQ(monitor->cursor().id, 1);
}

TEST_F(PipelineOutageTest, ExposureWriteFailureIsRetriedWithoutDoubleCounting) {
    insert(make_record(1, 0, "CLIENT_0011", "NVDA", 100, 100.0));
    auto monitor = start_monitor(test_config(), *flaky_);

    flaky_->fail_exposure_writes = true;
    auto failed = monitor->run_cycle();

    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(monitor->cursor(), FeedMarker{});
    auto saved = db_->load_cursor();
    ASSERT_TRUE(saved.is_ok());
    EXPECT_FALSE(saved.value().has_value());
    EXPECT_FALSE(stored_client("CLIENT_0011").has_value());

    flaky_->fail_exposure_writes = false;
    auto recovered = monitor->run_cycle();

    ASSERT_TRUE(recovered.is_ok());
    EXPECT_EQ(recovered.value().batch.duplicates, 1u);
    EXPECT_EQ(recovered.value().cursor.id, 1);

    auto client = stored_client("CLIENT_0011");
    ASSERT_TRUE(client.has_value());
    EXPECT_DOUBLE_EQ(client->total_exposure, 10'000.0);
    EXPECT_EQ(client->position_count, 1);
}

TEST_F(PipelineOutageTest, CursorSaveFailureKeepsPreviousCheckpoint) {
    insert(make_record(1, 0, "CLIENT_0012", "AMD", 10, 100.0));
    auto monitor = start_monitor(test_config(), *flaky_);

    flaky_->fail_cursor_saves = true;
    auto failed = monitor->run_cycle();

    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(monitor->cursor(), FeedMarker{});
    // The exposures of the batch are not stored without their checkpoint
    EXPECT_FALSE(stored_client("CLIENT_0012").has_value());

    flaky_->fail_cursor_saves = false;
    auto recovered = monitor->run_cycle();

    ASSERT_TRUE(recovered.is_ok());
    EXPECT_EQ(monitor->cursor().id, 1);
    auto client = stored_client("CLIENT_0012");
    ASSERT_TRUE(client.has_value());
    EXPECT_DOUBLE_EQ(client->total_exposure, 1'000.0);
}

TEST_F(PipelineOutageTest, UnstoredAlertHoldsCheckpointUntilCommitted) {
    insert(make_record(1, 0, "CLIENT_0013", "AAPL", 10'000, 120.0));
    auto monitor = start_monitor(test_config(), *flaky_);
    std::vector<std::string> announced;
    monitor->sink().add_listener([&](const Alert& alert) { announced.push_back(alert.id); });

    flaky_->fail_alert_inserts = true;
    auto failed = monitor->run_cycle();

    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(monitor->cursor(), FeedMarker{});
    EXPECT_GT(monitor->sink().pending_count(), 0u);
    EXPECT_TRUE(alerts_of(AlertType::HighClientExposure).empty());
    EXPECT_FALSE(stored_client("CLIENT_0013").has_value());
    EXPECT_TRUE(announced.empty());

    flaky_->fail_alert_inserts = false;
    auto recovered = monitor->run_cycle();

    ASSERT_TRUE(recovered.is_ok());
    EXPECT_EQ(recovered.value().batch.duplicates, 1u);
    EXPECT_EQ(monitor->cursor().id, 1);
    EXPECT_EQ(monitor->sink().pending_count(), 0u);
    EXPECT_EQ(alerts_of(AlertType::HighClientExposure).size(), 1u);
    EXPECT_EQ(announced.size(), 2u);  // client and symbol breach
    auto client = stored_client("CLIENT_0013");
    ASSERT_TRUE(client.has_value());
    EXPECT_DOUBLE_EQ(client->total_exposure, 1'200'000.0);
}

TEST_F(PipelineOutageTest, AlertsLostToAnOutageAreRederivedAfterRestart) {
    insert(make_record(1, 0, "CLIENT_0014", "AAPL", 10'000, 120.0));
    {
        auto monitor = start_monitor(test_config(), *flaky_);
        flaky_->fail_alert_inserts = true;
        ASSERT_TRUE(monitor->run_cycle().is_err());
        // Shutdown cannot store them either
    }
    flaky_->fail_alert_inserts = false;
    EXPECT_TRUE(alerts_of(AlertType::HighClientExposure).empty());

    auto monitor = start_monitor(test_config(), *flaky_);
    auto cycle = monitor->run_cycle();

    ASSERT_TRUE(cycle.is_ok());
    EXPECT_EQ(cycle.value().batch.processed, 1u);
    EXPECT_EQ(cycle.value().batch.duplicates, 0u);
    ASSERT_EQ(alerts_of(AlertType::HighClientExposure).size(), 1u);
    EXPECT_EQ(alerts_of(AlertType::HighSymbolExposure).size(), 1u);
    EXPECT_EQ(monitor->cursor().id, 1);
}

// ============================================================================
// Crash consistency on a database file
// ============================================================================

class PipelineFileTest : public PipelineTest {
protected:
    void SetUp() override {
        auto opened = storage::SqliteStore::open(file_.path());
        ASSERT_TRUE(opened.is_ok()) << opened.error().describe();
        db_ = std::move(opened).take_value();
    }

    void TearDown() override {
        db_.reset();
    }

    TempDatabase file_{"pipeline"};
};

TEST_F(PipelineFileTest, FailedSymbolWriteLeavesNothingForRestartToSkip) {
    insert(make_record(1, 0, "CLIENT_0015", "AAPL", 100, 100.0));
    file_.execute("CREATE TRIGGER refuse_symbols BEFORE INSERT ON symbol_exposures "
                  "BEGIN SELECT RAISE(ABORT, 'symbol writes refused'); END;");
    {
        auto monitor = start_monitor();
        ASSERT_TRUE(monitor->run_cycle().is_err());
    }

    // The client row and its watermark went down with the symbol write
    EXPECT_FALSE(stored_client("CLIENT_0015").has_value());
    EXPECT_FALSE(stored_symbol("AAPL").has_value());
    auto saved = db_->load_cursor();
    ASSERT_TRUE(saved.is_ok());
    EXPECT_FALSE(saved.value().has_value());

    file_.execute("DROP TRIGGER refuse_symbols;");
    auto monitor = start_monitor();
    auto cycle = monitor->run_cycle();

    ASSERT_TRUE(cycle.is_ok()) << cycle.error().describe();
    EXPECT_EQ(cycle.value().batch.processed, 1u);
    EXPECT_EQ(cycle.value().batch.duplicates, 0u);

    auto client = stored_client("CLIENT_0015");
    auto symbol = stored_symbol("AAPL");
    ASSERT_TRUE(client.has_value());
    ASSERT_TRUE(symbol.has_value());
    EXPECT_DOUBLE_EQ(client->total_exposure, 10'000.0);
    EXPECT_DOUBLE_EQ(symbol->total_exposure, 10'000.0);
}
