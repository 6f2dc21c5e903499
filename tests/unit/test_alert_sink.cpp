#include <gtest/gtest.h>
#include "alert/alert_sink.hpp"
#include "flaky_store.hpp"
#include "storage/sqlite_store.hpp"
#include "test_helpers.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace riskwatch;
using riskwatch::test::at_seconds;
using riskwatch::test::FlakyStore;

class AlertSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = storage::SqliteStore::open(":memory:");
        ASSERT_TRUE(opened.is_ok()) << opened.error().describe();
        db_ = std::move(opened).take_value();
        store_ = std::make_unique<FlakyStore>(*db_);
    }

    static Alert make_alert(const std::string& entity, std::int64_t txn_id) {
        Alert alert;
        alert.id = "HIGH_CLIENT_EXPOSURE:" + entity + ":" + std::to_string(txn_id);
        alert.timestamp = at_seconds(txn_id);
        alert.alert_type = AlertType::HighClientExposure;
        alert.severity = Severity::High;
        alert.entity_type = EntityType::Client;
        alert.entity_id = entity;
        alert.message = "exposure";
        alert.threshold_value = 1'000'000.0;
        alert.current_value = 850'000.0;
        return alert;
    }

    std::size_t stored_alerts() {
        storage::AlertFilter filter;
        auto alerts = db_->list_alerts(filter);
        EXPECT_TRUE(alerts.is_ok());
        return alerts.is_ok() ? alerts.value().size() : 0;
    }

    std::unique_ptr<storage::SqliteStore> db_;
    std::unique_ptr<FlakyStore> store_;
};

TEST_F(AlertSinkTest, PersistsThenAnnounces) {
    AlertSink sink(*store_, nullptr);
    std::vector<std::string> seen;
    sink.add_listener([&](const Alert& alert) {
        // Listener runs after the insert
        EXPECT_EQ(stored_alerts(), seen.size() + 1);
        seen.push_back(alert.id);
    });

    ASSERT_TRUE(sink.emit(make_alert("C1", 1)).is_ok());
    ASSERT_TRUE(sink.emit(make_alert("C2", 2)).is_ok());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "HIGH_CLIENT_EXPOSURE:C1:1");
    EXPECT_EQ(sink.emitted(), 2);
    EXPECT_EQ(sink.pending_count(), 0u);
}

TEST_F(AlertSinkTest, FailedInsertIsKeptAndRetried) {
    AlertSink sink(*store_, nullptr);
    int announced = 0;
    sink.add_listener([&](const Alert&) { ++announced; });

    store_->fail_alert_inserts = true;
    auto status = sink.emit(make_alert("C1", 1));

    ASSERT_TRUE(status.is_err());
    EXPECT_EQ(status.error().kind, ErrorKind::TransientIO);
    EXPECT_EQ(announced, 0);
    EXPECT_EQ(sink.pending_count(), 1u);
    EXPECT_EQ(sink.emitted(), 0);

    // Still failing: nothing lost
    EXPECT_EQ(sink.flush_pending(), 1u);
    EXPECT_EQ(announced, 0);

    store_->fail_alert_inserts = false;
    EXPECT_EQ(sink.flush_pending(), 0u);
    EXPECT_EQ(announced, 1);
    EXPECT_EQ(sink.emitted(), 1);
    EXPECT_EQ(stored_alerts(), 1u);
}

TEST_F(AlertSinkTest, PendingKeepsEmissionOrder) {
    AlertSink sink(*store_, nullptr);
    std::vector<std::string> seen;
    sink.add_listener([&](const Alert& alert) { seen.push_back(alert.id); });

    store_->fail_alert_inserts = true;
    (void)sink.emit(make_alert("C1", 1));
    (void)sink.emit(make_alert("C2", 2));
    store_->fail_alert_inserts = false;

    EXPECT_EQ(sink.flush_pending(), 0u);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "HIGH_CLIENT_EXPOSURE:C1:1");
    EXPECT_EQ(seen[1], "HIGH_CLIENT_EXPOSURE:C2:2");
}

TEST_F(AlertSinkTest, BaselineSeedsEmittedCount) {
    AlertSink sink(*store_, nullptr);
    sink.set_baseline(40);

    ASSERT_TRUE(sink.emit(make_alert("C1", 1)).is_ok());

    EXPECT_EQ(sink.emitted(), 41);
}

TEST_F(AlertSinkTest, ReinsertingSameAlertStoresOneRow) {
    AlertSink sink(*store_, nullptr);

    ASSERT_TRUE(sink.emit(make_alert("C1", 1)).is_ok());
    ASSERT_TRUE(sink.emit(make_alert("C1", 1)).is_ok());

    EXPECT_EQ(stored_alerts(), 1u);
}

TEST_F(AlertSinkTest, ThrowingListenerDoesNotStopTheOthers) {
    AlertSink sink(*store_, nullptr);
    std::vector<std::string> seen;
    sink.add_listener([](const Alert&) { throw std::runtime_error("dashboard gone"); });
    sink.add_listener([&](const Alert& alert) { seen.push_back(alert.id); });

    auto status = sink.emit(make_alert("C1", 1));

    ASSERT_TRUE(status.is_ok());
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(stored_alerts(), 1u);
    EXPECT_EQ(sink.pending_count(), 0u);
}

TEST_F(AlertSinkTest, CommittedAlertsLeavePendingAndAreAnnounced) {
    AlertSink sink(*store_, nullptr);
    std::vector<std::string> seen;
    sink.add_listener([&](const Alert& alert) { seen.push_back(alert.id); });

    store_->fail_alert_inserts = true;
    (void)sink.emit(make_alert("C1", 1));
    (void)sink.emit(make_alert("C2", 2));
    ASSERT_EQ(sink.pending_count(), 2u);

    // A batch commit took the first one; the second arrived after the copy
    auto pending = sink.pending();
    ASSERT_EQ(pending.size(), 2u);
    pending.pop_back();
    sink.committed(pending);

    EXPECT_EQ(sink.pending_count(), 1u);
    EXPECT_EQ(sink.pending().front().id, "HIGH_CLIENT_EXPOSURE:C2:2");
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "HIGH_CLIENT_EXPOSURE:C1:1");
    EXPECT_EQ(sink.emitted(), 1);
}
