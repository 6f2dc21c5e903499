#include <gtest/gtest.h>
#include "network/ssl_context.hpp"
#include "notify/notifier.hpp"
#include "notify/webhook_channel.hpp"
#include <atomic>
#include <string>

using namespace riskwatch;
using namespace riskwatch::notify;
using std::chrono::milliseconds;

namespace {

/// Channel that fails its first `failures` attempts, then succeeds
class ScriptedChannel final : public NotificationChannel {
public:
    ScriptedChannel(std::string name, std::size_t failures)
        : name_(std::move(name)), failures_(failures) {}

    std::string_view name() const noexcept override {
        return name_;
    }

    void deliver(const Alert&, DeliveryHandler handler) override {
        std::size_t attempt = ++attempts_;
        if (attempt <= failures_) {
            handler(Status::Err(Error::delivery("503 Service Unavailable")));
        } else {
            handler(ok_status());
        }
    }

    std::atomic<std::size_t>& attempts() {
        return attempts_;
    }

private:
    std::string name_;
    std::size_t failures_;
    std::atomic<std::size_t> attempts_{0};
};

/// Channel whose deliver throws
class ThrowingChannel final : public NotificationChannel {
public:
    std::string_view name() const noexcept override {
        return "throwing";
    }

    void deliver(const Alert&, DeliveryHandler) override {
        throw std::runtime_error("socket exploded");
    }
};

Alert sample_alert(const std::string& id) {
    Alert alert;
    alert.id = id;
    alert.alert_type = AlertType::HighClientExposure;
    alert.severity = Severity::High;
    alert.entity_id = "C1";
    return alert;
}

}  // namespace

TEST(NotifierTest, DeliversToEveryChannel) {
    Notifier notifier(3, milliseconds{1});
    auto first = std::make_unique<ScriptedChannel>("first", 0);
    auto second = std::make_unique<ScriptedChannel>("second", 0);
    auto& first_ref = *first;
    auto& second_ref = *second;
    notifier.add_channel(std::move(first));
    notifier.add_channel(std::move(second));
    notifier.start();

    notifier.enqueue(sample_alert("A:1"));
    notifier.enqueue(sample_alert("A:2"));

    ASSERT_TRUE(notifier.drain(milliseconds{5000}));
    EXPECT_EQ(notifier.delivered(), 4u);
    EXPECT_EQ(first_ref.attempts(), 2u);
    EXPECT_EQ(second_ref.attempts(), 2u);
    notifier.stop();
}

TEST(NotifierTest, RetriesUntilSuccess) {
    Notifier notifier(3, milliseconds{1});
    auto flaky = std::make_unique<ScriptedChannel>("flaky", 2);
    auto& flaky_ref = *flaky;
    notifier.add_channel(std::move(flaky));
    notifier.start();

    notifier.enqueue(sample_alert("A:1"));

    ASSERT_TRUE(notifier.drain(milliseconds{5000}));
    EXPECT_EQ(flaky_ref.attempts(), 3u);
    EXPECT_EQ(notifier.failed_attempts(), 2u);
    EXPECT_EQ(notifier.delivered(), 1u);
    EXPECT_EQ(notifier.dropped(), 0u);
    notifier.stop();
}

TEST(NotifierTest, DropsAfterMaxAttemptsWithoutAffectingOthers) {
    Notifier notifier(3, milliseconds{1});
    auto broken = std::make_unique<ScriptedChannel>("broken", 100);
    auto healthy = std::make_unique<ScriptedChannel>("healthy", 0);
    auto& broken_ref = *broken;
    auto& healthy_ref = *healthy;
    notifier.add_channel(std::move(broken));
    notifier.add_channel(std::move(healthy));
    notifier.start();

    notifier.enqueue(sample_alert("A:1"));

    ASSERT_TRUE(notifier.drain(milliseconds{5000}));
    EXPECT_EQ(broken_ref.attempts(), 3u);
    EXPECT_EQ(healthy_ref.attempts(), 1u);
    EXPECT_EQ(notifier.delivered(), 1u);
    EXPECT_EQ(notifier.dropped(), 1u);
    notifier.stop();
}

TEST(NotifierTest, ThrowingChannelCountsAsFailedAttempt) {
    Notifier notifier(2, milliseconds{1});
    notifier.add_channel(std::make_unique<ThrowingChannel>());
    notifier.start();

    notifier.enqueue(sample_alert("A:1"));

    ASSERT_TRUE(notifier.drain(milliseconds{5000}));
    EXPECT_EQ(notifier.failed_attempts(), 2u);
    EXPECT_EQ(notifier.dropped(), 1u);
    notifier.stop();
}

TEST(NotifierTest, NoChannelsIsNoop) {
    Notifier notifier(3, milliseconds{1});
    notifier.start();

    notifier.enqueue(sample_alert("A:1"));

    EXPECT_TRUE(notifier.drain(milliseconds{100}));
    EXPECT_EQ(notifier.delivered(), 0u);
    notifier.stop();
}

TEST(WebhookChannelTest, RejectsNonHttpsUrl) {
    auto tls = network::create_ssl_context();
    ASSERT_TRUE(tls.is_ok());

    boost::asio::io_context ioc;
    auto channel = WebhookChannel::create(ioc, tls.value(),
                                          "http://hooks.example.com/x", milliseconds{1000});

    ASSERT_TRUE(channel.is_err());
    EXPECT_EQ(channel.error().kind, ErrorKind::Config);
}

TEST(TlsContextTest, MissingCaBundleIsConfigError) {
    network::TlsSettings settings;
    settings.ca_file = "/nonexistent/riskwatch-ca.pem";

    auto tls = network::create_ssl_context(settings);

    ASSERT_TRUE(tls.is_err());
    EXPECT_EQ(tls.error().kind, ErrorKind::Config);
    EXPECT_NE(tls.error().message.find("riskwatch-ca.pem"), std::string::npos);
}
