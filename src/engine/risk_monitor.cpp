#include "engine/risk_monitor.hpp"
#include "network/smtp_client.hpp"
#include "network/ssl_context.hpp"
#include "notify/email_channel.hpp"
#include "notify/webhook_channel.hpp"
#include "output/json_formatter.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <csignal>
#include <spdlog/spdlog.h>
#include <thread>

namespace riskwatch {

namespace {

// Threads running the scheduling io_context: one for polls, one for snapshots
constexpr std::size_t kSchedulerThreads = 2;

}  // namespace

RiskMonitor::RiskMonitor(Config config, storage::RiskStore& store)
    : config_(std::move(config))
    , store_(store)
    , poll_strand_(boost::asio::make_strand(ioc_))
    , snapshot_strand_(boost::asio::make_strand(ioc_))
    , poll_timer_(poll_strand_)
    , snapshot_timer_(snapshot_strand_)
    , backoff_(BackoffStrategy::for_store(config_.engine))
{}

RiskMonitor::~RiskMonitor() {
    request_shutdown();
    finish();
}

Status RiskMonitor::initialize() {
    auto stored = store_.read_thresholds_config();
    if (stored.is_err()) {
        return Status::Err(stored.error());
    }
    auto applied = config_.apply_threshold_overrides(stored.value());
    if (applied.is_err()) {
        return applied;
    }
    if (!stored.value().empty()) {
        spdlog::info("Applied {} threshold(s) from the store", stored.value().size());
    }

    auto valid = config_.validate();
    if (valid.is_err()) {
        return valid;
    }

    // The backoff settings may have been validated only now
    backoff_ = BackoffStrategy::for_store(config_.engine);

    auto notifier = build_notifier();
    if (notifier.is_err()) {
        return notifier;
    }

    sink_ = std::make_unique<AlertSink>(store_, notifier_.get());
    engine_ = std::make_unique<RiskEngine>(config_, *sink_);
    pipeline_ = std::make_unique<BatchPipeline>(*engine_, config_.engine.worker_threads);
    feed_ = std::make_unique<TransactionFeed>(store_, config_.engine.batch_size);
    snapshotter_ = std::make_unique<MetricsSnapshotter>(engine_->aggregator(), store_, *sink_);
    console_ = std::make_unique<output::ConsoleLogger>(config_.output.console_interval);
    if (config_.output.ws_server_port != 0) {
        ws_server_ = std::make_unique<output::WebSocketServer>(config_.output.ws_server_port);
    }

    auto restored = restore_state();
    if (restored.is_err()) {
        return restored;
    }

    wire_outputs();

    if (notifier_) {
        notifier_->start();
    }

    spdlog::info("Risk monitor initialized: {} client(s), {} symbol(s), cursor ({}, {})",
                 engine_->aggregator().clients().size(),
                 engine_->aggregator().symbols().size(),
                 cursor_.timestamp_ms, cursor_.id);
    return ok_status();
}

Status RiskMonitor::build_notifier() {
    const auto& settings = config_.notifications;
    if (!settings.webhook_enabled() && !settings.email_enabled()) {
        spdlog::info("No notification channels configured");
        return ok_status();
    }

    notifier_ = std::make_unique<notify::Notifier>(settings.max_attempts, settings.retry_delay);
    auto tls = network::create_ssl_context(
        network::TlsSettings{settings.tls_verify, settings.tls_ca_file});
    if (tls.is_err()) {
        return Status::Err(tls.error());
    }
    auto ssl_ctx = std::move(tls).take_value();

    if (settings.webhook_enabled()) {
        auto channel = notify::WebhookChannel::create(
            notifier_->io_context(), ssl_ctx, settings.webhook_url, settings.timeout);
        if (channel.is_err()) {
            return Status::Err(channel.error());
        }
        notifier_->add_channel(std::move(channel).take_value());
        spdlog::info("Webhook notifications enabled");
    }

    if (settings.email_enabled()) {
        auto recipients = network::SmtpClient::split_recipients(settings.email_to);
        if (recipients.empty()) {
            return Status::Err(Error::config("email_to lists no recipients"));
        }

        network::SmtpSettings smtp;
        smtp.host = settings.smtp_host;
        smtp.port = settings.smtp_port;
        smtp.username = settings.smtp_username;
        smtp.password = settings.smtp_password;
        smtp.timeout = settings.timeout;

        notifier_->add_channel(std::make_unique<notify::EmailChannel>(
            notifier_->io_context(), ssl_ctx, std::move(smtp),
            settings.email_from, std::move(recipients)));
        spdlog::info("Email notifications enabled for {}", settings.email_to);
    }

    return ok_status();
}

Status RiskMonitor::restore_state() {
    auto clients = store_.list_client_exposures();
    if (clients.is_err()) {
        return Status::Err(clients.error());
    }
    auto symbols = store_.list_symbol_exposures();
    if (symbols.is_err()) {
        return Status::Err(symbols.error());
    }
    engine_->aggregator().hydrate(clients.value(), symbols.value());

    auto cursor = store_.load_cursor();
    if (cursor.is_err()) {
        return Status::Err(cursor.error());
    }
    {
        std::lock_guard<std::mutex> lock(cursor_mutex_);
        cursor_ = cursor.value().value_or(FeedMarker{});
    }

    auto summary = store_.alert_summary();
    if (summary.is_err()) {
        return Status::Err(summary.error());
    }
    sink_->set_baseline(summary.value().total);

    return ok_status();
}

void RiskMonitor::wire_outputs() {
    sink_->add_listener([this](const Alert& alert) {
        console_->log_alert(alert);
    });
    snapshotter_->add_listener([this](const RiskMetricsSnapshot& snapshot) {
        console_->log_snapshot(snapshot);
    });

    if (!ws_server_) {
        return;
    }

    using output::Topic;
    sink_->add_listener([this](const Alert& alert) {
        ws_server_->broadcast(Topic::Alerts, output::JsonFormatter::format_alert(alert));
    });
    snapshotter_->add_listener([this](const RiskMetricsSnapshot& snapshot) {
        ws_server_->broadcast(Topic::Metrics, output::JsonFormatter::format_metrics(snapshot));
        const auto& aggregator = engine_->aggregator();
        ws_server_->broadcast(Topic::Exposures, output::JsonFormatter::format_exposures(
            aggregator.clients(), aggregator.symbols()));
    });

    ws_server_->set_greeting([this]() {
        using output::JsonFormatter;
        std::vector<output::DashboardMessage> messages;
        if (auto latest = snapshotter_->latest()) {
            messages.push_back({Topic::Metrics,
                                JsonFormatter::serialize(JsonFormatter::format_metrics(*latest))});
        }
        const auto& aggregator = engine_->aggregator();
        messages.push_back({Topic::Exposures,
                            JsonFormatter::serialize(JsonFormatter::format_exposures(
                                aggregator.clients(), aggregator.symbols()))});
        return messages;
    });
}

void RiskMonitor::run() {
    if (!engine_) {
        spdlog::error("Risk monitor started without initialize()");
        return;
    }

    spdlog::info("Starting riskwatch: polling every {}ms, batches of {}",
                 config_.engine.poll_interval.count(), config_.engine.batch_size);

    if (ws_server_) {
        try {
            ws_server_->start();
        } catch (const std::exception& e) {
            spdlog::error("Dashboard server unavailable on port {}: {}",
                          config_.output.ws_server_port, e.what());
            ws_server_.reset();
        }
    }

    signals_ = std::make_unique<boost::asio::signal_set>(ioc_, SIGINT, SIGTERM);
    signals_->async_wait([this](boost::system::error_code ec, int signal_number) {
        if (!ec) {
            spdlog::info("Received signal {}, shutting down", signal_number);
            request_shutdown();
        }
    });

    schedule_poll(std::chrono::milliseconds{0});
    schedule_snapshot();

    // Polls and snapshots run on their own strands so a slow batch never
    // delays the snapshot cadence
    std::vector<std::thread> threads;
    for (std::size_t i = 1; i < kSchedulerThreads; ++i) {
        threads.emplace_back([this]() { ioc_.run(); });
    }
    ioc_.run();
    for (auto& thread : threads) {
        thread.join();
    }

    finish();
    spdlog::info("Risk monitor shutdown complete");
}

void RiskMonitor::request_shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return;
    }

    // Cancel on the owning strands; an in-flight batch completes first
    boost::asio::post(poll_strand_, [this]() { poll_timer_.cancel(); });
    boost::asio::post(snapshot_strand_, [this]() { snapshot_timer_.cancel(); });
    boost::asio::post(ioc_, [this]() {
        if (signals_) {
            boost::system::error_code ignored;
            signals_->cancel(ignored);
        }
    });
}

bool RiskMonitor::shutdown_requested() const noexcept {
    return shutdown_requested_.load();
}

FeedMarker RiskMonitor::cursor() const {
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    return cursor_;
}

Result<CycleReport> RiskMonitor::run_cycle() {
    const FeedMarker since = cursor();

    auto polled = feed_->poll(since);
    if (polled.is_err()) {
        return Result<CycleReport>::Err(polled.error());
    }
    FeedBatch batch = std::move(polled).take_value();

    CycleReport report;
    report.fetched = batch.transactions.size() + batch.rejected;
    report.rejected = batch.rejected;
    report.full = batch.full;
    report.batch = pipeline_->run(batch.transactions);

    if (report.batch.failed > 0) {
        spdlog::error("{} transaction(s) failed inside the engine", report.batch.failed);
    }

    // Exposures carry the client watermarks, so they land together with the
    // checkpoint and with any alert not stored yet, or not at all
    storage::BatchCommit commit = collect_exposures(report.batch);
    commit.alerts = sink_->pending();
    if (batch.next_marker != since) {
        commit.cursor = batch.next_marker;
    }

    if (!commit.empty()) {
        auto committed = store_.commit_batch(commit);
        if (committed.is_err()) {
            if (!commit.alerts.empty()) {
                spdlog::warn("Holding checkpoint: {} alert(s) not yet stored",
                             commit.alerts.size());
            }
            return Result<CycleReport>::Err(committed.error());
        }
        sink_->committed(commit.alerts);
    }

    if (commit.cursor) {
        std::lock_guard<std::mutex> lock(cursor_mutex_);
        cursor_ = *commit.cursor;
    }

    report.cursor = cursor();
    return Result<CycleReport>::Ok(std::move(report));
}

storage::BatchCommit RiskMonitor::collect_exposures(const BatchReport& report) const {
    const auto& aggregator = engine_->aggregator();
    storage::BatchCommit commit;

    for (const auto& client_id : report.touched_clients) {
        if (auto exposure = aggregator.client(client_id)) {
            commit.clients.push_back(std::move(*exposure));
        }
    }
    for (const auto& symbol : report.touched_symbols) {
        if (auto exposure = aggregator.symbol(symbol)) {
            commit.symbols.push_back(std::move(*exposure));
        }
    }

    return commit;
}

Result<RiskMetricsSnapshot> RiskMonitor::publish_snapshot() {
    return snapshotter_->publish(std::chrono::system_clock::now());
}

void RiskMonitor::finish() {
    if (!engine_ || finished_.exchange(true)) {
        return;
    }

    if (auto remaining = sink_->flush_pending(); remaining > 0) {
        spdlog::error("{} alert(s) could not be persisted before shutdown", remaining);
    }

    auto snapshot = publish_snapshot();
    if (snapshot.is_err()) {
        spdlog::warn("Final snapshot failed: {}", snapshot.error().describe());
    }

    if (notifier_) {
        if (!notifier_->drain(config_.notifications.timeout * 2)) {
            spdlog::warn("Notification queue not drained before shutdown");
        }
        notifier_->stop();
        spdlog::info("Notifications: {} delivered, {} dropped",
                     notifier_->delivered(), notifier_->dropped());
    }

    if (ws_server_) {
        ws_server_->stop();
    }

    pipeline_->stop();

    spdlog::info("Processed {} transaction(s), {} alert(s) admitted, {} suppressed",
                 engine_->processed(), engine_->alerts_admitted(),
                 engine_->alerts_suppressed());
}

void RiskMonitor::schedule_poll(std::chrono::milliseconds delay) {
    if (shutdown_requested_.load()) {
        return;
    }
    poll_timer_.expires_after(delay);
    poll_timer_.async_wait(boost::asio::bind_executor(
        poll_strand_,
        [this](boost::system::error_code ec) { on_poll_timer(ec); }));
}

void RiskMonitor::on_poll_timer(boost::system::error_code ec) {
    if (ec || shutdown_requested_.load()) {
        return;
    }

    auto cycle = run_cycle();
    if (cycle.is_err()) {
        auto delay = backoff_.next_delay();
        spdlog::warn("Poll failed ({}), retrying in {}ms (attempt {})",
                     cycle.error().describe(), delay.count(), backoff_.attempt_count());
        schedule_poll(delay);
        return;
    }

    if (backoff_.attempt_count() > 0) {
        spdlog::info("Store reachable again");
        backoff_.reset();
    }

    console_->log_progress(engine_->processed(), engine_->alerts_admitted(),
                           feed_->total_rejected(), engine_->duplicates());

    // A full batch means more rows are waiting
    schedule_poll(cycle.value().full ? std::chrono::milliseconds{0}
                                     : config_.engine.poll_interval);
}

void RiskMonitor::schedule_snapshot() {
    if (shutdown_requested_.load()) {
        return;
    }
    snapshot_timer_.expires_after(config_.engine.snapshot_interval);
    snapshot_timer_.async_wait(boost::asio::bind_executor(
        snapshot_strand_,
        [this](boost::system::error_code ec) { on_snapshot_timer(ec); }));
}

void RiskMonitor::on_snapshot_timer(boost::system::error_code ec) {
    if (ec || shutdown_requested_.load()) {
        return;
    }

    auto snapshot = publish_snapshot();
    if (snapshot.is_err()) {
        spdlog::warn("Metrics snapshot failed: {}", snapshot.error().describe());
    }

    schedule_snapshot();
}

}  // namespace riskwatch
