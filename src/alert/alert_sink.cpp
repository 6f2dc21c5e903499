#include "alert/alert_sink.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <string>
#include <unordered_set>

namespace riskwatch {

AlertSink::AlertSink(storage::RiskStore& store, notify::Notifier* notifier)
    : store_(store)
    , notifier_(notifier)
{}

void AlertSink::add_listener(AlertListener listener) {
    listeners_.push_back(std::move(listener));
}

Status AlertSink::emit(const Alert& alert) {
    auto status = persist_and_announce(alert);
    if (status.is_err()) {
        spdlog::error("Failed to persist alert {}: {}", alert.id, status.error().describe());
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.push_back(alert);
    }
    return status;
}

std::size_t AlertSink::flush_pending() {
    std::vector<Alert> retry;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        retry.swap(pending_);
    }
    if (retry.empty()) {
        return 0;
    }

    std::vector<Alert> still_pending;
    for (const auto& alert : retry) {
        auto status = persist_and_announce(alert);
        if (status.is_err()) {
            still_pending.push_back(alert);
        }
    }

    if (!still_pending.empty()) {
        spdlog::warn("{} alert(s) still waiting for persistence", still_pending.size());
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.insert(pending_.begin(), still_pending.begin(), still_pending.end());
    return pending_.size();
}

std::size_t AlertSink::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

std::vector<Alert> AlertSink::pending() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_;
}

void AlertSink::committed(const std::vector<Alert>& alerts) {
    if (alerts.empty()) {
        return;
    }

    std::unordered_set<std::string> stored;
    for (const auto& alert : alerts) {
        stored.insert(alert.id);
    }
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                      [&stored](const Alert& alert) {
                                          return stored.count(alert.id) > 0;
                                      }),
                       pending_.end());
    }

    for (const auto& alert : alerts) {
        emitted_.fetch_add(1, std::memory_order_relaxed);
        announce(alert);
    }
}

Status AlertSink::persist_and_announce(const Alert& alert) {
    auto row_id = store_.insert_alert(alert);
    if (row_id.is_err()) {
        return Status::Err(row_id.error());
    }

    emitted_.fetch_add(1, std::memory_order_relaxed);
    announce(alert);
    return ok_status();
}

void AlertSink::announce(const Alert& alert) {
    // Each output is isolated: a throwing listener is logged and skipped
    for (const auto& listener : listeners_) {
        try {
            listener(alert);
        } catch (const std::exception& e) {
            spdlog::error("Alert listener failed on {}: {}", alert.id, e.what());
        }
    }

    // Delivery failures are the notifier's concern and never undo persistence
    if (notifier_ != nullptr) {
        try {
            notifier_->enqueue(alert);
        } catch (const std::exception& e) {
            spdlog::error("Could not queue {} for delivery: {}", alert.id, e.what());
        }
    }
}

}  // namespace riskwatch
