#include "output/console_logger.hpp"
#include "output/alert_text.hpp"
#include <spdlog/spdlog.h>

namespace riskwatch::output {

ConsoleLogger::ConsoleLogger(std::chrono::milliseconds interval)
    : interval_(interval)
    , last_output_(std::chrono::steady_clock::now() - interval)  // Allow immediate first log
{}

void ConsoleLogger::log_alert(const Alert& alert) {
    // Format: ALERT [SEVERITY] TYPE ENTITY_TYPE:id | message
    spdlog::warn(
        "ALERT [{}] {} {}:{} | {}",
        to_string(alert.severity),
        to_string(alert.alert_type),
        to_string(alert.entity_type),
        alert.entity_id,
        alert.message
    );
}

void ConsoleLogger::log_snapshot(const RiskMetricsSnapshot& snapshot) {
    spdlog::info(
        "TXNS: {} | EXPOSURE: {} | CLIENTS: {} ({} high risk) | "
        "SYMBOLS: {} ({} high risk) | ALERTS: {}",
        snapshot.total_transactions,
        format_money(snapshot.total_exposure),
        snapshot.active_clients,
        snapshot.high_risk_clients,
        snapshot.active_symbols,
        snapshot.high_risk_symbols,
        snapshot.alerts_generated
    );
}

bool ConsoleLogger::log_progress(std::uint64_t transactions, std::uint64_t alerts,
                                 std::size_t rejected, std::uint64_t duplicates) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        if (!force_next_ && (now - last_output_) < interval_) {
            return false;
        }
        force_next_ = false;
        last_output_ = now;
    }

    spdlog::info("Monitoring: {} transactions processed, {} alerts generated, "
                 "{} rejected, {} replayed",
                 transactions, alerts, rejected, duplicates);
    return true;
}

void ConsoleLogger::force_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    force_next_ = true;
}

}  // namespace riskwatch::output
