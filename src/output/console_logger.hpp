#pragma once

#include "core/records.hpp"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

namespace riskwatch::output {

/// Console output for alerts and engine progress
class ConsoleLogger {
public:
    /// Create a console logger
    /// @param interval Minimum time between progress outputs
    explicit ConsoleLogger(std::chrono::milliseconds interval);

    /// Log an alert (always logs, not rate limited)
    void log_alert(const Alert& alert);

    /// Log a metrics snapshot (always logs)
    void log_snapshot(const RiskMetricsSnapshot& snapshot);

    /// Log running totals (respects rate limiting)
    /// @return true if logged, false if rate limited
    bool log_progress(std::uint64_t transactions, std::uint64_t alerts,
                      std::size_t rejected, std::uint64_t duplicates);

    /// Force next log_progress to output regardless of rate limit
    void force_next();

private:
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::chrono::steady_clock::time_point last_output_;
    bool force_next_{true};  // Always log first one
};

}  // namespace riskwatch::output
