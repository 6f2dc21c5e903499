#include "risk/rolling_stats.hpp"
#include <cmath>

namespace riskwatch {

RollingStats::RollingStats(std::size_t window_size)
    : window_size_(window_size == 0 ? 1 : window_size)
{}

void RollingStats::add(double value) {
    values_.push_back(value);

    // Welford update for the new value
    auto n = static_cast<double>(values_.size());
    double delta = value - mean_;
    mean_ += delta / n;
    double delta2 = value - mean_;
    m2_ += delta * delta2;

    if (values_.size() > window_size_) {
        // Reverse the Welford update for the evicted value
        double old_value = values_.front();
        values_.pop_front();

        auto remaining = static_cast<double>(values_.size());
        if (remaining > 0.0) {
            double old_delta = old_value - mean_;
            mean_ = (mean_ * (remaining + 1.0) - old_value) / remaining;
            double old_delta2 = old_value - mean_;
            m2_ -= old_delta * old_delta2;
            // Clamp m2_ to avoid negative values due to floating point errors
            if (m2_ < 0.0) m2_ = 0.0;
        } else {
            mean_ = 0.0;
            m2_ = 0.0;
        }
    }
}

std::size_t RollingStats::count() const noexcept {
    return values_.size();
}

double RollingStats::mean() const noexcept {
    if (values_.empty()) {
        return 0.0;
    }
    return mean_;
}

double RollingStats::std_dev() const noexcept {
    if (values_.size() < 2) {
        return 0.0;
    }
    double variance = m2_ / static_cast<double>(values_.size());
    return std::sqrt(variance);
}

std::size_t RollingStats::window_size() const noexcept {
    return window_size_;
}

void RollingStats::clear() {
    values_.clear();
    mean_ = 0.0;
    m2_ = 0.0;
}

// ============================================================================
// TimeWindow
// ============================================================================

TimeWindow::TimeWindow(std::chrono::seconds horizon)
    : horizon_(horizon)
{}

std::size_t TimeWindow::record(WallTime at) {
    events_.push_back(at);
    evict(at);
    return events_.size();
}

std::size_t TimeWindow::count(WallTime now) {
    evict(now);
    return events_.size();
}

std::chrono::seconds TimeWindow::horizon() const noexcept {
    return horizon_;
}

void TimeWindow::evict(WallTime now) {
    const WallTime cutoff = now - horizon_;
    while (!events_.empty() && events_.front() <= cutoff) {
        events_.pop_front();
    }
}

}  // namespace riskwatch
