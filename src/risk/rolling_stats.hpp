#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstddef>
#include <deque>

namespace riskwatch {

/// Count-bounded ring of values with online mean and variance
class RollingStats {
public:
    /// @param window_size Number of most recent values kept
    explicit RollingStats(std::size_t window_size = 100);

    /// Add a value, evicting the oldest one once the window is full
    void add(double value);

    /// Number of values in the window
    [[nodiscard]] std::size_t count() const noexcept;

    /// Rolling mean (0.0 if empty)
    [[nodiscard]] double mean() const noexcept;

    /// Rolling population standard deviation (0.0 with fewer than 2 values)
    [[nodiscard]] double std_dev() const noexcept;

    [[nodiscard]] std::size_t window_size() const noexcept;

    void clear();

private:
    std::deque<double> values_;
    std::size_t window_size_;

    // Welford's algorithm for online variance
    double mean_{0.0};
    double m2_{0.0};  // Sum of squared differences from mean
};

/// Time-bounded window of event timestamps
/// Entries at or before (latest - horizon) are evicted lazily on access
class TimeWindow {
public:
    explicit TimeWindow(std::chrono::seconds horizon = std::chrono::seconds{60});

    /// Record an event and return the number of events in (at - horizon, at]
    std::size_t record(WallTime at);

    /// Events in (now - horizon, now]; evicts stale entries
    std::size_t count(WallTime now);

    [[nodiscard]] std::chrono::seconds horizon() const noexcept;

private:
    void evict(WallTime now);

    std::deque<WallTime> events_;
    std::chrono::seconds horizon_;
};

}  // namespace riskwatch
