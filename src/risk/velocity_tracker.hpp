#pragma once

#include "core/types.hpp"
#include "risk/keyed_store.hpp"
#include "risk/rolling_stats.hpp"
#include <chrono>
#include <cstddef>

namespace riskwatch {

/// Counts transactions per client within a trailing time window
class VelocityTracker {
public:
    explicit VelocityTracker(std::chrono::seconds window = std::chrono::seconds{60});

    /// Record a transaction and return the client's count in the trailing window
    std::size_t record(const ClientId& client_id, WallTime timestamp);

    /// Client's count in (now - window, now] without recording
    [[nodiscard]] std::size_t count(const ClientId& client_id, WallTime now);

    [[nodiscard]] std::chrono::seconds window() const noexcept;

    /// Clients seen so far
    [[nodiscard]] std::size_t tracked_clients() const;

private:
    std::chrono::seconds window_;
    KeyedStore<TimeWindow> windows_;
};

}  // namespace riskwatch
