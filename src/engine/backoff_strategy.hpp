#pragma once

#include "core/config.hpp"
#include <chrono>
#include <cstddef>
#include <random>

namespace riskwatch {

/// Bounded exponential backoff with random jitter
/// Shared by the feed retry loop and notification redelivery
class BackoffStrategy {
public:
    /// @param base_delay Delay before the first retry
    /// @param max_delay Cap applied before jitter
    /// @param multiplier Growth factor per attempt
    /// @param jitter_factor Random jitter factor (e.g., 0.3 for +/-30%)
    BackoffStrategy(
        std::chrono::milliseconds base_delay = std::chrono::milliseconds{1000},
        std::chrono::milliseconds max_delay = std::chrono::milliseconds{30000},
        double multiplier = 2.0,
        double jitter_factor = 0.3
    );

    /// Poll retries after a store failure, from the engine settings
    [[nodiscard]] static BackoffStrategy for_store(const Config::Engine& engine);

    /// Notification redelivery: doubles from retry_delay up to eight times
    /// that, without jitter
    [[nodiscard]] static BackoffStrategy for_redelivery(std::chrono::milliseconds retry_delay);

    /// Get the next delay with jitter applied and grow the internal delay
    [[nodiscard]] std::chrono::milliseconds next_delay();

    /// Back to the base delay after a success
    void reset();

    /// Current delay (without jitter, without incrementing)
    [[nodiscard]] std::chrono::milliseconds current_delay() const noexcept;

    /// Failed attempts since the last reset
    [[nodiscard]] std::size_t attempt_count() const noexcept;

private:
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    std::chrono::milliseconds current_delay_;
    double multiplier_;
    double jitter_factor_;
    std::size_t attempt_count_{0};

    std::mt19937 rng_{std::random_device{}()};
};

}  // namespace riskwatch
