#include "engine/backoff_strategy.hpp"
#include <algorithm>
#include <cstdint>

namespace riskwatch {

BackoffStrategy::BackoffStrategy(
    std::chrono::milliseconds base_delay,
    std::chrono::milliseconds max_delay,
    double multiplier,
    double jitter_factor
)
    : base_delay_(base_delay)
    , max_delay_(max_delay)
    , current_delay_(base_delay)
    , multiplier_(multiplier)
    , jitter_factor_(jitter_factor)
{}

BackoffStrategy BackoffStrategy::for_store(const Config::Engine& engine) {
    return BackoffStrategy(engine.retry_delay_initial,
                           engine.retry_delay_max,
                           engine.retry_backoff_multiplier,
                           engine.retry_jitter_factor);
}

BackoffStrategy BackoffStrategy::for_redelivery(std::chrono::milliseconds retry_delay) {
    constexpr int kMaxGrowth = 8;
    return BackoffStrategy(retry_delay, retry_delay * kMaxGrowth, 2.0, 0.0);
}

std::chrono::milliseconds BackoffStrategy::next_delay() {
    ++attempt_count_;

    auto delay = std::min(current_delay_, max_delay_);

    double jitter_multiplier = 1.0;
    if (jitter_factor_ > 0.0) {
        std::uniform_real_distribution<double> dist(
            1.0 - jitter_factor_,
            1.0 + jitter_factor_
        );
        jitter_multiplier = dist(rng_);
    }
    auto jittered = std::chrono::milliseconds{static_cast<std::int64_t>(
        static_cast<double>(delay.count()) * jitter_multiplier
    )};

    // Grow towards the cap
    auto next_count = static_cast<std::int64_t>(
        static_cast<double>(current_delay_.count()) * multiplier_
    );
    current_delay_ = std::min(std::chrono::milliseconds{next_count}, max_delay_);

    return jittered;
}

void BackoffStrategy::reset() {
    current_delay_ = base_delay_;
    attempt_count_ = 0;
}

std::chrono::milliseconds BackoffStrategy::current_delay() const noexcept {
    return current_delay_;
}

std::size_t BackoffStrategy::attempt_count() const noexcept {
    return attempt_count_;
}

}  // namespace riskwatch
