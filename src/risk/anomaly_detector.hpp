#pragma once

#include "core/types.hpp"
#include "risk/keyed_store.hpp"
#include "risk/rolling_stats.hpp"
#include <cstddef>
#include <optional>

namespace riskwatch {

/// Standardized deviation of one value against its symbol's recent values
struct AnomalyScore {
    double z_score;   // (value - mean) / std_dev
    double mean;
    double std_dev;
    std::size_t samples;  // observations the baseline was computed from
};

/// Scores transaction values against a per-symbol rolling distribution
class AnomalyDetector {
public:
    /// @param window_size Most recent values kept per symbol
    /// @param min_samples Observations required before scoring
    /// @param std_dev_threshold |z| above which a value is anomalous (e.g., 3.0)
    AnomalyDetector(std::size_t window_size = 100,
                    std::size_t min_samples = 5,
                    double std_dev_threshold = 3.0);

    /// Score value against the symbol's window, then add it to the window
    /// @return nullopt when the baseline has too few samples or zero spread
    [[nodiscard]] std::optional<AnomalyScore> score(const Symbol& symbol, double value);

    /// Check whether a score breaches the threshold
    [[nodiscard]] bool is_anomalous(const AnomalyScore& score) const noexcept;

    /// Get the threshold
    [[nodiscard]] double threshold() const noexcept;

    /// Observations currently held for a symbol
    [[nodiscard]] std::size_t sample_count(const Symbol& symbol) const;

private:
    std::size_t min_samples_;
    double threshold_;
    KeyedStore<RollingStats> windows_;
};

}  // namespace riskwatch
