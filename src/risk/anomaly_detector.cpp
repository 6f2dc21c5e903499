#include "risk/anomaly_detector.hpp"
#include <cmath>

namespace riskwatch {

AnomalyDetector::AnomalyDetector(std::size_t window_size,
                                 std::size_t min_samples,
                                 double std_dev_threshold)
    : min_samples_(min_samples)
    , threshold_(std_dev_threshold)
    , windows_([window_size](const std::string&) { return RollingStats(window_size); })
{}

std::optional<AnomalyScore> AnomalyDetector::score(const Symbol& symbol, double value) {
    return windows_.with_entry(symbol, [&](RollingStats& stats) -> std::optional<AnomalyScore> {
        std::optional<AnomalyScore> result;

        // Baseline excludes the value being scored
        if (stats.count() >= min_samples_) {
            double std_dev = stats.std_dev();
            // Guard against division by zero
            if (std_dev > 0.0) {
                result = AnomalyScore{
                    .z_score = (value - stats.mean()) / std_dev,
                    .mean = stats.mean(),
                    .std_dev = std_dev,
                    .samples = stats.count()
                };
            }
        }

        stats.add(value);
        return result;
    });
}

bool AnomalyDetector::is_anomalous(const AnomalyScore& score) const noexcept {
    return std::abs(score.z_score) > threshold_;
}

double AnomalyDetector::threshold() const noexcept {
    return threshold_;
}

std::size_t AnomalyDetector::sample_count(const Symbol& symbol) const {
    auto stats = windows_.find(symbol);
    return stats ? stats->count() : 0;
}

}  // namespace riskwatch
