#include "risk/alert_deduplicator.hpp"

namespace riskwatch {

AlertDeduplicator::AlertDeduplicator(std::chrono::seconds cooldown)
    : cooldown_(cooldown)
{}

DedupDecision AlertDeduplicator::admit(const Alert& alert) {
    std::lock_guard<std::mutex> lock(mutex_);

    Key key{alert.alert_type, alert.entity_id};
    auto it = last_emitted_.find(key);
    if (it == last_emitted_.end()) {
        last_emitted_.emplace(std::move(key), LastEmitted{alert.timestamp, alert.severity});
        return DedupDecision::New;
    }

    LastEmitted& last = it->second;
    DedupDecision decision;
    if (alert.timestamp - last.at >= cooldown_) {
        decision = DedupDecision::New;
    } else if (alert.severity > last.severity) {
        decision = DedupDecision::Escalation;
    } else {
        return DedupDecision::Suppressed;
    }

    last = LastEmitted{alert.timestamp, alert.severity};
    return decision;
}

std::size_t AlertDeduplicator::tracked_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_emitted_.size();
}

}  // namespace riskwatch
