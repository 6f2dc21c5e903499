#pragma once

#include "core/records.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace riskwatch {

/// Admission decision for a candidate alert
enum class DedupDecision {
    New,         // key unseen or its cooldown has elapsed
    Escalation,  // within cooldown but strictly more severe
    Suppressed   // within cooldown, same or lower severity
};

[[nodiscard]] constexpr std::string_view to_string(DedupDecision decision) noexcept {
    switch (decision) {
        case DedupDecision::New:        return "NEW";
        case DedupDecision::Escalation: return "ESCALATION";
        case DedupDecision::Suppressed: return "SUPPRESSED";
    }
    return "UNKNOWN";
}

/// Suppresses repeats of (alert_type, entity_id) within a cooldown window
/// Cooldown is measured on alert timestamps, not on the wall clock
class AlertDeduplicator {
public:
    explicit AlertDeduplicator(std::chrono::seconds cooldown = std::chrono::seconds{300});

    /// Decide whether alert is emitted; admitted alerts update the key
    [[nodiscard]] DedupDecision admit(const Alert& alert);

    /// Keys with an emission on record
    [[nodiscard]] std::size_t tracked_keys() const;

    [[nodiscard]] std::chrono::seconds cooldown() const noexcept {
        return cooldown_;
    }

private:
    struct LastEmitted {
        WallTime at;
        Severity severity;
    };

    using Key = std::pair<AlertType, std::string>;

    std::chrono::seconds cooldown_;
    mutable std::mutex mutex_;
    std::map<Key, LastEmitted> last_emitted_;
};

}  // namespace riskwatch
