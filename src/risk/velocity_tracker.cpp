#include "risk/velocity_tracker.hpp"

namespace riskwatch {

VelocityTracker::VelocityTracker(std::chrono::seconds window)
    : window_(window)
    , windows_([window](const std::string&) { return TimeWindow(window); })
{}

std::size_t VelocityTracker::record(const ClientId& client_id, WallTime timestamp) {
    return windows_.with_entry(client_id, [timestamp](TimeWindow& events) {
        return events.record(timestamp);
    });
}

std::size_t VelocityTracker::count(const ClientId& client_id, WallTime now) {
    if (!windows_.contains(client_id)) {
        return 0;
    }
    return windows_.with_entry(client_id, [now](TimeWindow& events) {
        return events.count(now);
    });
}

std::chrono::seconds VelocityTracker::window() const noexcept {
    return window_;
}

std::size_t VelocityTracker::tracked_clients() const {
    return windows_.size();
}

}  // namespace riskwatch
