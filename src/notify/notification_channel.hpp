#pragma once

#include "core/records.hpp"
#include "core/status.hpp"
#include <functional>
#include <string_view>

namespace riskwatch::notify {

/// A destination for alert notifications (chat webhook, e-mail, ...)
class NotificationChannel {
public:
    /// Outcome of one delivery attempt
    using DeliveryHandler = std::function<void(Status)>;

    virtual ~NotificationChannel() = default;

    /// Short name for logs
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Start one delivery attempt
    /// Called on the notifier's io_context; handler must run exactly once
    virtual void deliver(const Alert& alert, DeliveryHandler handler) = 0;
};

}  // namespace riskwatch::notify
