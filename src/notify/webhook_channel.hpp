#pragma once

#include "network/https_client.hpp"
#include "notify/notification_channel.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>

namespace riskwatch::notify {

/// Posts alerts to a chat webhook as a colour-coded attachment
class WebhookChannel final : public NotificationChannel {
public:
    /// Validates the URL; a non-https URL is a ConfigError
    [[nodiscard]] static Result<std::unique_ptr<WebhookChannel>> create(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        const std::string& url,
        std::chrono::milliseconds timeout
    );

    [[nodiscard]] std::string_view name() const noexcept override {
        return "webhook";
    }

    void deliver(const Alert& alert, DeliveryHandler handler) override;

private:
    WebhookChannel(boost::asio::io_context& ioc,
                   std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                   network::HttpsTarget target,
                   std::chrono::milliseconds timeout);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    network::HttpsTarget target_;
    std::chrono::milliseconds timeout_;
};

}  // namespace riskwatch::notify
