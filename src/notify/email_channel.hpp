#pragma once

#include "network/smtp_client.hpp"
#include "notify/notification_channel.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>
#include <vector>

namespace riskwatch::notify {

/// Sends alerts as plain-text e-mail over SMTP with STARTTLS
class EmailChannel final : public NotificationChannel {
public:
    EmailChannel(boost::asio::io_context& ioc,
                 std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                 network::SmtpSettings settings,
                 std::string from,
                 std::vector<std::string> to);

    [[nodiscard]] std::string_view name() const noexcept override {
        return "email";
    }

    void deliver(const Alert& alert, DeliveryHandler handler) override;

private:
    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    network::SmtpSettings settings_;
    std::string from_;
    std::vector<std::string> to_;
};

}  // namespace riskwatch::notify
