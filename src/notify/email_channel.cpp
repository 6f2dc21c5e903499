#include "notify/email_channel.hpp"
#include "output/alert_text.hpp"

namespace riskwatch::notify {

EmailChannel::EmailChannel(boost::asio::io_context& ioc,
                           std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                           network::SmtpSettings settings,
                           std::string from,
                           std::vector<std::string> to)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , settings_(std::move(settings))
    , from_(std::move(from))
    , to_(std::move(to))
{}

void EmailChannel::deliver(const Alert& alert, DeliveryHandler handler) {
    network::MailMessage message{
        .from = from_,
        .to = to_,
        .subject = output::format_alert_subject(alert),
        .body = output::format_alert_body(alert)
    };

    auto client = std::make_shared<network::SmtpClient>(ioc_, ssl_ctx_, settings_);
    client->send(std::move(message), std::move(handler));
}

}  // namespace riskwatch::notify
