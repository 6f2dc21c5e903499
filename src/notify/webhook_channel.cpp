#include "notify/webhook_channel.hpp"
#include "output/json_formatter.hpp"

namespace riskwatch::notify {

Result<std::unique_ptr<WebhookChannel>> WebhookChannel::create(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    const std::string& url,
    std::chrono::milliseconds timeout
) {
    using R = Result<std::unique_ptr<WebhookChannel>>;

    auto target = network::parse_https_url(url);
    if (target.is_err()) {
        return R::Err(target.error());
    }
    return R::Ok(std::unique_ptr<WebhookChannel>(
        new WebhookChannel(ioc, std::move(ssl_ctx), std::move(target).take_value(), timeout)));
}

WebhookChannel::WebhookChannel(boost::asio::io_context& ioc,
                               std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                               network::HttpsTarget target,
                               std::chrono::milliseconds timeout)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , target_(std::move(target))
    , timeout_(timeout)
{}

void WebhookChannel::deliver(const Alert& alert, DeliveryHandler handler) {
    auto payload = output::JsonFormatter::format_webhook_payload(
        alert, std::chrono::system_clock::now());

    auto client = std::make_shared<network::HttpsClient>(ioc_, ssl_ctx_, timeout_);
    client->post(
        target_,
        output::JsonFormatter::serialize(payload),
        "application/json",
        [handler = std::move(handler)](Result<std::string> response) {
            if (response.is_err()) {
                return handler(Status::Err(response.error()));
            }
            handler(ok_status());
        }
    );
}

}  // namespace riskwatch::notify
