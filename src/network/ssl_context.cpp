#include "network/ssl_context.hpp"
#include <spdlog/spdlog.h>

namespace riskwatch::network {

Result<std::shared_ptr<boost::asio::ssl::context>> create_ssl_context(const TlsSettings& settings) {
    using R = Result<std::shared_ptr<boost::asio::ssl::context>>;
    namespace ssl = boost::asio::ssl;

    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    ctx->set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1
    );

    boost::system::error_code ec;
    ctx->set_default_verify_paths(ec);
    if (ec) {
        spdlog::warn("System CA store unavailable: {}", ec.message());
    }

    if (!settings.ca_file.empty()) {
        ctx->load_verify_file(settings.ca_file, ec);
        if (ec) {
            return R::Err(Error::config("cannot load CA bundle '" + settings.ca_file +
                                        "': " + ec.message()));
        }
    }

    if (settings.verify_peer) {
        ctx->set_verify_mode(ssl::verify_peer);
    } else {
        spdlog::warn("TLS certificate verification is disabled for notifications");
        ctx->set_verify_mode(ssl::verify_none);
    }

    return R::Ok(std::move(ctx));
}

}  // namespace riskwatch::network
