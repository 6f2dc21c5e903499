#pragma once

#include "core/status.hpp"
#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>

namespace riskwatch::network {

/// TLS options for outbound notification connections
struct TlsSettings {
    bool verify_peer = true;
    std::string ca_file;  // optional PEM bundle trusted in addition to the system store
};

/// Create a TLS 1.2+ client context shared by the webhook and SMTP clients
/// An unreadable CA bundle is a ConfigError
[[nodiscard]] Result<std::shared_ptr<boost::asio::ssl::context>>
create_ssl_context(const TlsSettings& settings = {});

}  // namespace riskwatch::network
