#include "network/https_client.hpp"
#include <boost/asio/connect.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace {

// SSL_set_tlsext_host_name is a macro with an old-style cast
inline bool set_sni_hostname(SSL* ssl, const char* hostname) {
    return SSL_ctrl(ssl, SSL_CTRL_SET_TLSEXT_HOSTNAME,
                    TLSEXT_NAMETYPE_host_name,
                    const_cast<char*>(hostname)) != 0;
}

}  // namespace

namespace riskwatch::network {

Result<HttpsTarget> parse_https_url(std::string_view url) {
    constexpr std::string_view scheme = "https://";
    if (url.substr(0, scheme.size()) != scheme) {
        return Result<HttpsTarget>::Err(Error::config("URL must start with https://: " + std::string(url)));
    }

    std::string_view rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);

    HttpsTarget target;
    if (slash != std::string_view::npos) {
        target.target = std::string(rest.substr(slash));
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        target.host = std::string(authority.substr(0, colon));
        target.port = std::string(authority.substr(colon + 1));
        if (target.port.empty() ||
            target.port.find_first_not_of("0123456789") != std::string::npos) {
            return Result<HttpsTarget>::Err(Error::config("Invalid port in URL: " + std::string(url)));
        }
    } else {
        target.host = std::string(authority);
    }

    if (target.host.empty()) {
        return Result<HttpsTarget>::Err(Error::config("Missing host in URL: " + std::string(url)));
    }
    return Result<HttpsTarget>::Ok(std::move(target));
}

HttpsClient::HttpsClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    std::chrono::milliseconds timeout
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , timeout_(timeout)
    , resolver_(ioc)
{}

HttpsClient::~HttpsClient() = default;

void HttpsClient::post(
    const HttpsTarget& target,
    std::string body,
    std::string_view content_type,
    ResponseHandler handler
) {
    target_ = target;
    handler_ = std::move(handler);

    req_.method(boost::beast::http::verb::post);
    req_.target(target_.target);
    req_.version(11);
    req_.set(boost::beast::http::field::host, target_.host);
    req_.set(boost::beast::http::field::user_agent, "riskwatch/1.0");
    req_.set(boost::beast::http::field::content_type, boost::beast::string_view(content_type.data(), content_type.size()));
    req_.body() = std::move(body);
    req_.prepare_payload();

    spdlog::debug("HTTPS POST https://{}:{}{}", target_.host, target_.port, target_.target);

    resolver_.async_resolve(
        target_.host,
        target_.port,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void HttpsClient::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
        return fail("resolve", ec);
    }

    stream_ = std::make_unique<ssl_stream>(ioc_, *ssl_ctx_);

    if (!set_sni_hostname(stream_->native_handle(), target_.host.c_str())) {
        boost::system::error_code ssl_ec{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()
        };
        return fail("ssl_sni", ssl_ec);
    }

    boost::beast::get_lowest_layer(*stream_).expires_after(timeout_);
    boost::beast::get_lowest_layer(*stream_).async_connect(
        results,
        [self = shared_from_this()](auto ec, auto /*endpoint*/) {
            self->on_connect(ec);
        }
    );
}

void HttpsClient::on_connect(boost::system::error_code ec) {
    if (ec) {
        return fail("connect", ec);
    }

    boost::beast::get_lowest_layer(*stream_).expires_after(timeout_);
    stream_->async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void HttpsClient::on_ssl_handshake(boost::system::error_code ec) {
    if (ec) {
        return fail("ssl_handshake", ec);
    }

    boost::beast::get_lowest_layer(*stream_).expires_after(timeout_);
    boost::beast::http::async_write(
        *stream_,
        req_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void HttpsClient::on_write(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return fail("write", ec);
    }

    boost::beast::get_lowest_layer(*stream_).expires_after(timeout_);
    boost::beast::http::async_read(
        *stream_,
        buffer_,
        res_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void HttpsClient::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return fail("read", ec);
    }

    auto code = static_cast<unsigned>(res_.result());
    if (code < 200 || code >= 300) {
        std::string error = "HTTP " + std::to_string(code) + ": " + std::string(res_.reason());
        complete(Result<std::string>::Err(Error::delivery(std::move(error))));
    } else {
        spdlog::debug("HTTPS response: {} bytes", res_.body().size());
        complete(Result<std::string>::Ok(std::move(res_.body())));
    }

    do_shutdown();
}

void HttpsClient::do_shutdown() {
    boost::beast::get_lowest_layer(*stream_).expires_after(timeout_);
    stream_->async_shutdown(
        [self = shared_from_this()](boost::system::error_code ec) {
            // Servers often close without a TLS close_notify
            if (ec && ec != boost::asio::error::eof &&
                ec != boost::asio::ssl::error::stream_truncated) {
                spdlog::debug("SSL shutdown: {}", ec.message());
            }
        }
    );
}

void HttpsClient::fail(const std::string& what, boost::system::error_code ec) {
    complete(Result<std::string>::Err(Error::delivery(what + ": " + ec.message())));
}

void HttpsClient::complete(Result<std::string> result) {
    if (handler_) {
        auto handler = std::move(handler_);
        handler_ = nullptr;
        handler(std::move(result));
    }
}

}  // namespace riskwatch::network
