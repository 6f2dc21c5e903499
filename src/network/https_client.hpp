#pragma once

#include "core/status.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace riskwatch::network {

/// Host, port and request target of an https:// URL
struct HttpsTarget {
    std::string host;
    std::string port = "443";
    std::string target = "/";
};

/// Split an https:// URL; anything else is a ConfigError
[[nodiscard]] Result<HttpsTarget> parse_https_url(std::string_view url);

/// One-shot async HTTPS POST client
/// Create one instance per request; it keeps itself alive until the handler runs
class HttpsClient : public std::enable_shared_from_this<HttpsClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using ssl_stream = boost::asio::ssl::stream<boost::beast::tcp_stream>;

    /// Response handler callback: body on 2xx, NotificationDelivery error otherwise
    using ResponseHandler = std::function<void(Result<std::string>)>;

    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared SSL context
    /// @param timeout Limit for each network step
    HttpsClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        std::chrono::milliseconds timeout
    );

    ~HttpsClient();

    HttpsClient(const HttpsClient&) = delete;
    HttpsClient& operator=(const HttpsClient&) = delete;

    /// Perform an async POST request
    /// @param target Parsed destination
    /// @param body Request body
    /// @param content_type Value for the Content-Type header
    /// @param handler Called exactly once with the outcome
    void post(
        const HttpsTarget& target,
        std::string body,
        std::string_view content_type,
        ResponseHandler handler
    );

private:
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::system::error_code ec);
    void on_ssl_handshake(boost::system::error_code ec);
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_shutdown();
    void fail(const std::string& what, boost::system::error_code ec);
    void complete(Result<std::string> result);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::chrono::milliseconds timeout_;
    tcp::resolver resolver_;
    std::unique_ptr<ssl_stream> stream_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> req_;
    boost::beast::http::response<boost::beast::http::string_body> res_;

    HttpsTarget target_;
    ResponseHandler handler_;
};

}  // namespace riskwatch::network
