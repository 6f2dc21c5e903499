#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace riskwatch::network {

/// SMTP submission server and credentials
struct SmtpSettings {
    std::string host;
    std::string port = "587";
    std::string username;
    std::string password;
    std::chrono::milliseconds timeout{5000};
};

/// Plain-text mail
struct MailMessage {
    std::string from;
    std::vector<std::string> to;
    std::string subject;
    std::string body;
};

/// One-shot async SMTP client: STARTTLS, AUTH LOGIN, one message
/// Create one instance per message; it keeps itself alive until the handler runs
class SmtpClient : public std::enable_shared_from_this<SmtpClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using ssl_stream = boost::asio::ssl::stream<boost::beast::tcp_stream>;
    using CompletionHandler = std::function<void(Status)>;

    SmtpClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        SmtpSettings settings
    );

    SmtpClient(const SmtpClient&) = delete;
    SmtpClient& operator=(const SmtpClient&) = delete;

    /// Deliver message; handler runs once the server accepts or rejects it
    void send(MailMessage message, CompletionHandler handler);

    /// RFC 4648 base64 (used for AUTH LOGIN)
    [[nodiscard]] static std::string base64_encode(std::string_view input);

    /// Headers plus body with CRLF line endings and leading dots doubled
    [[nodiscard]] static std::string build_payload(const MailMessage& message, WallTime date);

    /// Recipients from a comma separated list, trimmed, empties dropped
    [[nodiscard]] static std::vector<std::string> split_recipients(std::string_view list);

private:
    enum class StepKind {
        Command,   // send a line (or nothing, for the greeting) and expect a reply code
        StartTls   // upgrade the connection
    };

    struct Step {
        StepKind kind;
        std::string line;
        int expected;
        std::string label;  // logged instead of line (credentials)
    };

    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::system::error_code ec);
    void run_step();
    void on_write(boost::system::error_code ec);
    void read_reply();
    void on_read(boost::system::error_code ec, std::size_t bytes);
    void on_reply(int code, const std::string& text);
    void fail(Error error);
    void complete(Status status);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    SmtpSettings settings_;
    tcp::resolver resolver_;
    std::unique_ptr<ssl_stream> stream_;
    bool tls_{false};

    std::vector<Step> steps_;
    std::size_t step_{0};
    std::size_t accept_step_{0};  // the server owns the message once this step succeeds
    std::string outbox_;
    std::string inbox_;
    std::string reply_text_;

    CompletionHandler handler_;
};

}  // namespace riskwatch::network
