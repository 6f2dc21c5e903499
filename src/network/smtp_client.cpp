#include "network/smtp_client.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <ctime>

namespace {

inline bool set_sni_hostname(SSL* ssl, const char* hostname) {
    return SSL_ctrl(ssl, SSL_CTRL_SET_TLSEXT_HOSTNAME,
                    TLSEXT_NAMETYPE_host_name,
                    const_cast<char*>(hostname)) != 0;
}

std::string rfc2822_date(riskwatch::WallTime date) {
    std::time_t t = std::chrono::system_clock::to_time_t(date);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S +0000", &tm);
    return std::string(buf, n);
}

}  // namespace

namespace riskwatch::network {

SmtpClient::SmtpClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    SmtpSettings settings
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , settings_(std::move(settings))
    , resolver_(ioc)
{}

std::string SmtpClient::base64_encode(std::string_view input) {
    std::string out(4 * ((input.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(out.data()),
        reinterpret_cast<const unsigned char*>(input.data()),
        static_cast<int>(input.size()));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return out;
}

std::string SmtpClient::build_payload(const MailMessage& message, WallTime date) {
    std::string to;
    for (const auto& rcpt : message.to) {
        if (!to.empty()) {
            to += ", ";
        }
        to += rcpt;
    }

    std::string payload;
    payload += "From: " + message.from + "\r\n";
    payload += "To: " + to + "\r\n";
    payload += "Subject: " + message.subject + "\r\n";
    payload += "Date: " + rfc2822_date(date) + "\r\n";
    payload += "MIME-Version: 1.0\r\n";
    payload += "Content-Type: text/plain; charset=utf-8\r\n";
    payload += "Content-Transfer-Encoding: 8bit\r\n";
    payload += "\r\n";

    bool line_start = true;
    for (std::size_t i = 0; i < message.body.size(); ++i) {
        char c = message.body[i];
        if (c == '\r') {
            continue;
        }
        if (c == '\n') {
            payload += "\r\n";
            line_start = true;
            continue;
        }
        if (line_start && c == '.') {
            payload += '.';
        }
        payload += c;
        line_start = false;
    }
    if (!line_start) {
        payload += "\r\n";
    }
    return payload;
}

std::vector<std::string> SmtpClient::split_recipients(std::string_view list) {
    std::vector<std::string> result;
    std::size_t start = 0;
    while (start <= list.size()) {
        auto comma = list.find(',', start);
        auto end = comma == std::string_view::npos ? list.size() : comma;

        std::string_view item = list.substr(start, end - start);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front()))) {
            item.remove_prefix(1);
        }
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back()))) {
            item.remove_suffix(1);
        }
        if (!item.empty()) {
            result.emplace_back(item);
        }

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return result;
}

void SmtpClient::send(MailMessage message, CompletionHandler handler) {
    handler_ = std::move(handler);

    if (message.to.empty()) {
        return fail(Error::delivery("no recipients"));
    }

    steps_.clear();
    steps_.push_back({StepKind::Command, "", 220, "greeting"});
    steps_.push_back({StepKind::Command, "EHLO riskwatch", 250, "EHLO"});
    steps_.push_back({StepKind::Command, "STARTTLS", 220, "STARTTLS"});
    steps_.push_back({StepKind::StartTls, "", 0, "TLS handshake"});
    steps_.push_back({StepKind::Command, "EHLO riskwatch", 250, "EHLO"});
    steps_.push_back({StepKind::Command, "AUTH LOGIN", 334, "AUTH LOGIN"});
    steps_.push_back({StepKind::Command, base64_encode(settings_.username), 334, "username"});
    steps_.push_back({StepKind::Command, base64_encode(settings_.password), 235, "password"});
    steps_.push_back({StepKind::Command, "MAIL FROM:<" + message.from + ">", 250, "MAIL FROM"});
    for (const auto& rcpt : message.to) {
        steps_.push_back({StepKind::Command, "RCPT TO:<" + rcpt + ">", 250, "RCPT TO"});
    }
    steps_.push_back({StepKind::Command, "DATA", 354, "DATA"});
    steps_.push_back({StepKind::Command,
                      build_payload(message, std::chrono::system_clock::now()) + ".", 250,
                      "message"});
    accept_step_ = steps_.size() - 1;
    steps_.push_back({StepKind::Command, "QUIT", 221, "QUIT"});

    spdlog::debug("SMTP {}:{} sending '{}'", settings_.host, settings_.port, message.subject);

    resolver_.async_resolve(
        settings_.host,
        settings_.port,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void SmtpClient::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
        return fail(Error::delivery("resolve: " + ec.message()));
    }

    stream_ = std::make_unique<ssl_stream>(ioc_, *ssl_ctx_);
    if (!set_sni_hostname(stream_->native_handle(), settings_.host.c_str())) {
        return fail(Error::delivery("ssl_sni: " + std::to_string(::ERR_get_error())));
    }

    boost::beast::get_lowest_layer(*stream_).expires_after(settings_.timeout);
    boost::beast::get_lowest_layer(*stream_).async_connect(
        results,
        [self = shared_from_this()](auto ec, auto /*endpoint*/) {
            self->on_connect(ec);
        }
    );
}

void SmtpClient::on_connect(boost::system::error_code ec) {
    if (ec) {
        return fail(Error::delivery("connect: " + ec.message()));
    }
    step_ = 0;
    run_step();
}

void SmtpClient::run_step() {
    if (step_ >= steps_.size()) {
        return complete(ok_status());
    }

    const Step& step = steps_[step_];
    boost::beast::get_lowest_layer(*stream_).expires_after(settings_.timeout);

    if (step.kind == StepKind::StartTls) {
        stream_->async_handshake(
            boost::asio::ssl::stream_base::client,
            [self = shared_from_this()](boost::system::error_code ec) {
                if (ec) {
                    return self->fail(Error::delivery("ssl_handshake: " + ec.message()));
                }
                self->tls_ = true;
                ++self->step_;
                self->run_step();
            }
        );
        return;
    }

    if (step.line.empty()) {
        return read_reply();
    }

    outbox_ = step.line + "\r\n";
    auto on_written = [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
        self->on_write(ec);
    };
    if (tls_) {
        boost::asio::async_write(*stream_, boost::asio::buffer(outbox_), on_written);
    } else {
        boost::asio::async_write(stream_->next_layer(), boost::asio::buffer(outbox_), on_written);
    }
}

void SmtpClient::on_write(boost::system::error_code ec) {
    if (ec) {
        return fail(Error::delivery(steps_[step_].label + " write: " + ec.message()));
    }
    reply_text_.clear();
    read_reply();
}

void SmtpClient::read_reply() {
    auto on_line = [self = shared_from_this()](boost::system::error_code ec, std::size_t bytes) {
        self->on_read(ec, bytes);
    };
    if (tls_) {
        boost::asio::async_read_until(*stream_, boost::asio::dynamic_buffer(inbox_), "\r\n", on_line);
    } else {
        boost::asio::async_read_until(stream_->next_layer(), boost::asio::dynamic_buffer(inbox_),
                                      "\r\n", on_line);
    }
}

void SmtpClient::on_read(boost::system::error_code ec, std::size_t bytes) {
    if (ec) {
        return fail(Error::delivery(steps_[step_].label + " read: " + ec.message()));
    }

    std::string line = inbox_.substr(0, bytes - 2);
    inbox_.erase(0, bytes);

    if (line.size() < 3 || !std::isdigit(static_cast<unsigned char>(line[0])) ||
        !std::isdigit(static_cast<unsigned char>(line[1])) ||
        !std::isdigit(static_cast<unsigned char>(line[2]))) {
        return fail(Error::delivery("malformed SMTP reply: " + line));
    }

    reply_text_ += line.size() > 4 ? line.substr(4) : std::string{};

    // "250-..." continues a multi-line reply, "250 ..." ends it
    if (line.size() > 3 && line[3] == '-') {
        reply_text_ += ' ';
        return read_reply();
    }

    on_reply(std::stoi(line.substr(0, 3)), reply_text_);
}

void SmtpClient::on_reply(int code, const std::string& text) {
    const Step& step = steps_[step_];
    if (code != step.expected) {
        return fail(Error::delivery("SMTP " + step.label + " rejected: " +
                                    std::to_string(code) + " " + text));
    }

    if (step_ == accept_step_) {
        complete(ok_status());
    }

    ++step_;
    run_step();
}

void SmtpClient::fail(Error error) {
    if (handler_) {
        complete(Status::Err(std::move(error)));
        return;
    }
    // Failure after acceptance (QUIT) does not affect the delivery
    spdlog::debug("SMTP after delivery: {}", error.message);
}

void SmtpClient::complete(Status status) {
    if (handler_) {
        auto handler = std::move(handler_);
        handler_ = nullptr;
        handler(std::move(status));
    }
}

}  // namespace riskwatch::network
