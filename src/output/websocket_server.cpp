#include "output/websocket_server.hpp"
#include "output/json_formatter.hpp"
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/read.hpp>
#include <spdlog/spdlog.h>
#include <optional>

namespace riskwatch::output {

namespace {

constexpr Topic kTopics[] = {Topic::Alerts, Topic::Metrics, Topic::Exposures};

std::optional<Topic> parse_topic(std::string_view name) {
    for (Topic topic : kTopics) {
        if (to_string(topic) == name) {
            return topic;
        }
    }
    return std::nullopt;
}

}  // namespace

std::string_view to_string(Topic topic) noexcept {
    switch (topic) {
        case Topic::Alerts:    return "alerts";
        case Topic::Metrics:   return "metrics";
        case Topic::Exposures: return "exposures";
    }
    return "unknown";
}

Result<TopicSet> parse_subscription(std::string_view request) {
    using R = Result<TopicSet>;

    auto json = nlohmann::json::parse(request, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return R::Err(Error::data_integrity("dashboard request is not a JSON object"));
    }

    auto it = json.find("subscribe");
    if (it == json.end() || !it->is_array()) {
        return R::Err(Error::data_integrity("dashboard request has no subscribe list"));
    }

    TopicSet topics = 0;
    for (const auto& entry : *it) {
        if (!entry.is_string()) {
            return R::Err(Error::data_integrity("topic names must be strings"));
        }
        auto name = entry.get<std::string>();
        auto topic = parse_topic(name);
        if (!topic) {
            return R::Err(Error::data_integrity("unknown topic '" + name + "'"));
        }
        topics |= static_cast<TopicSet>(*topic);
    }
    return R::Ok(topics);
}

nlohmann::json subscription_ack(TopicSet topics) {
    auto names = nlohmann::json::array();
    for (Topic topic : kTopics) {
        if (has_topic(topics, topic)) {
            names.push_back(std::string(to_string(topic)));
        }
    }
    return nlohmann::json{
        {"type", "subscribed"},
        {"topics", std::move(names)}
    };
}

// ============================================================================
// WebSocketServer
// ============================================================================

WebSocketServer::WebSocketServer(std::uint16_t port)
    : port_(port)
    , acceptor_(ioc_)
{}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::set_greeting(GreetingProvider greeting) {
    greeting_ = std::move(greeting);
}

void WebSocketServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    try {
        tcp::endpoint endpoint(tcp::v4(), port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
    } catch (const std::exception&) {
        running_ = false;
        throw;
    }

    spdlog::info("Dashboard server listening on port {}", port_);
    do_accept();
    io_thread_ = std::thread([this]() { ioc_.run(); });
}

void WebSocketServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    spdlog::info("Dashboard server stopping ({} client(s), {} message(s) dropped)",
                 client_count(), dropped_messages());

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& session : sessions_) {
            session->close();
        }
    }

    // Handlers run in order: sessions close, then the acceptor, then the loop ends
    boost::asio::post(ioc_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        ioc_.stop();
    });

    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.clear();
}

void WebSocketServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            on_accept(ec, std::move(socket));
        }
    );
}

void WebSocketServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            spdlog::warn("Dashboard accept error: {}", ec.message());
        }
        return;
    }

    auto session = std::make_shared<DashboardSession>(std::move(socket), *this);
    add_session(session);
    session->start();

    if (running_) {
        do_accept();
    }
}

void WebSocketServer::broadcast(Topic topic, const nlohmann::json& message) {
    // One serialization shared by every session
    auto payload = std::make_shared<const std::string>(JsonFormatter::serialize(message));

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& session : sessions_) {
        session->deliver(topic, payload);
    }
}

std::size_t WebSocketServer::client_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

bool WebSocketServer::is_running() const noexcept {
    return running_.load();
}

void WebSocketServer::add_session(std::shared_ptr<DashboardSession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.insert(std::move(session));
}

void WebSocketServer::remove_session(const std::shared_ptr<DashboardSession>& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session);
}

std::vector<DashboardMessage> WebSocketServer::greeting() const {
    if (!greeting_) {
        return {};
    }
    return greeting_();
}

// ============================================================================
// DashboardSession
// ============================================================================

DashboardSession::DashboardSession(tcp::socket socket, WebSocketServer& server)
    : ws_(std::move(socket))
    , server_(server)
{}

void DashboardSession::start() {
    ws_.set_option(boost::beast::websocket::stream_base::timeout::suggested(
        boost::beast::role_type::server
    ));

    ws_.set_option(boost::beast::websocket::stream_base::decorator(
        [](boost::beast::websocket::response_type& res) {
            res.set(boost::beast::http::field::server, "riskwatch/1.0");
        }
    ));

    // Read the HTTP upgrade request ourselves so it can be validated
    boost::beast::http::async_read(
        ws_.next_layer(),
        http_buffer_,
        upgrade_request_,
        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            self->on_http_read(ec);
        }
    );
}

void DashboardSession::on_http_read(boost::system::error_code ec) {
    if (ec || !boost::beast::websocket::is_upgrade(upgrade_request_)) {
        spdlog::debug("Rejected dashboard connection: {}",
                      ec ? ec.message() : std::string("not a WebSocket upgrade"));
        server_.remove_session(shared_from_this());
        return;
    }

    ws_.async_accept(
        upgrade_request_,
        [self = shared_from_this()](boost::system::error_code accept_ec) {
            self->on_accept(accept_ec);
        }
    );
}

void DashboardSession::on_accept(boost::system::error_code ec) {
    if (ec) {
        spdlog::debug("Dashboard handshake failed: {}", ec.message());
        server_.remove_session(shared_from_this());
        return;
    }

    open_ = true;
    spdlog::debug("Dashboard client connected");

    // Current state first, then live broadcasts
    std::vector<DashboardMessage> greeting;
    try {
        greeting = server_.greeting();
    } catch (const std::exception& e) {
        spdlog::error("Dashboard greeting failed, client starts with live updates only: {}",
                      e.what());
    }
    for (auto& message : greeting) {
        enqueue(std::make_shared<const std::string>(std::move(message.payload)));
    }

    do_read();
}

void DashboardSession::do_read() {
    ws_.async_read(
        read_buffer_,
        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            self->on_read(ec);
        }
    );
}

void DashboardSession::on_read(boost::system::error_code ec) {
    if (ec) {
        if (ec != boost::beast::websocket::error::closed) {
            spdlog::debug("Dashboard read error: {}", ec.message());
        }
        open_ = false;
        server_.remove_session(shared_from_this());
        return;
    }

    std::string request = boost::beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    handle_request(request);

    do_read();
}

void DashboardSession::handle_request(std::string_view request) {
    auto topics = parse_subscription(request);
    if (topics.is_err()) {
        spdlog::debug("Ignoring dashboard request: {}", topics.error().describe());
        return;
    }

    topics_.store(topics.value(), std::memory_order_relaxed);
    enqueue(std::make_shared<const std::string>(
        JsonFormatter::serialize(subscription_ack(topics.value()))));
}

void DashboardSession::deliver(Topic topic, std::shared_ptr<const std::string> payload) {
    if (!has_topic(topics_.load(std::memory_order_relaxed), topic)) {
        return;
    }

    // Writes are started from the io thread only
    boost::asio::post(
        ws_.get_executor(),
        [self = shared_from_this(), payload = std::move(payload)]() mutable {
            if (self->open_) {
                self->enqueue(std::move(payload));
            }
        }
    );
}

void DashboardSession::enqueue(std::shared_ptr<const std::string> payload) {
    if (outbox_.size() >= kMaxQueuedMessages) {
        outbox_.pop_front();
        server_.dropped_.fetch_add(1, std::memory_order_relaxed);
    }
    outbox_.push_back(std::move(payload));

    if (!writing_) {
        writing_ = true;
        do_write();
    }
}

void DashboardSession::do_write() {
    if (outbox_.empty() || !open_) {
        writing_ = false;
        return;
    }

    // The front entry stays queued, and alive, until its write completes
    ws_.text(true);
    ws_.async_write(
        boost::asio::buffer(*outbox_.front()),
        [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
            self->on_write(ec);
        }
    );
}

void DashboardSession::on_write(boost::system::error_code ec) {
    if (ec) {
        spdlog::debug("Dashboard write error: {}", ec.message());
        open_ = false;
        writing_ = false;
        server_.remove_session(shared_from_this());
        return;
    }

    outbox_.pop_front();
    do_write();
}

void DashboardSession::close() {
    boost::asio::post(
        ws_.get_executor(),
        [self = shared_from_this()]() {
            if (!self->open_) {
                boost::system::error_code ec;
                self->ws_.next_layer().close(ec);
                return;
            }
            self->open_ = false;
            self->ws_.async_close(
                boost::beast::websocket::close_code::normal,
                [self](boost::system::error_code ec) {
                    if (ec) {
                        spdlog::debug("Dashboard close: {}", ec.message());
                    }
                }
            );
        }
    );
}

}  // namespace riskwatch::output
