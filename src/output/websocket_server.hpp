#pragma once

#include "core/status.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace riskwatch::output {

/// Dashboard message streams a client can subscribe to
enum class Topic : std::uint8_t {
    Alerts = 1 << 0,
    Metrics = 1 << 1,
    Exposures = 1 << 2
};

/// Bit set of Topic values
using TopicSet = std::uint8_t;

inline constexpr TopicSet kAllTopics = static_cast<TopicSet>(Topic::Alerts) |
                                       static_cast<TopicSet>(Topic::Metrics) |
                                       static_cast<TopicSet>(Topic::Exposures);

[[nodiscard]] constexpr bool has_topic(TopicSet set, Topic topic) noexcept {
    return (set & static_cast<TopicSet>(topic)) != 0;
}

[[nodiscard]] std::string_view to_string(Topic topic) noexcept;

/// Parse a dashboard request: {"subscribe": ["alerts", "metrics", ...]}
/// An empty list subscribes to nothing; unknown names are a DataIntegrity error
[[nodiscard]] Result<TopicSet> parse_subscription(std::string_view request);

/// Acknowledgement sent back after a subscription change
[[nodiscard]] nlohmann::json subscription_ack(TopicSet topics);

/// One serialized message tagged with its stream
struct DashboardMessage {
    Topic topic;
    std::string payload;
};

class DashboardSession;

/// WebSocket server streaming alerts, metrics and exposures to dashboards
///
/// Runs on its own io_context in a separate thread. Every client starts
/// subscribed to all topics and may narrow that with a subscribe request.
/// A client that cannot keep up loses its oldest queued messages.
class WebSocketServer {
public:
    using tcp = boost::asio::ip::tcp;

    /// Current state a freshly connected client receives before any broadcast
    using GreetingProvider = std::function<std::vector<DashboardMessage>()>;

    /// @param port Port to listen on
    explicit WebSocketServer(std::uint16_t port);

    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /// Set the greeting for new clients (before start)
    void set_greeting(GreetingProvider greeting);

    /// Bind, listen and launch the io thread
    /// @throws boost::system::system_error if the port cannot be bound
    void start();

    void stop();

    /// Send message to every client subscribed to topic (thread-safe)
    void broadcast(Topic topic, const nlohmann::json& message);

    [[nodiscard]] std::size_t client_count() const;

    /// Messages discarded because a client's queue was full
    [[nodiscard]] std::uint64_t dropped_messages() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_running() const noexcept;

private:
    friend class DashboardSession;

    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);
    void add_session(std::shared_ptr<DashboardSession> session);
    void remove_session(const std::shared_ptr<DashboardSession>& session);
    [[nodiscard]] std::vector<DashboardMessage> greeting() const;

    std::uint16_t port_;
    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> dropped_{0};
    GreetingProvider greeting_;

    mutable std::mutex sessions_mutex_;
    std::set<std::shared_ptr<DashboardSession>> sessions_;
};

/// One connected dashboard
/// All state is touched only from the server's io thread
class DashboardSession : public std::enable_shared_from_this<DashboardSession> {
public:
    using tcp = boost::asio::ip::tcp;
    using ws_stream = boost::beast::websocket::stream<tcp::socket>;

    /// Messages queued beyond this are dropped oldest first
    static constexpr std::size_t kMaxQueuedMessages = 1024;

    DashboardSession(tcp::socket socket, WebSocketServer& server);

    /// Read the HTTP upgrade request and accept the WebSocket handshake
    void start();

    /// Queue payload if this client subscribes to topic
    void deliver(Topic topic, std::shared_ptr<const std::string> payload);

    void close();

private:
    void on_http_read(boost::system::error_code ec);
    void on_accept(boost::system::error_code ec);
    void do_read();
    void on_read(boost::system::error_code ec);
    void handle_request(std::string_view request);
    void enqueue(std::shared_ptr<const std::string> payload);
    void do_write();
    void on_write(boost::system::error_code ec);

    ws_stream ws_;
    WebSocketServer& server_;
    boost::beast::flat_buffer read_buffer_;
    boost::beast::flat_buffer http_buffer_;
    boost::beast::http::request<boost::beast::http::string_body> upgrade_request_;

    std::atomic<TopicSet> topics_{kAllTopics};
    std::deque<std::shared_ptr<const std::string>> outbox_;
    bool writing_{false};
    bool open_{false};
};

}  // namespace riskwatch::output
