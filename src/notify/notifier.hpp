#pragma once

#include "notify/notification_channel.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace riskwatch::notify {

/// Delivers alerts to every channel on a dedicated io_context thread
///
/// Each (alert, channel) pair is an independent job: a failing channel is
/// retried with backoff up to max_attempts and then dropped, without
/// affecting the other channels or the caller.
class Notifier {
public:
    /// @param max_attempts Delivery attempts per alert and channel
    /// @param retry_delay Delay before the first retry (doubles per retry)
    Notifier(std::size_t max_attempts, std::chrono::milliseconds retry_delay);
    ~Notifier();

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    /// Context channels must run their network I/O on
    [[nodiscard]] boost::asio::io_context& io_context() noexcept {
        return ioc_;
    }

    /// Register a channel (before start)
    void add_channel(std::unique_ptr<NotificationChannel> channel);

    [[nodiscard]] std::size_t channel_count() const noexcept {
        return channels_.size();
    }

    /// Start the delivery thread
    void start();

    /// Queue alert for every channel (thread-safe, never blocks on I/O)
    void enqueue(const Alert& alert);

    /// Wait until no delivery is pending
    /// @return false if timeout elapsed first
    bool drain(std::chrono::milliseconds timeout);

    /// Finish pending deliveries and join the delivery thread
    void stop();

    [[nodiscard]] std::size_t delivered() const noexcept {
        return delivered_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::size_t failed_attempts() const noexcept {
        return failed_attempts_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::size_t dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    struct Job;

    void attempt(std::shared_ptr<Job> job);
    void on_result(std::shared_ptr<Job> job, Status status);
    void finish_job();

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::thread thread_;
    std::vector<std::unique_ptr<NotificationChannel>> channels_;

    std::size_t max_attempts_;
    std::chrono::milliseconds retry_delay_;

    std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    std::size_t pending_{0};

    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_attempts_{0};
    std::atomic<std::size_t> dropped_{0};
};

}  // namespace riskwatch::notify
