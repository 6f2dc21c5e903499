#include "notify/notifier.hpp"
#include "engine/backoff_strategy.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace riskwatch::notify {

struct Notifier::Job {
    Job(const Alert& a, NotificationChannel& c, std::chrono::milliseconds retry_delay,
        boost::asio::io_context& ioc)
        : alert(a)
        , channel(c)
        , backoff(BackoffStrategy::for_redelivery(retry_delay))
        , timer(ioc)
    {}

    Alert alert;
    NotificationChannel& channel;
    BackoffStrategy backoff;
    boost::asio::steady_timer timer;
    std::size_t attempts{0};
};

Notifier::Notifier(std::size_t max_attempts, std::chrono::milliseconds retry_delay)
    : work_guard_(boost::asio::make_work_guard(ioc_))
    , max_attempts_(max_attempts == 0 ? 1 : max_attempts)
    , retry_delay_(retry_delay)
{}

Notifier::~Notifier() {
    stop();
}

void Notifier::add_channel(std::unique_ptr<NotificationChannel> channel) {
    spdlog::info("Notification channel enabled: {}", channel->name());
    channels_.push_back(std::move(channel));
}

void Notifier::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this]() {
        ioc_.run();
    });
}

void Notifier::enqueue(const Alert& alert) {
    if (channels_.empty()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_ += channels_.size();
    }

    for (auto& channel : channels_) {
        auto job = std::make_shared<Job>(alert, *channel, retry_delay_, ioc_);
        boost::asio::post(ioc_, [this, job]() {
            attempt(job);
        });
    }
}

void Notifier::attempt(std::shared_ptr<Job> job) {
    ++job->attempts;
    try {
        job->channel.deliver(job->alert, [this, job](Status status) {
            on_result(job, std::move(status));
        });
    } catch (const std::exception& e) {
        on_result(job, Status::Err(Error::delivery(e.what())));
    }
}

void Notifier::on_result(std::shared_ptr<Job> job, Status status) {
    if (status.is_ok()) {
        delivered_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Alert {} delivered via {}", job->alert.id, job->channel.name());
        return finish_job();
    }

    failed_attempts_.fetch_add(1, std::memory_order_relaxed);

    if (job->attempts >= max_attempts_) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("Dropping alert {} for {} after {} attempts: {}",
                      job->alert.id, job->channel.name(), job->attempts,
                      status.error().describe());
        return finish_job();
    }

    auto delay = job->backoff.next_delay();
    spdlog::warn("Delivery of alert {} via {} failed (attempt {}/{}), retrying in {}ms: {}",
                 job->alert.id, job->channel.name(), job->attempts, max_attempts_,
                 delay.count(), status.error().describe());

    job->timer.expires_after(delay);
    job->timer.async_wait([this, job](boost::system::error_code ec) {
        if (ec) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return finish_job();
        }
        attempt(job);
    });
}

void Notifier::finish_job() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (pending_ > 0) {
        --pending_;
    }
    if (pending_ == 0) {
        pending_cv_.notify_all();
    }
}

bool Notifier::drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(pending_mutex_);
    return pending_cv_.wait_for(lock, timeout, [this]() { return pending_ == 0; });
}

void Notifier::stop() {
    work_guard_.reset();
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace riskwatch::notify
