#include "queue_drainer.hpp"
#include "agent_logger.hpp"
#include "errors.hpp"

#include <boost/asio/post.hpp>
#include <utility>

namespace net = boost::asio;

namespace pea {

QueueDrainer::QueueDrainer(net::io_context& ioc, OfflineQueue& queue, OfflineQueue::SubmitFn submit)
    : ioc_(ioc)
    , backoff_timer_(ioc)
    , queue_(queue)
    , submit_(std::move(submit))
{}

bool QueueDrainer::start(DoneFn on_done) {
    if (running_) return false;

    try {
        pending_ = queue_.entries();
    } catch (const AgentError& e) {
        AgentLogger::log(AgentLogger::Level::ERROR, AgentLogger::EventType::QUEUE_DRAIN,
                         queue_.dir().filename().string(), e.what());
        return false;
    }

    running_ = true;
    next_ = 0;
    report_ = DrainReport{};
    on_done_ = std::move(on_done);

    net::post(ioc_, [self = shared_from_this()] { self->step(); });
    return true;
}

void QueueDrainer::stop() {
    backoff_timer_.cancel();
    pending_.clear();
    running_ = false;
}

void QueueDrainer::step() {
    if (!running_) return;
    if (next_ >= pending_.size()) {
        finish();
        return;
    }

    const auto& entry = pending_[next_++];
    auto outcome = queue_.attempt(entry, submit_);

    switch (outcome) {
        case OfflineQueue::Outcome::Delivered: ++report_.delivered; break;
        case OfflineQueue::Outcome::Corrupt: ++report_.corrupt; break;
        case OfflineQueue::Outcome::Failed: ++report_.failed; break;
        case OfflineQueue::Outcome::Missing: break;
    }

    if (outcome == OfflineQueue::Outcome::Failed && next_ < pending_.size() && queue_.backoff().count() > 0) {
        backoff_timer_.expires_after(queue_.backoff());
        backoff_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (!ec) self->step();
        });
        return;
    }

    net::post(ioc_, [self = shared_from_this()] { self->step(); });
}

void QueueDrainer::finish() {
    running_ = false;
    pending_.clear();

    if (report_.delivered + report_.failed + report_.corrupt > 0) {
        AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::QUEUE_DRAIN,
                         queue_.dir().filename().string(),
                         "delivered=" + std::to_string(report_.delivered) +
                         " failed=" + std::to_string(report_.failed) +
                         " corrupt=" + std::to_string(report_.corrupt));
    }

    auto done = std::move(on_done_);
    on_done_ = nullptr;
    if (done) done(report_);
}

}
