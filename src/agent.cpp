#include "agent.hpp"
#include "agent_logger.hpp"
#include "errors.hpp"

#include <stdexcept>

namespace pea {

Agent::Agent(boost::asio::io_context& ioc,
             const AgentConfig& config,
             EventSubmitter& submitter,
             OfflineQueue& queue)
    : config_(config)
    , submitter_(submitter)
    , queue_(queue)
    , drainer_(std::make_shared<QueueDrainer>(ioc, queue, submitter.drain_submitter()))
    , heartbeat_timer_(ioc)
    , drain_timer_(ioc)
{}

void Agent::start() {
    stopped_ = false;
    heartbeat_timer_.expires_after(std::chrono::seconds(0));
    heartbeat_timer_.async_wait([this](const boost::system::error_code& ec) { on_heartbeat(ec); });
    drain_timer_.expires_after(std::chrono::seconds(0));
    drain_timer_.async_wait([this](const boost::system::error_code& ec) { on_drain(ec); });

    AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::CONFIG, "agent",
                     "heartbeat every " + std::to_string(config_.heartbeat_interval.count()) +
                     "s, drain every " + std::to_string(config_.drain_interval.count()) + "s");
}

void Agent::stop() {
    stopped_ = true;
    heartbeat_timer_.cancel();
    drain_timer_.cancel();
    drainer_->stop();
}

void Agent::schedule_heartbeat() {
    if (stopped_) return;
    heartbeat_timer_.expires_after(config_.heartbeat_interval);
    heartbeat_timer_.async_wait([this](const boost::system::error_code& ec) { on_heartbeat(ec); });
}

void Agent::schedule_drain() {
    if (stopped_) return;
    drain_timer_.expires_after(config_.drain_interval);
    drain_timer_.async_wait([this](const boost::system::error_code& ec) { on_drain(ec); });
}

void Agent::on_heartbeat(const boost::system::error_code& ec) {
    if (ec || stopped_) return;

    try {
        submitter_.send_heartbeat();
        ++heartbeats_sent_;
    } catch (const AgentError&) {
        // Logged by send_heartbeat; try again next interval.
    }
    schedule_heartbeat();
}

void Agent::on_drain(const boost::system::error_code& ec) {
    if (ec || stopped_) return;

    try {
        queue_.prune_by_age(config_.queue_retention_days);
    } catch (const std::exception& e) {
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::QUEUE_PRUNE,
                         queue_.dir().filename().string(), e.what());
    }

    // A pass still in its backoff from the previous tick keeps going.
    if (drainer_->running()) {
        schedule_drain();
        return;
    }

    drainer_->start([this](const DrainReport&) {
        ++drain_passes_;
    });
    schedule_drain();
}

}
