#pragma once

#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "agent_config.hpp"
#include "event_submitter.hpp"
#include "offline_queue.hpp"
#include "queue_drainer.hpp"

namespace pea {

// Long-running agent loop: heartbeat on one timer, queue drain plus age
// prune on another. Both fire immediately on start().
class Agent {
public:
    Agent(boost::asio::io_context& ioc,
          const AgentConfig& config,
          EventSubmitter& submitter,
          OfflineQueue& queue);

    void start();
    void stop();

    size_t heartbeats_sent() const { return heartbeats_sent_; }
    size_t drain_passes() const { return drain_passes_; }

private:
    const AgentConfig& config_;
    EventSubmitter& submitter_;
    OfflineQueue& queue_;
    std::shared_ptr<QueueDrainer> drainer_;

    boost::asio::steady_timer heartbeat_timer_;
    boost::asio::steady_timer drain_timer_;
    bool stopped_ = false;

    size_t heartbeats_sent_ = 0;
    size_t drain_passes_ = 0;

    void on_heartbeat(const boost::system::error_code& ec);
    void on_drain(const boost::system::error_code& ec);
    void schedule_heartbeat();
    void schedule_drain();
};

}
