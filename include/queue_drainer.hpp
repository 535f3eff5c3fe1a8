#pragma once

#include <memory>
#include <functional>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "offline_queue.hpp"

namespace pea {

// Drains the offline queue one entry per io_context turn. The backoff after
// a failed entry is an async timer wait, so other timers keep firing.
class QueueDrainer : public std::enable_shared_from_this<QueueDrainer> {
public:
    using DoneFn = std::function<void(const DrainReport&)>;

    QueueDrainer(boost::asio::io_context& ioc, OfflineQueue& queue, OfflineQueue::SubmitFn submit);

    // Starts a pass over the current entries. Returns false if one is already running.
    bool start(DoneFn on_done = nullptr);

    void stop();

    bool running() const { return running_; }

private:
    boost::asio::io_context& ioc_;
    boost::asio::steady_timer backoff_timer_;
    OfflineQueue& queue_;
    OfflineQueue::SubmitFn submit_;

    std::vector<QueueEntry> pending_;
    size_t next_ = 0;
    DrainReport report_;
    DoneFn on_done_;
    bool running_ = false;

    void step();
    void finish();
};

}
