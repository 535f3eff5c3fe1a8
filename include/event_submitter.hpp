#pragma once

#include <string>
#include <chrono>
#include "agent_config.hpp"
#include "device_identity.hpp"
#include "http_transport.hpp"
#include "offline_queue.hpp"
#include "trust_token.hpp"

namespace pea {

// Signs events with the device key and delivers them to the message bus,
// parking anything undeliverable in the offline queue.
class EventSubmitter {
public:
    enum class SubmitOutcome {
        Delivered,
        Queued
    };

    EventSubmitter(const AgentConfig& config,
                   const DeviceIdentity& identity,
                   TrustTokenManager& tokens,
                   OfflineQueue& queue,
                   HttpTransport& transport);

    // Serialized QUALITY_CHECK event for a scanned product code.
    std::string build_scan_event(const std::string& code) const;

    /**
     * Renews the token if due, then POSTs the signed payload. A transport
     * failure or non-2xx answer stores the payload in the queue under
     * `queue_name` instead.
     * @throws AgentError only if the queue write itself fails.
     */
    SubmitOutcome submit(const std::string& payload, const std::string& queue_name);

    SubmitOutcome submit_scan(const std::string& code);

    /**
     * One signed POST to /api/supply-chain/event.
     * @throws TransportError, HttpStatusError
     */
    void deliver(const std::string& payload, std::chrono::seconds timeout);

    // Entries are re-signed with the current key and token when sent.
    OfflineQueue::SubmitFn drain_submitter();

    DrainReport drain();

    // Signed status report to /api/monitoring/heartbeat. Throws on failure.
    void send_heartbeat();

    // Raw body of GET /api/updates/pea/latest. Throws on failure.
    std::string check_updates();

    HttpRequest signed_request(const std::string& target,
                               const std::string& payload,
                               std::chrono::seconds timeout);

private:
    const AgentConfig& config_;
    const DeviceIdentity& identity_;
    TrustTokenManager& tokens_;
    OfflineQueue& queue_;
    HttpTransport& transport_;

    HttpResponse send_checked(const HttpRequest& request);
};

}
