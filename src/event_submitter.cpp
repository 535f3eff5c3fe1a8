#include "event_submitter.hpp"
#include "agent_logger.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "nonce_generator.hpp"
#include "time_util.hpp"

#include <boost/json.hpp>

namespace json = boost::json;

namespace pea {

EventSubmitter::EventSubmitter(const AgentConfig& config,
                               const DeviceIdentity& identity,
                               TrustTokenManager& tokens,
                               OfflineQueue& queue,
                               HttpTransport& transport)
    : config_(config)
    , identity_(identity)
    , tokens_(tokens)
    , queue_(queue)
    , transport_(transport)
{}

std::string EventSubmitter::build_scan_event(const std::string& code) const {
    json::object metadata;
    metadata["device_id"] = identity_.device_id();
    metadata["ts"] = unix_seconds();

    json::object event;
    event["productId"] = code;
    event["eventType"] = "QUALITY_CHECK";
    event["location"] = identity_.device_id();
    event["timestamp"] = rfc3339_utc_now();
    event["metadata"] = std::move(metadata);
    return json::serialize(event);
}

HttpRequest EventSubmitter::signed_request(const std::string& target,
                                           const std::string& payload,
                                           std::chrono::seconds timeout) {
    HttpRequest req;
    req.method = http::verb::post;
    req.target = target;
    req.body = payload;
    req.timeout = timeout;

    req.headers.emplace_back("X-PEA-Device-Id", identity_.device_id());
    req.headers.emplace_back("X-PEA-Public-Key", identity_.public_key_b64());
    req.headers.emplace_back("X-PEA-Signature", Codec::base64_encode(identity_.sign(payload)));
    req.headers.emplace_back("X-PEA-Payload-Hash", Codec::sha256_hex(payload));
    req.headers.emplace_back("X-PEA-Nonce", NonceGenerator::uuid_v4());
    req.headers.emplace_back("X-PEA-Timestamp", std::to_string(unix_millis()));

    if (auto token = tokens_.current_token()) {
        req.headers.emplace_back("Authorization", "Bearer " + *token);
    }
    return req;
}

HttpResponse EventSubmitter::send_checked(const HttpRequest& request) {
    auto res = transport_.send(request);
    if (!res.ok()) {
        throw HttpStatusError(res.status, request.target + " answered " + std::to_string(res.status));
    }
    return res;
}

void EventSubmitter::deliver(const std::string& payload, std::chrono::seconds timeout) {
    send_checked(signed_request("/api/supply-chain/event", payload, timeout));
}

EventSubmitter::SubmitOutcome EventSubmitter::submit(const std::string& payload, const std::string& queue_name) {
    auto& metrics = MetricsRegistry::instance();
    tokens_.maybe_renew(unix_seconds());

    try {
        deliver(payload, config_.submit_timeout);
        metrics.increment_counter("pea_events_delivered_total");
        AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::SUBMIT_SUCCESS, queue_name);
        return SubmitOutcome::Delivered;
    } catch (const AgentError& e) {
        metrics.increment_counter("pea_events_queued_total");
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::SUBMIT_FAILURE, queue_name,
                         std::string("queued for retry: ") + e.what());
    }

    queue_.enqueue(queue_name, payload);
    return SubmitOutcome::Queued;
}

EventSubmitter::SubmitOutcome EventSubmitter::submit_scan(const std::string& code) {
    return submit(build_scan_event(code), code);
}

OfflineQueue::SubmitFn EventSubmitter::drain_submitter() {
    return [this](const std::string& plaintext) {
        tokens_.maybe_renew(unix_seconds());
        deliver(plaintext, config_.request_timeout);
    };
}

DrainReport EventSubmitter::drain() {
    return queue_.drain(drain_submitter());
}

void EventSubmitter::send_heartbeat() {
    QueueStats stats;
    try {
        stats = queue_.stats();
    } catch (const AgentError& e) {
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::HEARTBEAT,
                         AgentLogger::blind(identity_.device_id()), std::string("queue stats unavailable: ") + e.what());
    }

    json::object hb;
    hb["device_id"] = identity_.device_id();
    hb["timestamp"] = rfc3339_utc_now();
    hb["queue_size"] = stats.count;
    hb["queue_bytes"] = stats.total_bytes;
    hb["version"] = config_.agent_version;

    tokens_.maybe_renew(unix_seconds());
    try {
        send_checked(signed_request("/api/monitoring/heartbeat", json::serialize(hb), config_.request_timeout));
    } catch (const AgentError& e) {
        MetricsRegistry::instance().increment_counter("pea_heartbeat_failures_total");
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::HEARTBEAT,
                         AgentLogger::blind(identity_.device_id()), e.what());
        throw;
    }
    MetricsRegistry::instance().increment_counter("pea_heartbeats_total");
    AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::HEARTBEAT,
                     AgentLogger::blind(identity_.device_id()),
                     "queue_size=" + std::to_string(stats.count));
}

std::string EventSubmitter::check_updates() {
    HttpRequest req;
    req.method = http::verb::get;
    req.target = "/api/updates/pea/latest";
    req.timeout = config_.request_timeout;
    return send_checked(req).body;
}

}
