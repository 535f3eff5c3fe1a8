#include <gtest/gtest.h>
#include "event_submitter.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "test_fakes.hpp"

using namespace pea;
using pea::test_support::FakeTransport;
using pea::test_support::MemorySecretBackend;
using pea::test_support::TempDir;
namespace json = boost::json;

class EventSubmitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset();
        config.host = HostIdentity{"edge-01", "alice"};
        config.data_dir = dir.path();

        auto k = std::make_unique<MemorySecretBackend>(VaultBackend::NativeKeyring);
        keyring = k.get();
        store = std::make_unique<SecretStore>("kmp-pea", VaultBackend::NativeKeyring, std::move(k),
                                              std::make_unique<MemorySecretBackend>(VaultBackend::EncryptedFile));
        identity = std::make_unique<DeviceIdentity>(
            DeviceIdentity::load_or_create(*store, config.device_key_account, config.host));
        queue = std::make_unique<OfflineQueue>(config.queue_dir(), BlobCipher::derive_host_key(config.host),
                                               std::chrono::milliseconds(0));
        tokens = std::make_unique<TrustTokenManager>(config, *store, transport);
        submitter = std::make_unique<EventSubmitter>(config, *identity, *tokens, *queue, transport);
    }

    // Checks the signature headers against the request body.
    void expect_signed(const HttpRequest& req) {
        EXPECT_EQ(req.header("X-PEA-Device-Id"), "edge-01-alice");
        EXPECT_EQ(req.header("X-PEA-Public-Key"), identity->public_key_b64());
        EXPECT_EQ(req.header("X-PEA-Payload-Hash"), Codec::sha256_hex(req.body));
        EXPECT_EQ(req.header("X-PEA-Nonce").size(), 36u);
        EXPECT_FALSE(req.header("X-PEA-Timestamp").empty());

        auto sig = Codec::base64_decode(req.header("X-PEA-Signature"));
        ASSERT_TRUE(sig.has_value());
        EXPECT_TRUE(Codec::verify_ed25519(identity->public_key(), req.body, *sig));
    }

    TempDir dir;
    AgentConfig config;
    FakeTransport transport;
    MemorySecretBackend* keyring = nullptr;
    std::unique_ptr<SecretStore> store;
    std::unique_ptr<DeviceIdentity> identity;
    std::unique_ptr<OfflineQueue> queue;
    std::unique_ptr<TrustTokenManager> tokens;
    std::unique_ptr<EventSubmitter> submitter;
};

TEST_F(EventSubmitterTest, ScanEventShape) {
    auto event = json::parse(submitter->build_scan_event("SKU-42")).as_object();
    EXPECT_EQ(std::string(event.at("productId").as_string()), "SKU-42");
    EXPECT_EQ(std::string(event.at("eventType").as_string()), "QUALITY_CHECK");
    EXPECT_EQ(std::string(event.at("location").as_string()), "edge-01-alice");
    EXPECT_EQ(std::string(event.at("metadata").at("device_id").as_string()), "edge-01-alice");
    EXPECT_TRUE(event.at("metadata").at("ts").is_int64());

    std::string ts(event.at("timestamp").as_string());
    ASSERT_EQ(ts.size(), 24u);
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}

TEST_F(EventSubmitterTest, DeliveredEventIsSigned) {
    transport.respond(201, "{}");

    EXPECT_EQ(submitter->submit_scan("SKU-42"), EventSubmitter::SubmitOutcome::Delivered);
    ASSERT_EQ(transport.requests.size(), 1u);
    const auto& req = transport.requests[0];
    EXPECT_EQ(req.target, "/api/supply-chain/event");
    EXPECT_EQ(req.timeout, config.submit_timeout);
    EXPECT_EQ(req.header("Authorization"), "");
    expect_signed(req);
    EXPECT_EQ(queue->stats().count, 0u);
}

TEST_F(EventSubmitterTest, BearerTokenAttachedWhenHeld) {
    keyring->values["kmp-pea/trust-ack-jwt"] = "opaque-token";
    transport.respond(200, "{}");

    submitter->submit_scan("SKU-42");
    EXPECT_EQ(transport.requests.at(0).header("Authorization"), "Bearer opaque-token");
}

TEST_F(EventSubmitterTest, TransportFailureQueuesUnderCode) {
    transport.fail_next();

    EXPECT_EQ(submitter->submit_scan("SKU-42"), EventSubmitter::SubmitOutcome::Queued);
    auto entries = queue->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "SKU-42");

    auto stored = json::parse(queue->read(entries[0]));
    EXPECT_EQ(std::string(stored.at("productId").as_string()), "SKU-42");
}

TEST_F(EventSubmitterTest, ServerErrorQueues) {
    transport.respond(503, "busy");
    EXPECT_EQ(submitter->submit("{\"event\":\"X\"}", "n1"), EventSubmitter::SubmitOutcome::Queued);
    EXPECT_EQ(queue->stats().count, 1u);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("pea_events_queued_total"), 1.0);
}

TEST_F(EventSubmitterTest, DeliverThrowsStatusError) {
    transport.respond(422, "bad");
    try {
        submitter->deliver("{}", std::chrono::seconds(5));
        FAIL() << "expected HttpStatusError";
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status(), 422u);
    }
}

TEST_F(EventSubmitterTest, DrainResignsQueuedPayloads) {
    queue->enqueue("n1", "{\"event\":\"X\"}");
    keyring->values["kmp-pea/trust-ack-jwt"] = "tok";
    transport.respond(200, "{}");

    auto report = submitter->drain();
    EXPECT_EQ(report.delivered, 1u);
    EXPECT_EQ(queue->stats().count, 0u);

    ASSERT_EQ(transport.requests.size(), 1u);
    const auto& req = transport.requests[0];
    EXPECT_EQ(req.body, "{\"event\":\"X\"}");
    EXPECT_EQ(req.timeout, config.request_timeout);
    EXPECT_EQ(req.header("Authorization"), "Bearer tok");
    expect_signed(req);
}

TEST_F(EventSubmitterTest, DrainKeepsRejectedEntries) {
    queue->enqueue("n1", "{\"event\":\"X\"}");
    transport.respond(500, "");

    auto report = submitter->drain();
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(queue->stats().count, 1u);
}

TEST_F(EventSubmitterTest, HeartbeatReportsQueue) {
    queue->enqueue("n1", "abc");
    transport.respond(200, "{}");

    submitter->send_heartbeat();
    ASSERT_EQ(transport.requests.size(), 1u);
    const auto& req = transport.requests[0];
    EXPECT_EQ(req.target, "/api/monitoring/heartbeat");
    expect_signed(req);

    auto hb = json::parse(req.body).as_object();
    EXPECT_EQ(std::string(hb.at("device_id").as_string()), "edge-01-alice");
    EXPECT_EQ(hb.at("queue_size").to_number<int64_t>(), 1);
    EXPECT_EQ(hb.at("queue_bytes").to_number<int64_t>(),
              static_cast<int64_t>(3 + BlobCipher::NONCE_SIZE + BlobCipher::TAG_SIZE));
    EXPECT_EQ(std::string(hb.at("version").as_string()), config.agent_version);
}

TEST_F(EventSubmitterTest, HeartbeatFailurePropagates) {
    transport.fail_next();
    EXPECT_THROW(submitter->send_heartbeat(), TransportError);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("pea_heartbeat_failures_total"), 1.0);
}

TEST_F(EventSubmitterTest, UpdateCheckReturnsManifest) {
    transport.respond(200, "{\"version\":\"0.3.0\"}");
    EXPECT_EQ(submitter->check_updates(), "{\"version\":\"0.3.0\"}");
    EXPECT_EQ(transport.requests.at(0).method, http::verb::get);
    EXPECT_EQ(transport.requests.at(0).target, "/api/updates/pea/latest");
}
