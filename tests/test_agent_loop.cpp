#include <gtest/gtest.h>
#include "agent.hpp"
#include "queue_drainer.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "test_fakes.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

using namespace pea;
using pea::test_support::FakeTransport;
using pea::test_support::MemorySecretBackend;
using pea::test_support::TempDir;

class QueueDrainerTest : public ::testing::Test {
protected:
    TempDir dir;
    OfflineQueue queue{dir.path(), BlobCipher::derive_host_key(HostIdentity{"h", "u"}),
                       std::chrono::milliseconds(10)};
    boost::asio::io_context ioc;
};

TEST_F(QueueDrainerTest, DeliversAllEntries) {
    queue.enqueue("a", "1");
    queue.enqueue("b", "2");

    std::string seen;
    auto drainer = std::make_shared<QueueDrainer>(ioc, queue, [&](const std::string& pt) { seen += pt; });

    DrainReport report;
    ASSERT_TRUE(drainer->start([&](const DrainReport& r) { report = r; }));
    EXPECT_FALSE(drainer->start());
    ioc.run();

    EXPECT_EQ(seen, "12");
    EXPECT_EQ(report.delivered, 2u);
    EXPECT_FALSE(drainer->running());
    EXPECT_EQ(queue.stats().count, 0u);
}

TEST_F(QueueDrainerTest, BacksOffAfterFailure) {
    queue.enqueue("a", "fail");
    queue.enqueue("b", "ok");

    auto drainer = std::make_shared<QueueDrainer>(ioc, queue, [](const std::string& pt) {
        if (pt == "fail") throw TransportError("down");
    });

    DrainReport report;
    auto started = std::chrono::steady_clock::now();
    drainer->start([&](const DrainReport& r) { report = r; });
    ioc.run();

    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(10));
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.delivered, 1u);
    EXPECT_EQ(queue.entries().size(), 1u);
}

TEST_F(QueueDrainerTest, EmptyQueueFinishesImmediately) {
    bool done = false;
    auto drainer = std::make_shared<QueueDrainer>(ioc, queue, [](const std::string&) {});
    drainer->start([&](const DrainReport&) { done = true; });
    ioc.run();
    EXPECT_TRUE(done);
}

class AgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset();
        config.host = HostIdentity{"edge-01", "alice"};
        config.data_dir = dir.path();
        config.heartbeat_interval = std::chrono::seconds(3600);
        config.drain_interval = std::chrono::seconds(3600);

        store = std::make_unique<SecretStore>("kmp-pea", VaultBackend::NativeKeyring,
                                              std::make_unique<MemorySecretBackend>(VaultBackend::NativeKeyring),
                                              std::make_unique<MemorySecretBackend>(VaultBackend::EncryptedFile));
        identity = std::make_unique<DeviceIdentity>(
            DeviceIdentity::load_or_create(*store, config.device_key_account, config.host));
        queue = std::make_unique<OfflineQueue>(config.queue_dir(), BlobCipher::derive_host_key(config.host),
                                               std::chrono::milliseconds(0));
        tokens = std::make_unique<TrustTokenManager>(config, *store, transport);
        submitter = std::make_unique<EventSubmitter>(config, *identity, *tokens, *queue, transport);
    }

    TempDir dir;
    AgentConfig config;
    FakeTransport transport;
    std::unique_ptr<SecretStore> store;
    std::unique_ptr<DeviceIdentity> identity;
    std::unique_ptr<OfflineQueue> queue;
    std::unique_ptr<TrustTokenManager> tokens;
    std::unique_ptr<EventSubmitter> submitter;
    boost::asio::io_context ioc;
};

TEST_F(AgentTest, FirstTickSendsHeartbeatAndDrains) {
    queue->enqueue("n1", "{\"event\":\"X\"}");

    Agent agent(ioc, config, *submitter, *queue);
    agent.start();

    boost::asio::steady_timer stopper(ioc, std::chrono::milliseconds(200));
    stopper.async_wait([&](const boost::system::error_code&) { agent.stop(); });
    ioc.run();

    EXPECT_EQ(agent.heartbeats_sent(), 1u);
    EXPECT_EQ(agent.drain_passes(), 1u);
    EXPECT_EQ(transport.count("/api/monitoring/heartbeat"), 1u);
    EXPECT_EQ(transport.count("/api/supply-chain/event"), 1u);
    EXPECT_EQ(queue->stats().count, 0u);
}

TEST_F(AgentTest, HeartbeatFailureDoesNotStopLoop) {
    transport.fail_next();

    Agent agent(ioc, config, *submitter, *queue);
    agent.start();

    boost::asio::steady_timer stopper(ioc, std::chrono::milliseconds(100));
    stopper.async_wait([&](const boost::system::error_code&) { agent.stop(); });
    ioc.run();

    EXPECT_EQ(agent.heartbeats_sent(), 0u);
    EXPECT_EQ(agent.drain_passes(), 1u);
}
