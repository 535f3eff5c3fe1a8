#include <gtest/gtest.h>
#include "device_identity.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "test_fakes.hpp"

using namespace pea;
using pea::test_support::MemorySecretBackend;
using pea::test_support::TempDir;

class DeviceIdentityTest : public ::testing::Test {
protected:
    TempDir dir;
    AgentConfig config;

    void SetUp() override {
        config.host = HostIdentity{"Edge-01", "Alice"};
        config.data_dir = dir.path();
        config.vault_service = "kmp-pea-test";
        config.preferred_backend = VaultBackend::EncryptedFile;
    }
};

TEST_F(DeviceIdentityTest, DeviceIdIsLowercaseHostUser) {
    EXPECT_EQ(DeviceIdentity::make_device_id(config.host), "edge-01-alice");
}

TEST_F(DeviceIdentityTest, StableAcrossRestarts) {
    std::string first_id;
    std::vector<unsigned char> first_key;
    {
        auto store = SecretStore::from_config(config);
        auto identity = DeviceIdentity::load_or_create(*store, config.device_key_account, config.host);
        first_id = identity.device_id();
        first_key = identity.public_key();
        EXPECT_EQ(identity.device_id(), first_id);
    }

    auto store = SecretStore::from_config(config);
    auto again = DeviceIdentity::load_or_create(*store, config.device_key_account, config.host);
    EXPECT_EQ(again.device_id(), first_id);
    EXPECT_EQ(again.public_key(), first_key);
}

TEST_F(DeviceIdentityTest, SignaturesVerify) {
    auto store = SecretStore::from_config(config);
    auto identity = DeviceIdentity::load_or_create(*store, config.device_key_account, config.host);

    const std::string payload = "{\"productId\":\"SKU-1\"}";
    auto sig = identity.sign(payload);
    ASSERT_EQ(sig.size(), DeviceIdentity::SIGNATURE_SIZE);
    EXPECT_TRUE(Codec::verify_ed25519(identity.public_key(), payload, sig));
    EXPECT_FALSE(Codec::verify_ed25519(identity.public_key(), payload + " ", sig));
}

TEST_F(DeviceIdentityTest, PublicKeyBase64) {
    auto identity = DeviceIdentity(DeviceIdentity::generate_seed(), config.host);
    auto decoded = Codec::base64_decode(identity.public_key_b64());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, identity.public_key());
}

TEST_F(DeviceIdentityTest, RejectsWrongSeedLength) {
    EXPECT_THROW(DeviceIdentity(std::string(31, 'x'), config.host), SecretCorrupt);
}

TEST_F(DeviceIdentityTest, StoredGarbageIsCorrupt) {
    auto store = SecretStore::from_config(config);
    store->store(config.device_key_account, "too-short");
    EXPECT_THROW(DeviceIdentity::load_or_create(*store, config.device_key_account, config.host), SecretCorrupt);
}

TEST_F(DeviceIdentityTest, ResetGivesNewKey) {
    auto store = SecretStore::from_config(config);
    auto before = DeviceIdentity::load_or_create(*store, config.device_key_account, config.host).public_key();

    DeviceIdentity::reset(*store, config.device_key_account);
    auto after = DeviceIdentity::load_or_create(*store, config.device_key_account, config.host).public_key();

    EXPECT_NE(before, after);
}

TEST(DeviceIdentityVaultTest, NoUsableVault) {
    auto k = std::make_unique<MemorySecretBackend>(VaultBackend::NativeKeyring);
    auto f = std::make_unique<MemorySecretBackend>(VaultBackend::EncryptedFile);
    k->unavailable = true;
    f->unavailable = true;
    SecretStore store("kmp-pea", VaultBackend::NativeKeyring, std::move(k), std::move(f));

    EXPECT_THROW(DeviceIdentity::load_or_create(store, "device-ed25519-sk", HostIdentity{"h", "u"}),
                 SecretStoreError);
}
