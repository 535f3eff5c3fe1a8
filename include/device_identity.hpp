#pragma once

#include <string>
#include <vector>
#include <memory>
#include <openssl/evp.h>
#include "agent_config.hpp"
#include "secret_store.hpp"

namespace pea {

// Persistent Ed25519 device key plus the host-derived device id.
// The private key stays inside this object; only signatures and the public
// key leave it.
class DeviceIdentity {
public:
    static constexpr size_t SEED_SIZE = 32;
    static constexpr size_t PUBLIC_KEY_SIZE = 32;
    static constexpr size_t SIGNATURE_SIZE = 64;

    /**
     * Loads the device key from the vault, generating and persisting a fresh
     * one on first run.
     * @throws SecretStoreError if neither vault backend is usable.
     * @throws SecretCorrupt if the stored key has the wrong length.
     */
    static DeviceIdentity load_or_create(SecretStore& store, const std::string& account, const HostIdentity& host);

    // Builds an identity from a raw 32-byte Ed25519 private seed.
    DeviceIdentity(const std::string& seed, const HostIdentity& host);

    DeviceIdentity(DeviceIdentity&&) = default;
    DeviceIdentity& operator=(DeviceIdentity&&) = default;

    // Lowercase "{hostname}-{username}". Not unique across hosts that share
    // both names; never use it as a cryptographic identifier.
    const std::string& device_id() const { return device_id_; }

    const std::vector<unsigned char>& public_key() const { return public_key_; }
    std::string public_key_b64() const;

    std::vector<unsigned char> sign(const std::string& payload) const;

    static std::string make_device_id(const HostIdentity& host);

    // Fresh random Ed25519 private seed.
    static std::string generate_seed();

    // Deletes the persisted key from both vault backends.
    static void reset(SecretStore& store, const std::string& account);

private:
    struct PkeyDeleter {
        void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
    };

    std::unique_ptr<EVP_PKEY, PkeyDeleter> key_;
    std::vector<unsigned char> public_key_;
    std::string device_id_;
};

}
