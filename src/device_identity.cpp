#include "device_identity.hpp"
#include "agent_logger.hpp"
#include "codec.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <openssl/crypto.h>

namespace pea {

DeviceIdentity DeviceIdentity::load_or_create(SecretStore& store, const std::string& account, const HostIdentity& host) {
    std::string seed = store.load_or_generate(account, &DeviceIdentity::generate_seed);
    DeviceIdentity identity(seed, host);
    OPENSSL_cleanse(&seed[0], seed.size());

    AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::IDENTITY,
                     AgentLogger::blind(identity.device_id()), "device key ready");
    return identity;
}

DeviceIdentity::DeviceIdentity(const std::string& seed, const HostIdentity& host)
    : device_id_(make_device_id(host))
{
    if (seed.size() != SEED_SIZE) {
        throw SecretCorrupt("device key has length " + std::to_string(seed.size()) +
                            ", expected " + std::to_string(SEED_SIZE));
    }

    key_.reset(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                            reinterpret_cast<const unsigned char*>(seed.data()), seed.size()));
    if (!key_) {
        throw SecretCorrupt("device key rejected by Ed25519");
    }

    size_t len = PUBLIC_KEY_SIZE;
    public_key_.resize(PUBLIC_KEY_SIZE);
    if (EVP_PKEY_get_raw_public_key(key_.get(), public_key_.data(), &len) != 1 || len != PUBLIC_KEY_SIZE) {
        throw AgentError("cannot derive Ed25519 public key");
    }
}

std::string DeviceIdentity::public_key_b64() const {
    return Codec::base64_encode(public_key_);
}

std::vector<unsigned char> DeviceIdentity::sign(const std::string& payload) const {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw AgentError("EVP_MD_CTX_new failed");

    std::vector<unsigned char> signature(SIGNATURE_SIZE);
    size_t sig_len = signature.size();
    bool ok = EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, key_.get()) == 1 &&
              EVP_DigestSign(ctx, signature.data(), &sig_len,
                             reinterpret_cast<const unsigned char*>(payload.data()), payload.size()) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok || sig_len != SIGNATURE_SIZE) {
        throw AgentError("Ed25519 signing failed");
    }
    return signature;
}

std::string DeviceIdentity::make_device_id(const HostIdentity& host) {
    std::string id = host.hostname + "-" + host.username;
    std::transform(id.begin(), id.end(), id.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return id;
}

std::string DeviceIdentity::generate_seed() {
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (!pctx) throw AgentError("EVP_PKEY_CTX_new_id failed");

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen_init(pctx) != 1 || EVP_PKEY_keygen(pctx, &pkey) != 1) {
        EVP_PKEY_CTX_free(pctx);
        throw AgentError("Ed25519 key generation failed");
    }
    EVP_PKEY_CTX_free(pctx);

    std::string seed(SEED_SIZE, '\0');
    size_t len = seed.size();
    int rc = EVP_PKEY_get_raw_private_key(pkey, reinterpret_cast<unsigned char*>(&seed[0]), &len);
    EVP_PKEY_free(pkey);
    if (rc != 1 || len != SEED_SIZE) {
        throw AgentError("cannot export Ed25519 private key");
    }
    return seed;
}

void DeviceIdentity::reset(SecretStore& store, const std::string& account) {
    store.remove_everywhere(account);
    AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::IDENTITY,
                     account, "device key wiped");
}

}
