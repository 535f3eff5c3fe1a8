#include "secret_store.hpp"
#include "agent_logger.hpp"
#include "errors.hpp"
#include "metrics.hpp"

#include <stdexcept>
#include <utility>

namespace pea {

SecretStore::SecretStore(std::string service,
                         VaultBackend preferred,
                         std::unique_ptr<SecretBackend> keyring,
                         std::unique_ptr<SecretBackend> file)
    : service_(std::move(service))
    , preferred_(preferred)
    , keyring_(std::move(keyring))
    , file_(std::move(file))
{
    if (!keyring_ || !file_) {
        throw std::invalid_argument("SecretStore requires both backends");
    }
}

std::unique_ptr<SecretStore> SecretStore::from_config(const AgentConfig& config) {
    return std::make_unique<SecretStore>(
        config.vault_service,
        config.preferred_backend,
        std::make_unique<KeyringSecretBackend>(),
        std::make_unique<FileSecretBackend>(config.data_dir, BlobCipher::derive_host_key(config.host)));
}

SecretBackend& SecretStore::backend(VaultBackend kind) {
    return kind == VaultBackend::NativeKeyring ? *keyring_ : *file_;
}

VaultBackend SecretStore::alternate(VaultBackend kind) {
    return kind == VaultBackend::NativeKeyring ? VaultBackend::EncryptedFile : VaultBackend::NativeKeyring;
}

void SecretStore::store(const std::string& account, const std::string& secret) {
    store(account, secret, preferred_);
}

void SecretStore::store(const std::string& account, const std::string& secret, VaultBackend kind) {
    backend(kind).store(service_, account, secret);
}

std::string SecretStore::load(const std::string& account) {
    return load(account, preferred_);
}

std::string SecretStore::load(const std::string& account, VaultBackend kind) {
    return backend(kind).load(service_, account);
}

void SecretStore::remove(const std::string& account) {
    remove(account, preferred_);
}

void SecretStore::remove(const std::string& account, VaultBackend kind) {
    backend(kind).remove(service_, account);
}

std::string SecretStore::load_or_generate(const std::string& account, const Generator& generator) {
    SecretBackend& primary = backend(preferred_);
    try {
        return primary.load(service_, account);
    } catch (const AgentError& e) {
        AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::VAULT_FALLBACK,
                         account, to_string(preferred_) + " load failed, generating: " + e.what());
    }

    std::string generated = generator();
    try {
        primary.store(service_, account, generated);
        return generated;
    } catch (const AgentError& e) {
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::VAULT_FALLBACK,
                         account, to_string(preferred_) + " unusable: " + e.what());
    }

    VaultBackend alt_kind = alternate(preferred_);
    SecretBackend& alt = backend(alt_kind);
    MetricsRegistry::instance().increment_counter("pea_vault_fallbacks_total");
    try {
        return alt.load(service_, account);
    } catch (const AgentError& e) {
        AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::VAULT_FALLBACK,
                         account, to_string(alt_kind) + " load failed, generating: " + e.what());
    }

    generated = generator();
    try {
        alt.store(service_, account, generated);
    } catch (const AgentError& e) {
        AgentLogger::log(AgentLogger::Level::CRITICAL, AgentLogger::EventType::VAULT_FAILURE,
                         account, std::string("both vault backends failed: ") + e.what());
        throw SecretStoreError("no usable vault backend for " + account + ": " + e.what());
    }
    return generated;
}

std::optional<std::string> SecretStore::load_any(const std::string& account) {
    for (VaultBackend kind : {preferred_, alternate(preferred_)}) {
        try {
            return backend(kind).load(service_, account);
        } catch (const SecretNotFound&) {
            // try the next backend
        } catch (const AgentError& e) {
            AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::VAULT_FAILURE,
                             account, to_string(kind) + ": " + e.what());
        }
    }
    return std::nullopt;
}

void SecretStore::store_with_fallback(const std::string& account, const std::string& secret) {
    try {
        backend(preferred_).store(service_, account, secret);
        return;
    } catch (const AgentError& e) {
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::VAULT_FALLBACK,
                         account, to_string(preferred_) + " store failed, using " +
                         to_string(alternate(preferred_)) + ": " + e.what());
    }
    backend(alternate(preferred_)).store(service_, account, secret);
}

void SecretStore::remove_everywhere(const std::string& account) {
    for (VaultBackend kind : {VaultBackend::NativeKeyring, VaultBackend::EncryptedFile}) {
        try {
            backend(kind).remove(service_, account);
        } catch (const AgentError& e) {
            AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::VAULT_FAILURE,
                             account, to_string(kind) + " remove failed: " + e.what());
        }
    }
}

}
