#pragma once

#include <string>
#include <filesystem>
#include "agent_config.hpp"
#include "blob_cipher.hpp"

namespace pea {

// Abstract interface for persistent storage of secret byte strings keyed by
// (service, account). Implemented by the OS keyring and by an encrypted file
// store; SecretStore fails over between them.
class SecretBackend {
public:
    virtual ~SecretBackend() = default;

    virtual VaultBackend kind() const = 0;

    /**
     * Persists a secret, replacing any previous value.
     * @throws BackendUnavailable if the facility cannot be written.
     */
    virtual void store(const std::string& service, const std::string& account, const std::string& secret) = 0;

    /**
     * Retrieves a secret.
     * @throws SecretNotFound when nothing is stored under the key.
     * @throws SecretCorrupt when a record exists but cannot be decoded.
     * @throws BackendUnavailable when the facility cannot be reached.
     */
    virtual std::string load(const std::string& service, const std::string& account) = 0;

    // Deletes a secret. Removing a missing record is not an error.
    virtual void remove(const std::string& service, const std::string& account) = 0;
};

// Desktop Secret Service keyring, driven through the `secret-tool` utility.
// The keyring holds strings, so secrets are stored base64-encoded.
class KeyringSecretBackend : public SecretBackend {
public:
    explicit KeyringSecretBackend(std::string tool = "secret-tool");

    VaultBackend kind() const override { return VaultBackend::NativeKeyring; }

    void store(const std::string& service, const std::string& account, const std::string& secret) override;
    std::string load(const std::string& service, const std::string& account) override;
    void remove(const std::string& service, const std::string& account) override;

    // True when the keyring utility can be executed on this host.
    bool available() const;

private:
    std::string tool_;
    mutable int availability_ = -1;

    std::string attributes(const std::string& service, const std::string& account) const;
    void require_available() const;
};

// One `{account}.bin` file per secret under the data directory, sealed with a
// host-derived AES-256-GCM key. The service name is implied by the directory.
class FileSecretBackend : public SecretBackend {
public:
    FileSecretBackend(std::filesystem::path dir, const BlobCipher::Key& key);

    VaultBackend kind() const override { return VaultBackend::EncryptedFile; }

    void store(const std::string& service, const std::string& account, const std::string& secret) override;
    std::string load(const std::string& service, const std::string& account) override;
    void remove(const std::string& service, const std::string& account) override;

    std::filesystem::path path_for(const std::string& account) const;

private:
    std::filesystem::path dir_;
    BlobCipher cipher_;
};

}
