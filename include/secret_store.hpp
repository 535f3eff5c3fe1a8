#pragma once

#include <string>
#include <memory>
#include <functional>
#include <optional>
#include "agent_config.hpp"
#include "secret_backend.hpp"

namespace pea {

// Secret vault for one service name over two backends (OS keyring and
// encrypted file), with the preferred one chosen by configuration.
class SecretStore {
public:
    using Generator = std::function<std::string()>;

    SecretStore(std::string service,
                VaultBackend preferred,
                std::unique_ptr<SecretBackend> keyring,
                std::unique_ptr<SecretBackend> file);

    // Keyring + `{data_dir}/{account}.bin` file backend keyed from the host identity.
    static std::unique_ptr<SecretStore> from_config(const AgentConfig& config);

    SecretStore(const SecretStore&) = delete;
    SecretStore& operator=(const SecretStore&) = delete;

    // --- Single-backend operations (errors propagate) ---
    void store(const std::string& account, const std::string& secret);
    void store(const std::string& account, const std::string& secret, VaultBackend backend);

    std::string load(const std::string& account);
    std::string load(const std::string& account, VaultBackend backend);

    void remove(const std::string& account);
    void remove(const std::string& account, VaultBackend backend);

    /**
     * Returns the stored secret, creating it on first use.
     *
     * Preferred backend: load, else generate and store. If that store fails,
     * the alternate backend is tried the same way. Only when the alternate
     * store also fails is SecretStoreError thrown.
     */
    std::string load_or_generate(const std::string& account, const Generator& generator);

    // --- Both-backend helpers ---
    // First value found, preferred backend then the alternate.
    std::optional<std::string> load_any(const std::string& account);

    // Stores in the preferred backend, or in the alternate if that refuses.
    void store_with_fallback(const std::string& account, const std::string& secret);

    // Best-effort removal from both backends (device reset / uninstall).
    void remove_everywhere(const std::string& account);

    VaultBackend preferred() const { return preferred_; }
    const std::string& service() const { return service_; }

private:
    std::string service_;
    VaultBackend preferred_;
    std::unique_ptr<SecretBackend> keyring_;
    std::unique_ptr<SecretBackend> file_;

    SecretBackend& backend(VaultBackend kind);
    static VaultBackend alternate(VaultBackend kind);
};

}
