#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <optional>
#include <filesystem>

namespace pea {

enum class VaultBackend {
    NativeKeyring,
    EncryptedFile
};

// Host identity strings. Used for the device id and for the weak
// file-encryption key; injected so tests can pin them.
struct HostIdentity {
    std::string hostname;
    std::string username;

    // Reads hostname and login name from the running host.
    static HostIdentity detect();
};

// Agent configuration and runtime policy.
struct AgentConfig {
    // --- Message Bus ---
    std::string bus_url = "http://localhost:3001";
    std::optional<uint32_t> company_id;
    bool verify_tls_peer = true;

    // --- Identity & Storage ---
    HostIdentity host;
    std::filesystem::path data_dir;
    std::string vault_service = "kmp-pea";
    std::string device_key_account = "device-ed25519-sk";
    std::string token_account = "trust-ack-jwt";
    VaultBackend preferred_backend = VaultBackend::NativeKeyring;

    // --- Network Timeouts ---
    std::chrono::seconds submit_timeout{30};
    std::chrono::seconds request_timeout{10};

    // --- Trust Token ---
    std::chrono::seconds renew_threshold{2 * 3600};

    // --- Offline Queue ---
    std::chrono::milliseconds drain_backoff{2000};
    int queue_retention_days = 30;

    // --- Agent Loop ---
    std::chrono::seconds heartbeat_interval{3600};
    std::chrono::seconds drain_interval{30};

    std::string agent_version = "0.2.0";

    std::filesystem::path queue_dir() const { return data_dir / "queue"; }
};

// Default per-user data directory ($XDG_DATA_HOME/pea-agent or ~/.local/share/pea-agent).
std::filesystem::path default_data_dir();

// Builds a config from defaults, the detected host and PEA_* environment variables.
AgentConfig load_agent_config();

// Applies PEA_* environment overrides on top of an existing config.
void apply_env_overrides(AgentConfig& config);

std::string to_string(VaultBackend backend);

}
