#include "agent_config.hpp"
#include "agent_logger.hpp"

#include <cstdlib>
#include <unistd.h>
#include <pwd.h>
#include <limits.h>

namespace pea {

HostIdentity HostIdentity::detect() {
    HostIdentity id;

    char host[HOST_NAME_MAX + 1] = {0};
    if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
        id.hostname = host;
    } else {
        id.hostname = "unknown-host";
    }

    if (struct passwd* pw = getpwuid(geteuid()); pw && pw->pw_name) {
        id.username = pw->pw_name;
    } else if (const char* user = std::getenv("USER")) {
        id.username = user;
    } else {
        id.username = "unknown";
    }
    return id;
}

std::filesystem::path default_data_dir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "pea-agent";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "pea-agent";
    }
    return std::filesystem::current_path() / ".pea-agent";
}

void apply_env_overrides(AgentConfig& config) {
    if (const char* e = std::getenv("PEA_BUS_URL")) config.bus_url = e;
    if (const char* e = std::getenv("PEA_COMPANY_ID")) {
        config.company_id = static_cast<uint32_t>(std::stoul(e));
    }
    if (const char* e = std::getenv("PEA_DATA_DIR")) config.data_dir = e;
    if (const char* e = std::getenv("PEA_HOSTNAME")) config.host.hostname = e;
    if (const char* e = std::getenv("PEA_USERNAME")) config.host.username = e;

    if (const char* e = std::getenv("PEA_VAULT_BACKEND")) {
        std::string v(e);
        if (v == "file") {
            config.preferred_backend = VaultBackend::EncryptedFile;
        } else if (v == "keyring") {
            config.preferred_backend = VaultBackend::NativeKeyring;
        } else {
            AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::CONFIG,
                             "PEA_VAULT_BACKEND", "Unknown backend '" + v + "', keeping " +
                             to_string(config.preferred_backend));
        }
    }

    if (const char* e = std::getenv("PEA_HEARTBEAT_SEC")) config.heartbeat_interval = std::chrono::seconds(std::stoll(e));
    if (const char* e = std::getenv("PEA_DRAIN_SEC")) config.drain_interval = std::chrono::seconds(std::stoll(e));
    if (const char* e = std::getenv("PEA_QUEUE_RETENTION_DAYS")) config.queue_retention_days = std::stoi(e);
    if (const char* e = std::getenv("PEA_RENEW_THRESHOLD_SEC")) config.renew_threshold = std::chrono::seconds(std::stoll(e));
}

AgentConfig load_agent_config() {
    AgentConfig config;
    config.host = HostIdentity::detect();
    config.data_dir = default_data_dir();
    apply_env_overrides(config);
    return config;
}

std::string to_string(VaultBackend backend) {
    switch (backend) {
        case VaultBackend::NativeKeyring: return "keyring";
        case VaultBackend::EncryptedFile: return "file";
        default: return "unknown";
    }
}

}
