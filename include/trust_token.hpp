#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <chrono>
#include <boost/json.hpp>
#include "agent_config.hpp"
#include "http_transport.hpp"
#include "secret_store.hpp"

namespace pea {

class DeviceIdentity;

// Signed registration body sent to /api/provisioning/register.
struct ProvisioningRequest {
    boost::json::object body;
    std::string canonical;
    std::string nonce;
    std::string timestamp_ms;
    std::string hmac_hex;
    std::optional<uint32_t> company_id;

    HttpRequest to_http(std::chrono::seconds timeout) const;
};

// Holds the bus-issued trust token: obtains it by provisioning and swaps it
// for a fresh one when it gets close to expiry.
class TrustTokenManager {
public:
    enum class RenewResult {
        NoToken,
        NotDue,
        Renewed,
        Failed
    };

    enum class TokenState {
        Unprovisioned,
        Provisioned,
        Renewing,
        Expired
    };

    TrustTokenManager(const AgentConfig& config, SecretStore& store, HttpTransport& transport);

    // Compact JSON with object keys sorted at every level.
    static std::string stable_stringify(const boost::json::value& value);

    // Hex HMAC-SHA256 of "canonical|nonce|timestamp" keyed by the provisioning secret.
    static std::string compute_hmac(const std::string& secret,
                                    const std::string& canonical,
                                    const std::string& nonce,
                                    const std::string& timestamp_ms);

    static std::string platform_name();

    static ProvisioningRequest build_registration(const std::string& secret,
                                                  const std::string& device_id,
                                                  const std::string& public_key_b64,
                                                  std::optional<uint32_t> company_id);

    /**
     * Registers the device and persists the returned trust token.
     * @throws ProvisioningError on a non-2xx answer or a response without a token;
     *         nothing is persisted in that case.
     * @throws TransportError if the bus cannot be reached.
     */
    std::string provision(const std::string& secret,
                          const DeviceIdentity& identity,
                          std::optional<uint32_t> company_id);

    std::optional<std::string> current_token();

    // `exp` claim of a JWT-shaped token, read without verifying the signature.
    static std::optional<int64_t> parse_expiry(const std::string& token);

    static bool needs_renewal(int64_t exp, int64_t now, std::chrono::seconds threshold) {
        return exp - now <= threshold.count();
    }

    // Renews the held token when due. Never throws for network or server
    // failures; the previous token is kept.
    RenewResult maybe_renew(int64_t now);

    TokenState state(int64_t now);

private:
    const AgentConfig& config_;
    SecretStore& store_;
    HttpTransport& transport_;
    bool renewing_ = false;

    static std::string extract_trust_ack(const std::string& body);
};

}
