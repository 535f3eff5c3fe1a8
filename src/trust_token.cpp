#include "trust_token.hpp"
#include "agent_logger.hpp"
#include "codec.hpp"
#include "device_identity.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "nonce_generator.hpp"
#include "time_util.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace json = boost::json;

namespace pea {

namespace {

// Raises a flag for the lifetime of one renewal attempt.
class FlagGuard {
public:
    explicit FlagGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~FlagGuard() { flag_ = false; }

    FlagGuard(const FlagGuard&) = delete;
    FlagGuard& operator=(const FlagGuard&) = delete;

private:
    bool& flag_;
};

}

HttpRequest ProvisioningRequest::to_http(std::chrono::seconds timeout) const {
    HttpRequest req;
    req.method = http::verb::post;
    req.target = "/api/provisioning/register";
    req.body = json::serialize(body);
    req.timeout = timeout;
    req.headers.emplace_back("X-PEA-Nonce", nonce);
    req.headers.emplace_back("X-PEA-Timestamp", timestamp_ms);
    req.headers.emplace_back("X-PEA-HMAC", hmac_hex);
    if (company_id) {
        req.headers.emplace_back("X-Company-Id", std::to_string(*company_id));
    }
    return req;
}

TrustTokenManager::TrustTokenManager(const AgentConfig& config, SecretStore& store, HttpTransport& transport)
    : config_(config), store_(store), transport_(transport) {}

std::string TrustTokenManager::stable_stringify(const json::value& value) {
    switch (value.kind()) {
        case json::kind::array: {
            std::string out = "[";
            const auto& arr = value.get_array();
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) out += ',';
                out += stable_stringify(arr[i]);
            }
            return out + "]";
        }
        case json::kind::object: {
            const auto& obj = value.get_object();
            std::vector<std::string> keys;
            keys.reserve(obj.size());
            for (const auto& kv : obj) keys.emplace_back(kv.key());
            std::sort(keys.begin(), keys.end());

            std::string out = "{";
            for (size_t i = 0; i < keys.size(); ++i) {
                if (i > 0) out += ',';
                out += json::serialize(json::string(keys[i]));
                out += ':';
                out += stable_stringify(obj.at(keys[i]));
            }
            return out + "}";
        }
        default:
            return json::serialize(value);
    }
}

std::string TrustTokenManager::compute_hmac(const std::string& secret,
                                            const std::string& canonical,
                                            const std::string& nonce,
                                            const std::string& timestamp_ms) {
    const std::string message = canonical + "|" + nonce + "|" + timestamp_ms;

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
              mac, &mac_len)) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return Codec::to_hex(mac, mac_len);
}

std::string TrustTokenManager::platform_name() {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#else
    return "linux";
#endif
}

ProvisioningRequest TrustTokenManager::build_registration(const std::string& secret,
                                                          const std::string& device_id,
                                                          const std::string& public_key_b64,
                                                          std::optional<uint32_t> company_id) {
    ProvisioningRequest req;
    req.body["device_id"] = device_id;
    req.body["public_key_b64"] = public_key_b64;
    json::object metadata;
    metadata["platform"] = platform_name();
    req.body["metadata"] = std::move(metadata);

    req.canonical = stable_stringify(req.body);
    req.nonce = NonceGenerator::uuid_v4();
    req.timestamp_ms = std::to_string(unix_millis());
    req.hmac_hex = compute_hmac(secret, req.canonical, req.nonce, req.timestamp_ms);
    req.company_id = company_id;
    return req;
}

std::string TrustTokenManager::extract_trust_ack(const std::string& body) {
    json::value parsed;
    try {
        parsed = Codec::safe_parse_json(body);
    } catch (const boost::system::system_error&) {
        return {};
    }
    if (!parsed.is_object()) return {};
    const auto* ack = parsed.get_object().if_contains("trust_ack");
    if (!ack || !ack->is_string()) return {};
    return std::string(ack->get_string());
}

std::string TrustTokenManager::provision(const std::string& secret,
                                         const DeviceIdentity& identity,
                                         std::optional<uint32_t> company_id) {
    auto& metrics = MetricsRegistry::instance();
    auto subject = AgentLogger::blind(identity.device_id());

    auto req = build_registration(secret, identity.device_id(), identity.public_key_b64(), company_id);
    HttpResponse res;
    try {
        res = transport_.send(req.to_http(config_.request_timeout));
    } catch (const TransportError& e) {
        metrics.increment_counter("pea_provision_failures_total");
        AgentLogger::log(AgentLogger::Level::ERROR, AgentLogger::EventType::PROVISION_FAILURE, subject, e.what());
        throw;
    }

    if (!res.ok()) {
        metrics.increment_counter("pea_provision_failures_total");
        AgentLogger::log(AgentLogger::Level::ERROR, AgentLogger::EventType::PROVISION_FAILURE, subject,
                         "status " + std::to_string(res.status));
        throw ProvisioningError("registration rejected with status " + std::to_string(res.status));
    }

    auto token = extract_trust_ack(res.body);
    if (token.empty()) {
        metrics.increment_counter("pea_provision_failures_total");
        AgentLogger::log(AgentLogger::Level::ERROR, AgentLogger::EventType::PROVISION_FAILURE, subject,
                         "response carried no trust_ack");
        throw ProvisioningError("registration response carried no trust_ack");
    }

    store_.store_with_fallback(config_.token_account, token);
    metrics.increment_counter("pea_provision_total");
    AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::PROVISION_SUCCESS, subject);
    return token;
}

std::optional<std::string> TrustTokenManager::current_token() {
    auto token = store_.load_any(config_.token_account);
    if (token && token->empty()) return std::nullopt;
    return token;
}

std::optional<int64_t> TrustTokenManager::parse_expiry(const std::string& token) {
    auto first = token.find('.');
    if (first == std::string::npos) return std::nullopt;
    auto second = token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        return std::nullopt;
    }

    auto claims = Codec::base64url_decode(token.substr(first + 1, second - first - 1));
    if (!claims) return std::nullopt;

    json::value parsed;
    try {
        parsed = Codec::safe_parse_json(std::string(claims->begin(), claims->end()));
    } catch (const boost::system::system_error&) {
        return std::nullopt;
    }
    if (!parsed.is_object()) return std::nullopt;

    const auto* exp = parsed.get_object().if_contains("exp");
    if (!exp) return std::nullopt;
    if (exp->is_int64()) return exp->get_int64();
    if (exp->is_uint64() && exp->get_uint64() <= static_cast<uint64_t>(INT64_MAX)) {
        return static_cast<int64_t>(exp->get_uint64());
    }
    return std::nullopt;
}

TrustTokenManager::RenewResult TrustTokenManager::maybe_renew(int64_t now) {
    auto token = current_token();
    if (!token) return RenewResult::NoToken;

    auto exp = parse_expiry(*token);
    if (!exp || !needs_renewal(*exp, now, config_.renew_threshold)) {
        return RenewResult::NotDue;
    }

    auto& metrics = MetricsRegistry::instance();

    HttpRequest req;
    req.method = http::verb::post;
    req.target = "/api/provisioning/renew";
    req.timeout = config_.request_timeout;
    req.headers.emplace_back("Authorization", "Bearer " + *token);

    std::string reason;
    try {
        FlagGuard renewing(renewing_);
        auto res = transport_.send(req);
        if (!res.ok()) {
            reason = "status " + std::to_string(res.status);
        } else {
            auto fresh = extract_trust_ack(res.body);
            if (fresh.empty()) {
                reason = "response carried no trust_ack";
            } else {
                store_.store_with_fallback(config_.token_account, fresh);
            }
        }
    } catch (const AgentError& e) {
        reason = e.what();
    }

    if (!reason.empty()) {
        metrics.increment_counter("pea_token_renew_failures_total");
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::RENEW_FAILURE,
                         config_.token_account, reason + "; keeping current token");
        return RenewResult::Failed;
    }

    metrics.increment_counter("pea_token_renewals_total");
    AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::TOKEN_RENEWED, config_.token_account);
    return RenewResult::Renewed;
}

TrustTokenManager::TokenState TrustTokenManager::state(int64_t now) {
    if (renewing_) return TokenState::Renewing;

    auto token = current_token();
    if (!token) return TokenState::Unprovisioned;

    auto exp = parse_expiry(*token);
    if (exp && *exp <= now) return TokenState::Expired;
    return TokenState::Provisioned;
}

}
