#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdlib>

#include "agent.hpp"
#include "agent_config.hpp"
#include "agent_logger.hpp"
#include "blob_cipher.hpp"
#include "device_identity.hpp"
#include "errors.hpp"
#include "event_submitter.hpp"
#include "http_transport.hpp"
#include "metrics.hpp"
#include "offline_queue.hpp"
#include "secret_store.hpp"
#include "time_util.hpp"
#include "trust_token.hpp"

namespace net = boost::asio;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--bus URL] [--company ID] <command> [options]\n"
              << "Commands:\n"
              << "  status                     Show device identity, token and queue state\n"
              << "  provision --secret S       Register this device and store the trust token\n"
              << "  submit <code>              Sign and submit a scan event (queued on failure)\n"
              << "  queue-drain                Retry every queued event once\n"
              << "  queue-prune [--days N]     Delete queued events older than N days\n"
              << "  heartbeat                  Send one heartbeat\n"
              << "  run                        Heartbeat and queue drain loop\n"
              << "  reset --secret S           New device key, then provision again\n"
              << "  uninstall                  Wipe device key, trust token and queue\n"
              << "  update-check               Print the latest update manifest\n"
              << "Options:\n"
              << "  --bus URL       Message bus base URL (PEA_BUS_URL)\n"
              << "  --company ID    Company id sent on provisioning (PEA_COMPANY_ID)\n"
              << "  --insecure      Skip TLS certificate verification\n"
              << "  --help, -h      Show this help\n";
}

const char* token_state_name(pea::TrustTokenManager::TokenState state) {
    using S = pea::TrustTokenManager::TokenState;
    switch (state) {
        case S::Unprovisioned: return "unprovisioned";
        case S::Provisioned: return "provisioned";
        case S::Renewing: return "renewing";
        case S::Expired: return "expired";
    }
    return "unknown";
}

// Components shared by every command, built once the configuration is final.
struct Runtime {
    const pea::AgentConfig& config;
    std::unique_ptr<pea::SecretStore> store;
    pea::OfflineQueue queue;
    pea::BeastHttpTransport transport;
    pea::TrustTokenManager tokens;
    std::optional<pea::DeviceIdentity> identity;
    std::unique_ptr<pea::EventSubmitter> submitter;

    explicit Runtime(const pea::AgentConfig& cfg)
        : config(cfg)
        , store(pea::SecretStore::from_config(cfg))
        , queue(cfg.queue_dir(), pea::BlobCipher::derive_host_key(cfg.host), cfg.drain_backoff)
        , transport(cfg.bus_url, cfg.verify_tls_peer, "pea-agent/" + cfg.agent_version)
        , tokens(cfg, *store, transport)
    {}

    pea::DeviceIdentity& device() {
        if (!identity) {
            identity.emplace(pea::DeviceIdentity::load_or_create(*store, config.device_key_account, config.host));
        }
        return *identity;
    }

    pea::EventSubmitter& events() {
        if (!submitter) {
            submitter = std::make_unique<pea::EventSubmitter>(config, device(), tokens, queue, transport);
        }
        return *submitter;
    }
};

int cmd_provision(Runtime& rt, const std::string& secret, std::optional<uint32_t> company_id) {
    auto token = rt.tokens.provision(secret, rt.device(), company_id);
    std::cout << "trust_ack: " << token << "\n";
    return 0;
}

}

int main(int argc, char* argv[]) {
    using pea::AgentLogger;
    try {
        pea::AgentConfig config = pea::load_agent_config();

        std::string command;
        std::vector<std::string> positional;
        std::string secret;
        std::optional<uint32_t> command_company;
        std::optional<int> prune_days;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next_value = [&](const std::string& flag) -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(flag + " requires a value");
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--bus") {
                config.bus_url = next_value(arg);
            } else if (arg == "--company") {
                auto id = static_cast<uint32_t>(std::stoul(next_value(arg)));
                // After the command it only applies to provision/reset.
                if (command.empty()) {
                    config.company_id = id;
                } else {
                    command_company = id;
                }
            } else if (arg == "--insecure") {
                config.verify_tls_peer = false;
            } else if (arg == "--secret") {
                secret = next_value(arg);
            } else if (arg == "--days") {
                prune_days = std::stoi(next_value(arg));
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 2;
            } else if (command.empty()) {
                command = arg;
            } else {
                positional.push_back(arg);
            }
        }

        if (command.empty()) {
            print_usage(argv[0]);
            return 2;
        }

        Runtime rt(config);
        const auto company = command_company ? command_company : config.company_id;

        if (command == "status") {
            auto& identity = rt.device();
            auto stats = rt.queue.stats();
            std::cout << "device_id: " << identity.device_id() << "\n"
                      << "public_key_b64: " << identity.public_key_b64() << "\n"
                      << "data_dir: " << config.data_dir.string() << "\n"
                      << "vault: " << pea::to_string(config.preferred_backend) << "\n"
                      << "bus: " << config.bus_url << "\n"
                      << "company_id: " << (config.company_id ? std::to_string(*config.company_id) : "-") << "\n"
                      << "trust_token: " << token_state_name(rt.tokens.state(pea::unix_seconds())) << "\n"
                      << "queue: " << stats.count << " entries, " << stats.total_bytes << " bytes\n"
                      << pea::MetricsRegistry::instance().collect_prometheus();
            return 0;
        }

        if (command == "provision") {
            if (secret.empty()) {
                std::cerr << "provision requires --secret\n";
                return 2;
            }
            return cmd_provision(rt, secret, company);
        }

        if (command == "submit") {
            if (positional.size() != 1) {
                std::cerr << "submit requires exactly one product code\n";
                return 2;
            }
            auto outcome = rt.events().submit_scan(positional[0]);
            std::cout << "submit: "
                      << (outcome == pea::EventSubmitter::SubmitOutcome::Delivered ? "delivered" : "queued")
                      << "\n";
            return 0;
        }

        if (command == "queue-drain") {
            auto report = rt.events().drain();
            std::cout << "queue: delivered=" << report.delivered
                      << " failed=" << report.failed
                      << " corrupt=" << report.corrupt << "\n";
            return report.failed == 0 ? 0 : 1;
        }

        if (command == "queue-prune") {
            auto removed = rt.queue.prune_by_age(prune_days.value_or(config.queue_retention_days));
            std::cout << "queue: pruned " << removed << " entries\n";
            return 0;
        }

        if (command == "heartbeat") {
            rt.events().send_heartbeat();
            std::cout << "heartbeat: sent\n";
            return 0;
        }

        if (command == "run") {
            net::io_context ioc;
            pea::Agent agent(ioc, config, rt.events(), rt.queue);
            agent.start();

            net::signal_set signals(ioc, SIGINT, SIGTERM);
            signals.async_wait([&agent](const boost::system::error_code&, int) {
                AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::CONFIG, "agent",
                                 "Stopping on signal");
                agent.stop();
            });

            ioc.run();
            return 0;
        }

        if (command == "reset") {
            if (secret.empty()) {
                std::cerr << "reset requires --secret\n";
                return 2;
            }
            pea::DeviceIdentity::reset(*rt.store, config.device_key_account);
            return cmd_provision(rt, secret, company);
        }

        if (command == "uninstall") {
            pea::DeviceIdentity::reset(*rt.store, config.device_key_account);
            rt.store->remove_everywhere(config.token_account);
            auto wiped = rt.queue.wipe();
            std::cout << "uninstall: keys and queue wiped (" << wiped << " queued events)\n";
            return 0;
        }

        if (command == "update-check") {
            std::cout << "update_manifest: " << rt.events().check_updates() << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 2;

    } catch (const pea::ProvisioningError& e) {
        std::cerr << "[!] Provisioning failed: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
