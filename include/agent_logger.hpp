#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace pea {

// Single-line structured logger for agent events.
class AgentLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        CONFIG,
        VAULT_FALLBACK,
        VAULT_FAILURE,
        IDENTITY,
        QUEUE_ENQUEUE,
        QUEUE_DRAIN,
        QUEUE_CORRUPT,
        QUEUE_PRUNE,
        PROVISION_SUCCESS,
        PROVISION_FAILURE,
        TOKEN_RENEWED,
        RENEW_FAILURE,
        SUBMIT_SUCCESS,
        SUBMIT_FAILURE,
        HEARTBEAT,
        TRANSPORT
    };

    /**
     * Writes one log line.
     * @param level Severity; ERROR and CRITICAL go to stderr.
     * @param event Event category.
     * @param subject What the event is about (account, queue entry, endpoint).
     * @param message Optional free text (sanitized before output).
     */
    static void log(Level level, EventType event, const std::string& subject,
                    const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "subject=" << sanitize_log_message(subject);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    /**
     * Blinds an identifying string (device id, user name) with a per-process salt
     * so log lines can be correlated within a run but not mapped back to a host.
     */
    static std::string blind(const std::string& value) {
        std::string data = value + process_salt();
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "dev_" + hs.str();
    }

    // Replaces quotes, backslashes and line breaks with spaces and drops non-printables.
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static const std::string& process_salt() {
        static const std::string salt = [] {
            unsigned char b[16];
            if (RAND_bytes(b, sizeof(b)) != 1) {
                throw std::runtime_error("CSPRNG failure while seeding log salt");
            }
            std::stringstream ss;
            for (unsigned char c : b) ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
            return ss.str();
        }();
        return salt;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::CONFIG: return "CONFIG";
            case EventType::VAULT_FALLBACK: return "VAULT_FALLBACK";
            case EventType::VAULT_FAILURE: return "VAULT_FAILURE";
            case EventType::IDENTITY: return "IDENTITY";
            case EventType::QUEUE_ENQUEUE: return "QUEUE_ENQUEUE";
            case EventType::QUEUE_DRAIN: return "QUEUE_DRAIN";
            case EventType::QUEUE_CORRUPT: return "QUEUE_CORRUPT";
            case EventType::QUEUE_PRUNE: return "QUEUE_PRUNE";
            case EventType::PROVISION_SUCCESS: return "PROVISIONED";
            case EventType::PROVISION_FAILURE: return "PROVISION_FAIL";
            case EventType::TOKEN_RENEWED: return "TOKEN_RENEWED";
            case EventType::RENEW_FAILURE: return "RENEW_FAIL";
            case EventType::SUBMIT_SUCCESS: return "SUBMITTED";
            case EventType::SUBMIT_FAILURE: return "SUBMIT_FAIL";
            case EventType::HEARTBEAT: return "HEARTBEAT";
            case EventType::TRANSPORT: return "TRANSPORT";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
