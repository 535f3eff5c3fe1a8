#pragma once

#include <stdexcept>
#include <string>

namespace pea {

// Root of all agent failures.
class AgentError : public std::runtime_error {
public:
    explicit AgentError(const std::string& what) : std::runtime_error(what) {}
};

// No record stored under the requested key.
class SecretNotFound : public AgentError {
public:
    explicit SecretNotFound(const std::string& what) : AgentError(what) {}
};

// A record exists but failed to decrypt or decode.
class SecretCorrupt : public AgentError {
public:
    explicit SecretCorrupt(const std::string& what) : AgentError(what) {}
};

// The backend itself cannot be used (missing facility, I/O failure).
class BackendUnavailable : public AgentError {
public:
    explicit BackendUnavailable(const std::string& what) : AgentError(what) {}
};

// Both vault backends failed to produce usable secret bytes.
class SecretStoreError : public AgentError {
public:
    explicit SecretStoreError(const std::string& what) : AgentError(what) {}
};

// Connection, TLS, or timeout failure before a response was read.
class TransportError : public AgentError {
public:
    explicit TransportError(const std::string& what) : AgentError(what) {}
};

// The server answered with a non-success status.
class HttpStatusError : public AgentError {
public:
    HttpStatusError(unsigned status, const std::string& what)
        : AgentError(what), status_(status) {}

    unsigned status() const { return status_; }

private:
    unsigned status_;
};

// The provisioning handshake did not yield a token.
class ProvisioningError : public AgentError {
public:
    explicit ProvisioningError(const std::string& what) : AgentError(what) {}
};

}
