#pragma once

#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "http_transport.hpp"
#include "secret_backend.hpp"

namespace pea::test_support {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("pea-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Replays scripted responses in order and records every request it sees.
// An empty script answers 200 with an empty body.
class FakeTransport : public HttpTransport {
public:
    struct Step {
        bool fail = false;
        HttpResponse response;
    };

    HttpResponse send(const HttpRequest& request) override {
        requests.push_back(request);
        if (on_send) on_send(request);
        if (script.empty()) return HttpResponse{200, ""};

        Step step = script.front();
        script.pop_front();
        if (step.fail) throw TransportError("scripted connection failure");
        return step.response;
    }

    void respond(unsigned status, std::string body = "") {
        script.push_back(Step{false, HttpResponse{status, std::move(body)}});
    }

    void fail_next() {
        script.push_back(Step{true, HttpResponse{}});
    }

    size_t count(const std::string& target) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r.target == target) ++n;
        }
        return n;
    }

    std::deque<Step> script;
    std::vector<HttpRequest> requests;
    // Runs before the scripted step, while the caller is blocked in send().
    std::function<void(const HttpRequest&)> on_send;
};

// In-memory backend with switchable failure modes.
class MemorySecretBackend : public SecretBackend {
public:
    explicit MemorySecretBackend(VaultBackend kind) : kind_(kind) {}

    VaultBackend kind() const override { return kind_; }

    void store(const std::string& service, const std::string& account, const std::string& secret) override {
        ++stores;
        if (unavailable || refuse_store) throw BackendUnavailable("memory backend refuses writes");
        values[service + "/" + account] = secret;
    }

    std::string load(const std::string& service, const std::string& account) override {
        ++loads;
        if (unavailable) throw BackendUnavailable("memory backend offline");
        auto it = values.find(service + "/" + account);
        if (it == values.end()) throw SecretNotFound(account);
        return it->second;
    }

    void remove(const std::string& service, const std::string& account) override {
        if (unavailable) throw BackendUnavailable("memory backend offline");
        values.erase(service + "/" + account);
    }

    std::map<std::string, std::string> values;
    bool unavailable = false;
    bool refuse_store = false;
    int stores = 0;
    int loads = 0;

private:
    VaultBackend kind_;
};

}
