// Secret backends.
//
//  * Keyring: the freedesktop Secret Service via the `secret-tool` command
//    line utility (libsecret). Values are base64 strings.
//  * File: AES-256-GCM sealed blobs under the agent data directory.

#include "secret_backend.hpp"
#include "codec.hpp"
#include "errors.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include <sys/wait.h>
#include <unistd.h>
#include <openssl/crypto.h>

namespace pea {

namespace {

// Single-quotes an argument for /bin/sh.
std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

// Temporary file that receives the keyring utility's stderr.
class StderrCapture {
public:
    StderrCapture() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "pea-keyring-XXXXXX").string();
        int fd = mkstemp(&tmpl[0]);
        if (fd < 0) {
            throw BackendUnavailable("cannot create keyring stderr capture file");
        }
        close(fd);
        path_ = tmpl;
    }

    ~StderrCapture() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    StderrCapture(const StderrCapture&) = delete;
    StderrCapture& operator=(const StderrCapture&) = delete;

    const std::string& path() const { return path_; }

    std::string text() const {
        std::ifstream in(path_);
        std::string out((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        while (!out.empty() && std::isspace(static_cast<unsigned char>(out.back()))) {
            out.pop_back();
        }
        return out;
    }

private:
    std::string path_;
};

int exit_status(int pclose_result) {
    if (pclose_result == -1) return -1;
    if (WIFEXITED(pclose_result)) return WEXITSTATUS(pclose_result);
    return -1;
}

}

// --- KeyringSecretBackend ---

KeyringSecretBackend::KeyringSecretBackend(std::string tool) : tool_(std::move(tool)) {}

bool KeyringSecretBackend::available() const {
    if (availability_ < 0) {
        std::string cmd = "command -v " + shell_quote(tool_) + " >/dev/null 2>&1";
        availability_ = (std::system(cmd.c_str()) == 0) ? 1 : 0;
    }
    return availability_ == 1;
}

void KeyringSecretBackend::require_available() const {
    if (!available()) {
        throw BackendUnavailable(tool_ + " not found; native keyring unavailable");
    }
}

std::string KeyringSecretBackend::attributes(const std::string& service, const std::string& account) const {
    return "service " + shell_quote(service) + " account " + shell_quote(account);
}

void KeyringSecretBackend::store(const std::string& service, const std::string& account, const std::string& secret) {
    require_available();

    std::string encoded = Codec::base64_encode(secret);
    std::string cmd = shell_quote(tool_) + " store --label=" + shell_quote(service + ":" + account) +
                      " " + attributes(service, account) + " 2>/dev/null";

    FILE* p = popen(cmd.c_str(), "w");
    if (!p) {
        throw BackendUnavailable("popen failed for keyring store");
    }
    size_t written = fwrite(encoded.data(), 1, encoded.size(), p);
    OPENSSL_cleanse(&encoded[0], encoded.size());
    int code = exit_status(pclose(p));
    if (written != encoded.size() || code != 0) {
        throw BackendUnavailable("keyring store failed for " + account + " (exit " + std::to_string(code) + ")");
    }
}

std::string KeyringSecretBackend::load(const std::string& service, const std::string& account) {
    require_available();

    StderrCapture err;
    std::string cmd = shell_quote(tool_) + " lookup " + attributes(service, account) +
                      " 2>" + shell_quote(err.path());
    FILE* p = popen(cmd.c_str(), "r");
    if (!p) {
        throw BackendUnavailable("popen failed for keyring lookup");
    }

    std::string output;
    char buf[512];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), p)) > 0) {
        output.append(buf, n);
    }
    int code = exit_status(pclose(p));

    while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
        output.pop_back();
    }

    // secret-tool exits 1 silently when no item matches, and exits 1 with a
    // diagnostic when the Secret Service or the D-Bus session is unreachable.
    // An empty value is what older agents left behind instead of deleting, so
    // it counts as absent.
    if (output.empty()) {
        std::string diagnostic = err.text();
        if ((code != 0 && code != 1) || !diagnostic.empty()) {
            throw BackendUnavailable("keyring lookup failed for " + account + " (exit " + std::to_string(code) +
                                     (diagnostic.empty() ? std::string(")") : "): " + diagnostic));
        }
        throw SecretNotFound("no keyring item for " + service + "/" + account);
    }

    auto decoded = Codec::base64_decode(output);
    OPENSSL_cleanse(&output[0], output.size());
    if (!decoded) {
        throw SecretCorrupt("keyring item for " + account + " is not valid base64");
    }
    std::string secret(decoded->begin(), decoded->end());
    OPENSSL_cleanse(decoded->data(), decoded->size());
    return secret;
}

void KeyringSecretBackend::remove(const std::string& service, const std::string& account) {
    require_available();

    std::string cmd = shell_quote(tool_) + " clear " + attributes(service, account) + " >/dev/null 2>&1";
    int code = exit_status(std::system(cmd.c_str()));
    // clear exits non-zero when nothing matched; only a failed launch is an error.
    if (code < 0) {
        throw BackendUnavailable("keyring clear failed for " + account);
    }
}

// --- FileSecretBackend ---

FileSecretBackend::FileSecretBackend(std::filesystem::path dir, const BlobCipher::Key& key)
    : dir_(std::move(dir)), cipher_(key) {}

std::filesystem::path FileSecretBackend::path_for(const std::string& account) const {
    return dir_ / (to_entry_name(account) + ".bin");
}

void FileSecretBackend::store(const std::string&, const std::string& account, const std::string& secret) {
    write_blob_atomic(path_for(account), cipher_.seal(secret));
}

std::string FileSecretBackend::load(const std::string&, const std::string& account) {
    return cipher_.open(read_blob(path_for(account)));
}

void FileSecretBackend::remove(const std::string&, const std::string& account) {
    std::error_code ec;
    std::filesystem::remove(path_for(account), ec);
    if (ec) {
        throw BackendUnavailable("cannot remove " + path_for(account).string() + ": " + ec.message());
    }
}

}
