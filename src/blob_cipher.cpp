#include "blob_cipher.hpp"
#include "errors.hpp"
#include "nonce_generator.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <ios>
#include <iterator>
#include <memory>
#include <system_error>

namespace pea {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

unsigned char* bytes(std::string& s, size_t offset = 0) {
    return reinterpret_cast<unsigned char*>(&s[0]) + offset;
}

const unsigned char* bytes(const std::string& s, size_t offset = 0) {
    return reinterpret_cast<const unsigned char*>(s.data()) + offset;
}

}

BlobCipher::BlobCipher(const Key& key) : key_(key) {}

BlobCipher::~BlobCipher() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

BlobCipher::Key BlobCipher::derive_host_key(const HostIdentity& host) {
    std::string data = host.hostname + host.username;
    Key key{};
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), key.data());
    OPENSSL_cleanse(&data[0], data.size());
    return key;
}

std::string BlobCipher::seal(const std::string& plaintext) const {
    auto nonce = NonceGenerator::random_bytes(NONCE_SIZE);

    std::string blob(NONCE_SIZE + plaintext.size() + TAG_SIZE, '\0');
    std::copy(nonce.begin(), nonce.end(), blob.begin());

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw AgentError("EVP_CIPHER_CTX_new failed");

    int len = 0;
    int final_len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1 ||
        EVP_EncryptUpdate(ctx.get(), bytes(blob, NONCE_SIZE), &len,
                          bytes(plaintext), static_cast<int>(plaintext.size())) != 1 ||
        EVP_EncryptFinal_ex(ctx.get(), bytes(blob, NONCE_SIZE + len), &final_len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                            bytes(blob, NONCE_SIZE + plaintext.size())) != 1) {
        throw AgentError("AES-GCM encryption failed");
    }
    return blob;
}

std::string BlobCipher::open(const std::string& blob) const {
    if (blob.size() < NONCE_SIZE + TAG_SIZE) {
        throw SecretCorrupt("sealed blob truncated (" + std::to_string(blob.size()) + " bytes)");
    }

    const size_t ct_len = blob.size() - NONCE_SIZE - TAG_SIZE;
    std::string plaintext(ct_len, '\0');
    std::string tag = blob.substr(NONCE_SIZE + ct_len, TAG_SIZE);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw AgentError("EVP_CIPHER_CTX_new failed");

    int len = 0;
    int final_len = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), bytes(blob)) != 1) {
        throw AgentError("AES-GCM initialisation failed");
    }

    if (EVP_DecryptUpdate(ctx.get(), bytes(plaintext), &len,
                          bytes(blob, NONCE_SIZE), static_cast<int>(ct_len)) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), bytes(tag)) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), bytes(plaintext, len), &final_len) <= 0) {
        OPENSSL_cleanse(bytes(plaintext), plaintext.size());
        throw SecretCorrupt("decrypt failed: authentication tag mismatch");
    }
    return plaintext;
}

std::string to_entry_name(const std::string& key) {
    std::string out;
    out.reserve(key.size() + 1);
    for (char c : key) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '.' || c == '_' || c == '-') {
            out += c;
        } else {
            out += '_';
        }
    }
    if (out.empty() || out[0] == '.') {
        out.insert(out.begin(), '_');
    }
    return out;
}

std::string read_blob(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw SecretNotFound("no record at " + path.string());
    }
    if (std::filesystem::is_directory(path, ec)) {
        throw BackendUnavailable(path.string() + " is a directory");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw BackendUnavailable("cannot open " + path.string());
    }
    try {
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure& e) {
        throw BackendUnavailable("cannot read " + path.string() + ": " + e.what());
    }
}

void write_blob_atomic(const std::filesystem::path& path, const std::string& data) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw BackendUnavailable("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw BackendUnavailable("cannot write " + tmp.string());
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmp, ec);
            throw BackendUnavailable("short write to " + tmp.string());
        }
    }

    std::filesystem::permissions(tmp, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw BackendUnavailable("cannot rename into " + path.string() + ": " + ec.message());
    }
}

}
