#pragma once

#include <array>
#include <string>
#include <filesystem>
#include "agent_config.hpp"

namespace pea {

// AES-256-GCM sealing of small at-rest blobs.
// Blob layout: 12-byte random nonce || ciphertext || 16-byte tag.
class BlobCipher {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;

    using Key = std::array<unsigned char, KEY_SIZE>;

    explicit BlobCipher(const Key& key);
    ~BlobCipher();

    BlobCipher(const BlobCipher&) = default;
    BlobCipher& operator=(const BlobCipher&) = default;

    /**
     * Derives the at-rest key as SHA-256(hostname || username).
     * This is an unsalted hash of guessable strings, not a KDF: it only keeps
     * blobs from being readable on a different host/user.
     */
    static Key derive_host_key(const HostIdentity& host);

    // Encrypts under a fresh random nonce.
    std::string seal(const std::string& plaintext) const;

    // Decrypts and authenticates. Throws SecretCorrupt on a short blob or tag mismatch.
    std::string open(const std::string& blob) const;

private:
    Key key_;
};

// Maps an arbitrary key to a safe file stem: [A-Za-z0-9._-] kept, anything else
// becomes '_', and a leading dot is escaped so names cannot climb directories.
std::string to_entry_name(const std::string& key);

// Reads a whole file. Throws SecretNotFound if it does not exist.
std::string read_blob(const std::filesystem::path& path);

// Writes via a temp file and rename so readers never see a partial blob.
void write_blob_atomic(const std::filesystem::path& path, const std::string& data);

}
