#pragma once

#include <string>
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include "blob_cipher.hpp"

namespace pea {

struct QueueStats {
    size_t count = 0;
    uintmax_t total_bytes = 0;
};

struct QueueEntry {
    std::string name;
    std::filesystem::path path;
};

struct DrainReport {
    size_t delivered = 0;
    size_t failed = 0;
    size_t corrupt = 0;
};

// Durable store of events that could not be delivered. Each entry is one
// `{name}.bin` file holding nonce || AES-256-GCM ciphertext of the event.
// Not safe against a second process draining the same directory.
class OfflineQueue {
public:
    // Delivers one plaintext event; throws on any failure.
    using SubmitFn = std::function<void(const std::string& plaintext)>;

    enum class Outcome {
        Delivered,
        Failed,
        Corrupt,
        Missing
    };

    OfflineQueue(std::filesystem::path dir,
                 const BlobCipher::Key& key,
                 std::chrono::milliseconds backoff = std::chrono::milliseconds(2000));

    /**
     * Seals and writes an event under `name`, replacing any entry of that name.
     * The write is all-or-nothing.
     */
    void enqueue(const std::string& name, const std::string& plaintext);

    /**
     * Retry pass over every entry in name order. Delivered entries are deleted.
     * A failed submit waits the backoff and moves on; undecryptable entries are
     * logged and left in place.
     */
    DrainReport drain(const SubmitFn& submit);

    // Deletes entries last modified at or before now - days. Returns the number removed.
    size_t prune_by_age(int days);

    QueueStats stats() const;

    // Deletes every entry. Returns the number removed.
    size_t wipe();

    // --- Single-entry primitives used by drain and the async drainer ---
    std::vector<QueueEntry> entries() const;
    std::string read(const QueueEntry& entry) const;
    void remove(const QueueEntry& entry);
    Outcome attempt(const QueueEntry& entry, const SubmitFn& submit);

    const std::filesystem::path& dir() const { return dir_; }
    std::chrono::milliseconds backoff() const { return backoff_; }

private:
    std::filesystem::path dir_;
    BlobCipher cipher_;
    std::chrono::milliseconds backoff_;

    std::filesystem::path path_for(const std::string& name) const;
    void update_gauges() const;
};

}
