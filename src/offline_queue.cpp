#include "offline_queue.hpp"
#include "agent_logger.hpp"
#include "errors.hpp"
#include "metrics.hpp"

#include <algorithm>
#include <thread>
#include <stdexcept>
#include <utility>

namespace pea {

namespace fs = std::filesystem;

OfflineQueue::OfflineQueue(fs::path dir, const BlobCipher::Key& key, std::chrono::milliseconds backoff)
    : dir_(std::move(dir)), cipher_(key), backoff_(backoff) {}

fs::path OfflineQueue::path_for(const std::string& name) const {
    return dir_ / (to_entry_name(name) + ".bin");
}

void OfflineQueue::enqueue(const std::string& name, const std::string& plaintext) {
    auto path = path_for(name);
    write_blob_atomic(path, cipher_.seal(plaintext));

    MetricsRegistry::instance().increment_counter("pea_queue_enqueued_total");
    update_gauges();
    AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::QUEUE_ENQUEUE,
                     path.filename().string(), std::to_string(plaintext.size()) + " bytes");
}

std::vector<QueueEntry> OfflineQueue::entries() const {
    std::vector<QueueEntry> out;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return out;
    }

    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        std::error_code type_ec;
        if (p.extension() != ".bin" || !it->is_regular_file(type_ec)) continue;
        out.push_back(QueueEntry{p.stem().string(), p});
    }
    if (ec) {
        throw BackendUnavailable("cannot list " + dir_.string() + ": " + ec.message());
    }

    std::sort(out.begin(), out.end(), [](const QueueEntry& a, const QueueEntry& b) {
        return a.name < b.name;
    });
    return out;
}

std::string OfflineQueue::read(const QueueEntry& entry) const {
    return cipher_.open(read_blob(entry.path));
}

void OfflineQueue::remove(const QueueEntry& entry) {
    std::error_code ec;
    fs::remove(entry.path, ec);
    if (ec) {
        throw BackendUnavailable("cannot remove " + entry.path.string() + ": " + ec.message());
    }
}

OfflineQueue::Outcome OfflineQueue::attempt(const QueueEntry& entry, const SubmitFn& submit) {
    auto& metrics = MetricsRegistry::instance();

    std::string plaintext;
    try {
        plaintext = read(entry);
    } catch (const SecretNotFound&) {
        // Removed since the listing was taken.
        return Outcome::Missing;
    } catch (const SecretCorrupt& e) {
        metrics.increment_counter("pea_queue_corrupt_total");
        AgentLogger::log(AgentLogger::Level::ERROR, AgentLogger::EventType::QUEUE_CORRUPT,
                         entry.name, std::string("entry kept, cannot decrypt: ") + e.what());
        return Outcome::Corrupt;
    } catch (const AgentError& e) {
        metrics.increment_counter("pea_queue_failed_total");
        AgentLogger::log(AgentLogger::Level::ERROR, AgentLogger::EventType::QUEUE_DRAIN,
                         entry.name, e.what());
        return Outcome::Failed;
    }

    try {
        submit(plaintext);
    } catch (const std::exception& e) {
        metrics.increment_counter("pea_queue_failed_total");
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::QUEUE_DRAIN,
                         entry.name, std::string("submit failed: ") + e.what());
        return Outcome::Failed;
    }

    try {
        remove(entry);
    } catch (const AgentError& e) {
        AgentLogger::log(AgentLogger::Level::ERROR, AgentLogger::EventType::QUEUE_DRAIN,
                         entry.name, std::string("delivered but not removed, may be sent again: ") + e.what());
    }
    metrics.increment_counter("pea_queue_delivered_total");
    return Outcome::Delivered;
}

DrainReport OfflineQueue::drain(const SubmitFn& submit) {
    DrainReport report;
    auto pending = entries();

    for (size_t i = 0; i < pending.size(); ++i) {
        switch (attempt(pending[i], submit)) {
            case Outcome::Delivered:
                ++report.delivered;
                break;
            case Outcome::Failed:
                ++report.failed;
                if (i + 1 < pending.size() && backoff_.count() > 0) {
                    std::this_thread::sleep_for(backoff_);
                }
                break;
            case Outcome::Corrupt:
                ++report.corrupt;
                break;
            case Outcome::Missing:
                break;
        }
    }

    update_gauges();
    if (!pending.empty()) {
        AgentLogger::log(AgentLogger::Level::INFO, AgentLogger::EventType::QUEUE_DRAIN, dir_.filename().string(),
                         "delivered=" + std::to_string(report.delivered) +
                         " failed=" + std::to_string(report.failed) +
                         " corrupt=" + std::to_string(report.corrupt));
    }
    return report;
}

size_t OfflineQueue::prune_by_age(int days) {
    if (days < 0) {
        throw std::invalid_argument("prune_by_age: days must be non-negative");
    }

    // Compared as whole hours of age; now - days * 24h overflows the
    // nanosecond clock for retentions past a few centuries.
    const long long limit_hours = 24LL * days;
    const auto now = fs::file_time_type::clock::now();
    size_t removed = 0;

    for (const auto& entry : entries()) {
        std::error_code ec;
        auto mtime = fs::last_write_time(entry.path, ec);
        if (ec) continue;
        const auto age_hours = std::chrono::duration_cast<std::chrono::hours>(now - mtime).count();
        if (age_hours < limit_hours) continue;

        if (fs::remove(entry.path, ec)) {
            ++removed;
        } else if (ec) {
            AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::QUEUE_PRUNE,
                             entry.name, ec.message());
        }
    }

    if (removed > 0) {
        MetricsRegistry::instance().increment_counter("pea_queue_pruned_total", static_cast<double>(removed));
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::QUEUE_PRUNE, dir_.filename().string(),
                         "removed " + std::to_string(removed) + " entries older than " +
                         std::to_string(days) + " days");
    }
    update_gauges();
    return removed;
}

QueueStats OfflineQueue::stats() const {
    QueueStats s;
    for (const auto& entry : entries()) {
        std::error_code ec;
        auto size = fs::file_size(entry.path, ec);
        if (ec) continue;
        ++s.count;
        s.total_bytes += size;
    }
    return s;
}

size_t OfflineQueue::wipe() {
    size_t removed = 0;
    for (const auto& entry : entries()) {
        remove(entry);
        ++removed;
    }
    update_gauges();
    return removed;
}

void OfflineQueue::update_gauges() const {
    try {
        auto s = stats();
        auto& metrics = MetricsRegistry::instance();
        metrics.set_gauge("pea_queue_entries", static_cast<double>(s.count));
        metrics.set_gauge("pea_queue_bytes", static_cast<double>(s.total_bytes));
    } catch (const AgentError& e) {
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::QUEUE_DRAIN,
                         dir_.filename().string(), std::string("stats unavailable: ") + e.what());
    }
}

}
