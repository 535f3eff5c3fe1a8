#pragma once

#include <cmath>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

namespace pea {

// Agent-wide counters and gauges. `pea-agent status` prints them in the
// Prometheus text format.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    // Unknown names read as zero.
    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(counters_, name);
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(gauges_, name);
    }

    /**
     * Prometheus exposition text (format 0.0.4), counters first. Whole values
     * print without an exponent so byte gauges stay readable.
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream ss;
        render(ss, counters_, "counter");
        render(ss, gauges_, "gauge");
        return ss.str();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

private:
    MetricsRegistry() = default;

    using Series = std::map<std::string, double>;

    static double lookup(const Series& series, const std::string& name) {
        auto it = series.find(name);
        return (it != series.end()) ? it->second : 0.0;
    }

    static void render(std::ostringstream& ss, const Series& series, const char* type) {
        for (const auto& [name, val] : series) {
            ss << "# TYPE " << name << " " << type << "\n" << name << " ";
            if (std::isfinite(val) && std::floor(val) == val && std::fabs(val) < 9.0e15) {
                ss << static_cast<long long>(val);
            } else {
                ss << val;
            }
            ss << "\n";
        }
    }

    Series counters_;
    Series gauges_;
    std::mutex mutex_;
};

}
