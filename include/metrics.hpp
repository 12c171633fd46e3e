#pragma once

#include <string>
#include <map>
#include <set>
#include <mutex>
#include <sstream>
#include <utility>
#include <vector>

namespace shorten {


// Singleton Metrics Registry for operational visibility.
// Counters and gauges are keyed by their full series name, labels included
// (e.g. `shorten_lookups_total{success="false"}`), and exported in
// Prometheus text format.
class MetricsRegistry {
public:
    /**
     * Access the global instance of the metrics registry.
     */
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Increment a cumulative counter (Only increases).
    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    // Records one observation as the `_sum` and `_count` series of a summary.
    void observe(const std::string& name, const std::string& labels, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        summaries_[name + "_sum" + labels] += value;
        summaries_[name + "_count" + labels] += 1.0;
        summary_families_.insert(name);
    }

    // Sets a gauge to a specific instantaneous value.
    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] -= value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    // Drops every recorded series. Used by tests.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
        summaries_.clear();
        summary_families_.clear();
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     * One TYPE line is emitted per metric family, ahead of its labelled series.
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        write_family(ss, counters_, "counter");
        write_family(ss, gauges_, "gauge");

        for (const auto& family : summary_families_) {
            ss << "# TYPE " << family << " summary\n";
            for (const auto& [name, val] : summaries_) {
                if (family_of(name) == family + "_sum" || family_of(name) == family + "_count") {
                    ss << name << " " << val << "\n";
                }
            }
        }

        return ss.str();
    }

private:
    MetricsRegistry() = default;

    static std::string family_of(const std::string& name) {
        return name.substr(0, name.find('{'));
    }

    static void write_family(std::stringstream& ss, const std::map<std::string, double>& series,
                             const char* type) {
        std::map<std::string, std::vector<std::pair<std::string, double>>> families;
        for (const auto& [name, val] : series) {
            families[family_of(name)].emplace_back(name, val);
        }
        for (const auto& [family, members] : families) {
            ss << "# TYPE " << family << " " << type << "\n";
            for (const auto& [name, val] : members) {
                ss << name << " " << val << "\n";
            }
        }
    }

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, double> summaries_;
    std::set<std::string> summary_families_;
    std::mutex mutex_;
};

}
