#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dspool {

struct MetricLabels {
    // Sorted so exposition is deterministic.
    std::map<std::string, std::string> kv;

    std::string ToPrometheusLabelText() const;
};

class Counter {
public:
    // Thread-safe
    void Inc(std::int64_t v = 1) { value_.fetch_add(v, std::memory_order_relaxed); }
    std::int64_t Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<std::int64_t> value_{0};
};

class Gauge {
public:
    // Thread-safe
    void Set(double v);
    double Value() const;

private:
    mutable std::mutex mu_;
    double value_{0.0};
};

class MetricsRegistry {
public:
    // Thread-safe. Returned references stay valid for the registry's lifetime.
    Counter& CounterMetric(std::string name, std::string help, MetricLabels labels = {});
    Gauge& GaugeMetric(std::string name, std::string help, MetricLabels labels = {});

    // Thread-safe
    std::string ToPrometheusText() const;

private:
    struct Entry {
        std::string name;
        std::string help;
        MetricLabels labels;

        Entry(std::string name_, std::string help_, MetricLabels labels_)
            : name(std::move(name_)), help(std::move(help_)), labels(std::move(labels_)) {}
    };

    struct CounterEntry : Entry {
        using Entry::Entry;
        Counter counter;
    };

    struct GaugeEntry : Entry {
        using Entry::Entry;
        Gauge gauge;
    };

    static std::string Key(std::string_view name, const MetricLabels& labels);

    mutable std::mutex mu_;
    // std::map keeps families adjacent in the exposition output.
    std::map<std::string, CounterEntry> counters_;
    std::map<std::string, GaugeEntry> gauges_;
};

// Global default registry (Thread-safe)
MetricsRegistry& DefaultMetrics();

} // namespace dspool
