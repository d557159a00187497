#include <dspool/core/metrics.h>

#include <sstream>

namespace dspool {
namespace {

void AppendHeader(std::ostringstream& oss, const std::string& name, const std::string& help, const char* type,
    std::string& last_family) {
    if (name == last_family) {
        return;
    }
    last_family = name;
    oss << "# HELP " << name << " " << help << "\n";
    oss << "# TYPE " << name << " " << type << "\n";
}

} // namespace

std::string MetricLabels::ToPrometheusLabelText() const {
    if (kv.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& it : kv) {
        if (!first) {
            oss << ",";
        }
        first = false;
        oss << it.first << "=\"";
        for (char c : it.second) {
            if (c == '\\' || c == '"') {
                oss << '\\' << c;
            } else if (c == '\n') {
                oss << "\\n";
            } else {
                oss << c;
            }
        }
        oss << "\"";
    }
    oss << "}";
    return oss.str();
}

void Gauge::Set(double v) {
    std::lock_guard<std::mutex> lk(mu_);
    value_ = v;
}

double Gauge::Value() const {
    std::lock_guard<std::mutex> lk(mu_);
    return value_;
}

std::string MetricsRegistry::Key(std::string_view name, const MetricLabels& labels) {
    std::string key(name);
    key.push_back('\n');
    for (const auto& it : labels.kv) {
        key.append(it.first);
        key.push_back('=');
        key.append(it.second);
        key.push_back('\n');
    }
    return key;
}

Counter& MetricsRegistry::CounterMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = Key(name, labels);
    auto it = counters_.find(key);
    if (it == counters_.end()) {
        it = counters_.try_emplace(std::move(key), std::move(name), std::move(help), std::move(labels)).first;
    }
    return it->second.counter;
}

Gauge& MetricsRegistry::GaugeMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = Key(name, labels);
    auto it = gauges_.find(key);
    if (it == gauges_.end()) {
        it = gauges_.try_emplace(std::move(key), std::move(name), std::move(help), std::move(labels)).first;
    }
    return it->second.gauge;
}

std::string MetricsRegistry::ToPrometheusText() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;

    std::string family;
    for (const auto& kv : counters_) {
        const auto& e = kv.second;
        AppendHeader(oss, e.name, e.help, "counter", family);
        oss << e.name << e.labels.ToPrometheusLabelText() << " " << e.counter.Value() << "\n";
    }

    family.clear();
    for (const auto& kv : gauges_) {
        const auto& e = kv.second;
        AppendHeader(oss, e.name, e.help, "gauge", family);
        oss << e.name << e.labels.ToPrometheusLabelText() << " " << e.gauge.Value() << "\n";
    }

    return oss.str();
}

MetricsRegistry& DefaultMetrics() {
    static MetricsRegistry registry;
    return registry;
}

} // namespace dspool
