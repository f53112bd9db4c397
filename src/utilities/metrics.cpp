#include "utilities/metrics.h"
#include <set>
#include <sstream>

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry inst;
    return inst;
}

static std::string makeKey(const std::string& name, const MetricsRegistry::Labels& labels) {
    return name + MetricsRegistry::labelsToString(labels);
}

MetricsRegistry::Series MetricsRegistry::splitKey(const std::string& key) {
    auto pos = key.find('{');
    if (pos == std::string::npos) return {key, ""};
    return {key.substr(0, pos), key.substr(pos)};
}

void MetricsRegistry::setGauge(const std::string& name, double value, const Labels& labels) {
    std::lock_guard<std::mutex> lg(mtx_);
    gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(const std::string& name, double value,
                                       const Labels& labels) {
    std::lock_guard<std::mutex> lg(mtx_);
    counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string& name, double value, const Labels& labels) {
    std::lock_guard<std::mutex> lg(mtx_);
    auto& h = histograms_[makeKey(name, labels)];
    h.sum += value;
    h.count += 1;
}

double MetricsRegistry::counterValue(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lg(mtx_);
    auto it = counters_.find(makeKey(name, labels));
    return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gaugeValue(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lg(mtx_);
    auto it = gauges_.find(makeKey(name, labels));
    return it == gauges_.end() ? 0.0 : it->second;
}

unsigned long MetricsRegistry::observationCount(const std::string& name,
                                                const Labels& labels) const {
    std::lock_guard<std::mutex> lg(mtx_);
    auto it = histograms_.find(makeKey(name, labels));
    return it == histograms_.end() ? 0 : it->second.count;
}

std::string MetricsRegistry::labelsToString(const Labels& labels) {
    if (labels.empty()) return "";
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& kv : labels) {
        if (!first) oss << ',';
        first = false;
        oss << kv.first << "=\"" << kv.second << "\"";
    }
    oss << '}';
    return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
    std::lock_guard<std::mutex> lg(mtx_);
    std::ostringstream oss;
    // One TYPE line per metric family, emitted before its first series.
    std::set<std::string> typed;
    auto typeLine = [&](const std::string& name, const char* type) {
        if (typed.insert(name).second) oss << "# TYPE " << name << ' ' << type << '\n';
    };
    for (const auto& kv : gauges_) {
        auto s = splitKey(kv.first);
        typeLine(s.name, "gauge");
        oss << s.name << s.labels << ' ' << kv.second << '\n';
    }
    for (const auto& kv : counters_) {
        auto s = splitKey(kv.first);
        typeLine(s.name, "counter");
        oss << s.name << s.labels << ' ' << kv.second << '\n';
    }
    for (const auto& kv : histograms_) {
        auto s = splitKey(kv.first);
        typeLine(s.name, "summary");
        oss << s.name << "_sum" << s.labels << ' ' << kv.second.sum << '\n';
        oss << s.name << "_count" << s.labels << ' ' << kv.second.count << '\n';
    }
    return oss.str();
}

void MetricsRegistry::reset() {
    std::lock_guard<std::mutex> lg(mtx_);
    gauges_.clear();
    counters_.clear();
    histograms_.clear();
}
