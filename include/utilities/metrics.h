#pragma once
#include <map>
#include <mutex>
#include <string>

/**
 * @brief Process-wide metrics registry exported in Prometheus text format.
 *
 * Series are keyed by metric name plus label set. Output is sorted by
 * series so scrapes are stable.
 */
class MetricsRegistry {
public:
    using Labels = std::map<std::string, std::string>;

    /** Get singleton instance. */
    static MetricsRegistry& instance();

    /** Set gauge value with optional labels. */
    void setGauge(const std::string& name, double value, const Labels& labels = {});

    /** Increment counter by value (default 1). */
    void incrementCounter(const std::string& name, double value = 1.0,
                          const Labels& labels = {});

    /** Record observation for a summary-style histogram (sum and count). */
    void observe(const std::string& name, double value, const Labels& labels = {});

    /** Current counter value, 0 when the series was never touched. */
    double counterValue(const std::string& name, const Labels& labels = {}) const;

    /** Current gauge value, 0 when unset. */
    double gaugeValue(const std::string& name, const Labels& labels = {}) const;

    /** Number of observations recorded for a histogram series. */
    unsigned long observationCount(const std::string& name,
                                   const Labels& labels = {}) const;

    /** Serialize all metrics in Prometheus text format. */
    std::string toPrometheus() const;

    /** Drop every series. Used by tests to start from a clean registry. */
    void reset();

    /** Convert labels map to Prometheus label string. */
    static std::string labelsToString(const Labels& labels);

private:
    MetricsRegistry() = default;
    struct Histogram { double sum{0}; unsigned long count{0}; };
    struct Series { std::string name; std::string labels; };

    static Series splitKey(const std::string& key);

    mutable std::mutex mtx_;
    std::map<std::string, double> gauges_;
    std::map<std::string, double> counters_;
    std::map<std::string, Histogram> histograms_;
};
