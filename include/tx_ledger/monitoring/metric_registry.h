#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#if TX_LEDGER_WITH_METRICS
#include <prometheus/registry.h>
#endif

namespace tx_ledger {

using MetricLabels = std::map<std::string, std::string>;

class MonitoringCounter {
public:
    explicit MonitoringCounter(std::function<void(double)> fn = nullptr);
    void Increment(double value = 1.0) const;

private:
    std::function<void(double)> fn_;
};

class MonitoringGauge {
public:
    explicit MonitoringGauge(std::function<void(double)> fn = nullptr);
    void Set(double value) const;

private:
    std::function<void(double)> fn_;
};

class MetricRegistry {
public:
    static MetricRegistry& Instance();

    std::shared_ptr<MonitoringCounter> BuildCounter(const std::string& name,
                                                    const std::string& help,
                                                    const MetricLabels& labels = {});

    std::shared_ptr<MonitoringGauge> BuildGauge(const std::string& name,
                                                const std::string& help,
                                                const MetricLabels& labels = {});

    // Prometheus text exposition of everything registered so far.
    bool SerializeText(std::string* out, std::string* error) const;

#if TX_LEDGER_WITH_METRICS
    std::shared_ptr<prometheus::Registry> GetPrometheusRegistry() const;
#endif

private:
    MetricRegistry();

    static std::string BuildMetricKey(const std::string& name, const MetricLabels& labels);

    mutable std::mutex mutex_;

#if TX_LEDGER_WITH_METRICS
    std::shared_ptr<prometheus::Registry> registry_;
    std::unordered_map<std::string, void*> counter_families_;
    std::unordered_map<std::string, void*> gauge_families_;
    std::unordered_map<std::string, void*> counters_;
    std::unordered_map<std::string, void*> gauges_;
#endif
};

}  // namespace tx_ledger
