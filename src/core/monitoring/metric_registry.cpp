#include "tally_reports/monitoring/metric_registry.h"

#include <algorithm>

#if TALLY_REPORTS_WITH_METRICS
#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/text_serializer.h>
#endif

namespace tally_reports {

MonitoringCounter::MonitoringCounter(std::function<void(double)> fn)
    : fn_(std::move(fn)) {}

void MonitoringCounter::Increment(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MonitoringHistogram::MonitoringHistogram(std::function<void(double)> fn)
    : fn_(std::move(fn)) {}

void MonitoringHistogram::Observe(double value) const {
    if (fn_) {
        fn_(value);
    }
}

MetricRegistry& MetricRegistry::Instance() {
    static MetricRegistry instance;
    return instance;
}

MetricRegistry::MetricRegistry() {
#if TALLY_REPORTS_WITH_METRICS
    registry_ = std::make_shared<prometheus::Registry>();
#endif
}

std::string MetricRegistry::BuildMetricKey(const std::string& name, const MetricLabels& labels) {
    std::string key = name;
    for (const auto& [label_key, label_value] : labels) {
        key += "|" + label_key + "=" + label_value;
    }
    return key;
}

std::shared_ptr<MonitoringCounter> MetricRegistry::BuildCounter(const std::string& name,
                                                                const std::string& help,
                                                                const MetricLabels& labels) {
#if !TALLY_REPORTS_WITH_METRICS
    (void)name;
    (void)help;
    (void)labels;
    return std::make_shared<MonitoringCounter>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string metric_key = BuildMetricKey(name, labels);

    auto metric_it = counters_.find(metric_key);
    if (metric_it != counters_.end()) {
        auto* metric = reinterpret_cast<prometheus::Counter*>(metric_it->second);
        return std::make_shared<MonitoringCounter>(
            [metric](double value) { metric->Increment(value); });
    }

    prometheus::Family<prometheus::Counter>* family = nullptr;
    auto family_it = counter_families_.find(name);
    if (family_it == counter_families_.end()) {
        family = &prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
        counter_families_[name] = family;
    } else {
        family = reinterpret_cast<prometheus::Family<prometheus::Counter>*>(family_it->second);
    }

    auto& metric = family->Add(labels);
    counters_[metric_key] = &metric;
    return std::make_shared<MonitoringCounter>(
        [&metric](double value) { metric.Increment(value); });
#endif
}

std::shared_ptr<MonitoringHistogram> MetricRegistry::BuildHistogram(
    const std::string& name,
    const std::string& help,
    const std::vector<double>& buckets,
    const MetricLabels& labels) {
#if !TALLY_REPORTS_WITH_METRICS
    (void)name;
    (void)help;
    (void)buckets;
    (void)labels;
    return std::make_shared<MonitoringHistogram>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string metric_key = BuildMetricKey(name, labels);

    auto metric_it = histograms_.find(metric_key);
    if (metric_it != histograms_.end()) {
        auto* metric = reinterpret_cast<prometheus::Histogram*>(metric_it->second);
        return std::make_shared<MonitoringHistogram>(
            [metric](double value) { metric->Observe(value); });
    }

    prometheus::Family<prometheus::Histogram>* family = nullptr;
    auto family_it = histogram_families_.find(name);
    if (family_it == histogram_families_.end()) {
        family = &prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);
        histogram_families_[name] = family;
    } else {
        family = reinterpret_cast<prometheus::Family<prometheus::Histogram>*>(family_it->second);
    }

    auto& metric = family->Add(labels, buckets);
    histograms_[metric_key] = &metric;
    return std::make_shared<MonitoringHistogram>(
        [&metric](double value) { metric.Observe(value); });
#endif
}

std::string MetricRegistry::SerializeText() const {
#if !TALLY_REPORTS_WITH_METRICS
    return "";
#else
    std::lock_guard<std::mutex> lock(mutex_);
    const prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
#endif
}

#if TALLY_REPORTS_WITH_METRICS
std::shared_ptr<prometheus::Registry> MetricRegistry::GetPrometheusRegistry() const {
    return registry_;
}
#endif

void RecordReportRequest(const std::string& report, const std::string& outcome, double latency_ms) {
    auto& registry = MetricRegistry::Instance();
    registry
        .BuildCounter("tally_reports_requests_total", "Report requests by outcome",
                      {{"report", report}, {"outcome", outcome}})
        ->Increment();
    registry
        .BuildHistogram("tally_reports_request_latency_ms", "Report request latency in ms",
                        {1.0, 5.0, 10.0, 25.0, 50.0, 100.0, 250.0, 1000.0, 5000.0},
                        {{"report", report}})
        ->Observe(std::max(0.0, latency_ms));
}

}  // namespace tally_reports
