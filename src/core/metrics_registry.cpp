#include "metrics_registry.hpp"

#include <prometheus/text_serializer.h>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

prometheus::Counter &
MetricsRegistry::create_counter(const std::string &name,
                                const std::string &help,
                                const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lock(families_mutex_);
  auto it = counter_families_.find(name);
  if (it == counter_families_.end()) {
    auto &counter_family =
        prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
    it = counter_families_.emplace(name, &counter_family).first;
  }
  return it->second->Add(labels);
}

prometheus::Gauge &
MetricsRegistry::create_gauge(const std::string &name, const std::string &help,
                              const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lock(families_mutex_);
  auto it = gauge_families_.find(name);
  if (it == gauge_families_.end()) {
    auto &gauge_family =
        prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);
    it = gauge_families_.emplace(name, &gauge_family).first;
  }
  return it->second->Add(labels);
}

prometheus::Histogram &MetricsRegistry::create_histogram(
    const std::string &name, const std::string &help,
    const std::vector<double> &bucket_boundaries) {
  std::lock_guard<std::mutex> lock(families_mutex_);
  auto it = histograms_.find(name);
  if (it != histograms_.end())
    return *it->second;

  auto &histogram_family =
      prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);
  auto &histogram = histogram_family.Add({}, bucket_boundaries);
  histograms_.emplace(name, &histogram);
  return histogram;
}

std::string MetricsRegistry::serialize_text() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}
