#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>
#include <vector>

// Process-wide prometheus registry. Families are created on first use and
// reused afterwards, so several components (or several test fixtures) can ask
// for the same metric by name.
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

  prometheus::Counter &
  create_counter(const std::string &name, const std::string &help,
                 const std::map<std::string, std::string> &labels = {});

  prometheus::Gauge &
  create_gauge(const std::string &name, const std::string &help,
               const std::map<std::string, std::string> &labels = {});

  prometheus::Histogram &
  create_histogram(const std::string &name, const std::string &help,
                   const std::vector<double> &bucket_boundaries);

  std::string serialize_text() const;

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;

  std::mutex families_mutex_;
  std::map<std::string, prometheus::Family<prometheus::Counter> *>
      counter_families_;
  std::map<std::string, prometheus::Family<prometheus::Gauge> *>
      gauge_families_;
  std::map<std::string, prometheus::Histogram *> histograms_;
};

#endif // METRICS_REGISTRY_HPP
