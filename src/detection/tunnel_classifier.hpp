#ifndef TUNNEL_CLASSIFIER_HPP
#define TUNNEL_CLASSIFIER_HPP

#include "analysis/ip_rate_arena.hpp"
#include "core/config.hpp"
#include "core/log_entry.hpp"
#include "core/tunnel_detection.hpp"
#include "utils/aho_corasick.hpp"

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prometheus {
class Counter;
class Histogram;
} // namespace prometheus

// Weighted indicator scoring over a single exchange plus the recent history of
// its source IP. Stateless apart from the detection id counter, so one
// instance is shared by all partition workers.
class TunnelClassifier {
public:
  using IndicatorCheck = std::function<std::optional<std::string>(
      const LogEntry &, const IpHistoryView &)>;

  // Throws ValidationError when the configuration is inconsistent
  explicit TunnelClassifier(const Config::ClassifierConfig &config);

  // Indicators hold references into the owned configuration
  TunnelClassifier(const TunnelClassifier &) = delete;
  TunnelClassifier &operator=(const TunnelClassifier &) = delete;

  // `history` must already contain the sample for `entry`
  std::optional<TunnelDetection> classify(const LogEntry &entry,
                                          const IpHistoryView &history) const;

  // Appends a site-specific indicator after the built-in ones. Must not be
  // called while entries are being classified.
  void add_indicator(std::string name, double weight,
                     std::optional<TunnelType> implied_type,
                     IndicatorCheck check);

  // Names of the registered indicators, in evaluation order
  std::vector<std::string> indicator_names() const;

  const Config::ClassifierConfig &config() const { return config_; }

private:
  struct Indicator {
    std::string name;
    double weight;
    std::optional<TunnelType> implied_type;
    IndicatorCheck check;
  };

  void register_indicators();

  Config::ClassifierConfig config_;
  Confidence report_floor_ = Confidence::LOW;
  std::unique_ptr<Utils::AhoCorasick> path_matcher_;
  std::vector<Indicator> indicators_;
  mutable std::atomic<uint64_t> next_detection_id_{1};

  std::array<prometheus::Counter *, 4> detection_counters_;
  prometheus::Histogram &classify_latency_;
};

#endif // TUNNEL_CLASSIFIER_HPP
