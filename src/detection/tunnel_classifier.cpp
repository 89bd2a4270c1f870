#include "tunnel_classifier.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "detection/indicators.hpp"
#include "rules/scoring.hpp"
#include "utils/scoped_timer.hpp"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

TunnelClassifier::TunnelClassifier(const Config::ClassifierConfig &config)
    : config_(config),
      classify_latency_(MetricsRegistry::instance().create_histogram(
          "tm_classify_duration_seconds",
          "Latency of classifying one exchange",
          {0.00001, 0.00005, 0.0001, 0.0005, 0.001, 0.005, 0.01})) {
  std::vector<std::string> errors;
  if (!Config::validate_classifier_config(config_, errors)) {
    std::ostringstream oss;
    oss << "invalid classifier configuration:";
    for (const auto &error : errors)
      oss << " " << error << ";";
    throw ValidationError(oss.str());
  }
  report_floor_ = confidence_from_string(config_.min_report_confidence)
                      .value_or(Confidence::LOW);

  for (size_t i = 0; i < detection_counters_.size(); ++i)
    detection_counters_[i] = &MetricsRegistry::instance().create_counter(
        "tm_detections_total", "Tunnel detections by confidence",
        {{"confidence", confidence_to_string(static_cast<Confidence>(i))}});

  path_matcher_ =
      std::make_unique<Utils::AhoCorasick>(config_.suspicious_path_substrings);

  register_indicators();
  LOG(LogLevel::INFO, LogComponent::CLASSIFIER,
      "TunnelClassifier initialised with " << indicators_.size()
                                           << " indicators.");
}

void TunnelClassifier::register_indicators() {
  const auto &c = config_;
  const Utils::AhoCorasick &paths = *path_matcher_;

  indicators_.push_back(
      {"tunnel_headers", c.weight_tunnel_headers, TunnelType::HTTP_TUNNEL,
       [&c](const LogEntry &e, const IpHistoryView &) {
         return Indicators::tunnel_headers(e, c.tunnel_header_names);
       }});
  indicators_.push_back(
      {"opaque_content", c.weight_opaque_content, std::nullopt,
       [&c](const LogEntry &e, const IpHistoryView &) {
         return Indicators::opaque_content_type(e, c.opaque_content_types);
       }});
  indicators_.push_back({"chunked_unbuffered", c.weight_chunked_unbuffered,
                         TunnelType::CHUNKED_ENCODING,
                         [](const LogEntry &e, const IpHistoryView &) {
                           return Indicators::chunked_unbuffered(e);
                         }});
  indicators_.push_back({"suspicious_path", c.weight_suspicious_path,
                         TunnelType::HTTP_TUNNEL,
                         [&paths](const LogEntry &e, const IpHistoryView &) {
                           return Indicators::suspicious_path(e, paths);
                         }});
  indicators_.push_back({"webshell", c.weight_webshell, TunnelType::HTTP_TUNNEL,
                         [](const LogEntry &e, const IpHistoryView &) {
                           return Indicators::webshell_command(e);
                         }});
  indicators_.push_back({"tunna_pattern", c.weight_tunna_pattern,
                         TunnelType::HTTP_TUNNEL,
                         [](const LogEntry &e, const IpHistoryView &) {
                           return Indicators::tunna_pattern(e);
                         }});
  indicators_.push_back(
      {"body_entropy", c.weight_body_entropy, TunnelType::HTTP_TUNNEL,
       [&c](const LogEntry &e, const IpHistoryView &) {
         return Indicators::high_body_entropy(e, c.body_entropy_threshold,
                                              c.body_entropy_min_bytes);
       }});
  indicators_.push_back(
      {"header_entropy", c.weight_header_entropy, std::nullopt,
       [&c](const LogEntry &e, const IpHistoryView &) {
         return Indicators::high_header_entropy(e, c.header_entropy_threshold,
                                                c.header_entropy_min_bytes);
       }});
  indicators_.push_back(
      {"long_poll", c.weight_long_poll, TunnelType::LONG_POLLING,
       [&c](const LogEntry &e, const IpHistoryView &) {
         return Indicators::long_polling(e, c.long_poll_threshold_ms);
       }});
  indicators_.push_back(
      {"large_upload", c.weight_large_upload, std::nullopt,
       [&c](const LogEntry &e, const IpHistoryView &) {
         return Indicators::large_upload_small_response(
             e, c.large_upload_min_bytes, c.large_upload_max_response_bytes);
       }});
  indicators_.push_back(
      {"small_burst", c.weight_small_burst, std::nullopt,
       [&c](const LogEntry &, const IpHistoryView &h) {
         return Indicators::small_request_burst(h, c.burst_window_seconds * 1000,
                                                c.burst_min_requests,
                                                c.burst_max_body_bytes);
       }});
  indicators_.push_back(
      {"beaconing", c.weight_beaconing, TunnelType::BEACONING,
       [&c](const LogEntry &, const IpHistoryView &h) {
         return Indicators::beaconing(h, c.beacon_min_samples, c.beacon_max_cv,
                                      c.beacon_max_mean_interval_ms);
       }});
  indicators_.push_back({"dns_over_http", c.weight_dns_over_http,
                         TunnelType::DNS_TUNNEL,
                         [](const LogEntry &e, const IpHistoryView &) {
                           return Indicators::dns_over_http(e);
                         }});
  indicators_.push_back(
      {"websocket_abuse", c.weight_websocket_abuse,
       TunnelType::WEBSOCKET_COVERT,
       [&c, &paths](const LogEntry &e, const IpHistoryView &) {
         return Indicators::websocket_abuse(e, paths, c.body_entropy_threshold,
                                            c.body_entropy_min_bytes);
       }});
}

void TunnelClassifier::add_indicator(std::string name, double weight,
                                     std::optional<TunnelType> implied_type,
                                     IndicatorCheck check) {
  if (name.empty() || !check || weight < 0.0)
    throw ValidationError("indicator needs a name, a check and a "
                          "non-negative weight");
  LOG(LogLevel::INFO, LogComponent::CLASSIFIER,
      "Registered indicator " << name << " with weight " << weight);
  indicators_.push_back(
      {std::move(name), weight, implied_type, std::move(check)});
}

std::vector<std::string> TunnelClassifier::indicator_names() const {
  std::vector<std::string> names;
  names.reserve(indicators_.size());
  for (const auto &indicator : indicators_)
    names.push_back(indicator.name);
  return names;
}

std::optional<TunnelDetection>
TunnelClassifier::classify(const LogEntry &entry,
                           const IpHistoryView &history) const {
  if (!config_.enabled)
    return std::nullopt;

  ScopedTimer timer(classify_latency_);

  double weight_sum = 0.0;
  std::vector<std::string> evidence;
  const Indicator *dominant = nullptr;

  for (const auto &indicator : indicators_) {
    auto hit = indicator.check(entry, history);
    if (!hit)
      continue;

    weight_sum += indicator.weight;
    evidence.push_back(indicator.name + ": " + *hit);
    if (indicator.implied_type &&
        (!dominant || indicator.weight > dominant->weight))
      dominant = &indicator;
  }

  // No indicator, no detection
  if (evidence.empty() || evidence.size() < config_.min_indicators)
    return std::nullopt;

  double risk = Scoring::clamp_risk(weight_sum);
  Confidence confidence = Scoring::confidence_for(risk, config_);
  if (confidence < report_floor_) {
    LOG(LogLevel::TRACE, LogComponent::CLASSIFIER,
        "Entry " << entry.id << " scored " << risk
                 << " below report floor, discarded.");
    return std::nullopt;
  }

  TunnelDetection detection;
  detection.detection_id =
      "det-" + std::to_string(next_detection_id_.fetch_add(1));
  detection.entry_id = entry.id;
  detection.source_ip = entry.source_ip;
  detection.timestamp_ms = entry.timestamp_ms;
  detection.tunnel_type =
      dominant ? *dominant->implied_type : TunnelType::UNKNOWN;
  detection.confidence = confidence;
  detection.risk_score = risk;
  detection.indicators = std::move(evidence);

  detection_counters_[static_cast<size_t>(confidence)]->Increment();
  LOG(LogLevel::DEBUG, LogComponent::CLASSIFIER,
      "Detection " << detection.detection_id << " for " << entry.id << " ("
                   << tunnel_type_to_string(detection.tunnel_type) << ", "
                   << confidence_to_string(confidence) << ", risk " << risk
                   << ")");
  return detection;
}
