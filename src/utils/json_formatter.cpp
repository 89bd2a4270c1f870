#include "json_formatter.hpp"

#include <variant>

namespace JsonFormatter {

nlohmann::json headers_to_json(const HeaderList &headers) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &[name, value] : headers)
    j.push_back({{"name", name}, {"value", value}});
  return j;
}

nlohmann::json body_to_json(const BodyCapture &body) {
  return {{"data", body.data}, {"truncated", body.truncated}, {"size", body.size}};
}

nlohmann::json entry_to_json(const LogEntry &entry) {
  nlohmann::json j;
  j["id"] = entry.id;
  j["timestamp_ms"] = entry.timestamp_ms;
  j["source_ip"] = entry.source_ip;
  j["method"] = entry.method;
  j["path"] = entry.path;
  j["query"] = entry.query;
  j["request_headers"] = headers_to_json(entry.request_headers);
  j["request_body"] = body_to_json(entry.request_body);
  j["response_status"] = entry.response_status;
  j["response_headers"] = headers_to_json(entry.response_headers);
  j["response_body"] = body_to_json(entry.response_body);
  j["response_time_ms"] = entry.response_time_ms;
  return j;
}

nlohmann::json rule_to_json(const BlockRule &rule) {
  nlohmann::json j;
  j["id"] = rule.id;
  j["kind"] = block_rule_kind_to_string(rule.kind());
  j["key"] = rule.key();
  j["reason"] = rule.reason;
  j["created_at_ms"] = rule.created_at_ms;
  j["created_by"] = rule.created_by;

  std::visit(overloaded{[&j](const IpRule &ip) { j["ip"] = ip.value; },
                        [&j](const EndpointRule &endpoint) {
                          j["method"] = endpoint.method;
                          j["pattern"] = endpoint.pattern;
                        },
                        [&j](const PatternRule &pattern) {
                          j["field"] = pattern.field;
                          j["value"] = pattern.value;
                        }},
             rule.spec);
  return j;
}

nlohmann::json decision_to_json(const BlockDecision &decision) {
  nlohmann::json j;
  j["denied"] = decision.denied;
  if (decision.matched_rule)
    j["rule"] = rule_to_json(*decision.matched_rule);
  return j;
}

nlohmann::json detection_to_json(const TunnelDetection &detection) {
  nlohmann::json j;
  j["detection_id"] = detection.detection_id;
  j["entry_id"] = detection.entry_id;
  j["source_ip"] = detection.source_ip;
  j["timestamp_ms"] = detection.timestamp_ms;
  j["detected"] = detection.detected;
  j["tunnel_type"] = tunnel_type_to_string(detection.tunnel_type);
  j["confidence"] = confidence_to_string(detection.confidence);
  j["risk_score"] = detection.risk_score;
  j["indicators"] = detection.indicators;
  return j;
}

nlohmann::json record_to_json(const ProcessedRecord &record) {
  nlohmann::json j = entry_to_json(*record.entry);
  j["decision"] = decision_to_json(record.decision);
  j["tunnel"] = record.detection ? detection_to_json(*record.detection)
                                 : nlohmann::json(nullptr);
  return j;
}

nlohmann::json stats_to_json(const StatsSnapshot &snapshot) {
  nlohmann::json status_counts = nlohmann::json::object();
  for (const auto &[status, count] : snapshot.status_counts)
    status_counts[std::to_string(status)] = count;

  nlohmann::json top_ips = nlohmann::json::array();
  for (const auto &entry : snapshot.top_ips)
    top_ips.push_back({{"ip", entry.ip}, {"count", entry.count}});

  return {{"total_requests", snapshot.total_requests},
          {"tunnel_detections", snapshot.tunnel_detections},
          {"denied_requests", snapshot.denied_requests},
          {"average_response_time_ms", snapshot.average_response_time_ms},
          {"status_counts", status_counts},
          {"top_ips", top_ips},
          {"generated_at_ms", snapshot.generated_at_ms}};
}

nlohmann::json resource_timing_to_json(const ResourceTiming &timing) {
  return {{"index", timing.index},
          {"url", timing.url},
          {"method", timing.method},
          {"mime_category", timing.mime_category},
          {"status", timing.status},
          {"size_bytes", timing.size_bytes},
          {"duration_ms", timing.duration_ms},
          {"start_offset_ms", timing.start_offset_ms},
          {"end_offset_ms", timing.end_offset_ms},
          {"domain", timing.domain}};
}

nlohmann::json waterfall_to_json(const Waterfall &waterfall) {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto &timing : waterfall.entries)
    entries.push_back(resource_timing_to_json(timing));
  return {{"entries", entries},
          {"warnings", waterfall.warnings},
          {"total_duration_ms", waterfall.total_duration_ms}};
}

nlohmann::json event_to_envelope(const BusEvent &event) {
  nlohmann::json data = std::visit(
      overloaded{
          [](const LogEvent &e) {
            return record_to_json({e.entry, e.decision, e.detection});
          },
          [](const TunnelAlertEvent &e) {
            return detection_to_json(*e.detection);
          },
          [](const StatsUpdateEvent &e) { return stats_to_json(e.snapshot); },
          [](const BlockAddedEvent &e) { return rule_to_json(e.rule); },
          [](const ConnectedEvent &e) {
            return nlohmann::json{{"subscriber_id", e.subscriber_id}};
          },
          [](const PongEvent &e) {
            return nlohmann::json{{"timestamp_ms", e.timestamp_ms}};
          }},
      event);
  return {{"type", event_type_name(event)}, {"data", std::move(data)}};
}

std::string format_detection_line(const TunnelDetection &detection) {
  return dump(detection_to_json(detection));
}

std::string dump(const nlohmann::json &j, int indent) {
  return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace JsonFormatter
