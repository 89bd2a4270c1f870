#include "network_api.hpp"
#include "core/logger.hpp"
#include "io/export/log_exporter.hpp"
#include "timeline/har_parser.hpp"
#include "timeline/timeline_reconstructor.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <future>
#include <string>
#include <vector>

namespace {

constexpr auto INGEST_TIMEOUT = std::chrono::seconds(10);

nlohmann::json rules_to_json(const std::vector<BlockRule> &rules) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &rule : rules)
    j.push_back(JsonFormatter::rule_to_json(rule));
  return j;
}

std::string string_field(const nlohmann::json &j, const char *key,
                         bool required) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    if (required)
      throw ValidationError(std::string("missing field: ") + key);
    return "";
  }
  if (!it->is_string())
    throw ValidationError(std::string("field must be a string: ") + key);
  return it->get<std::string>();
}

} // namespace

NetworkApi::NetworkApi(NetworkServices services,
                       const Config::RecentWindowConfig &window_config)
    : services_(services), window_config_(window_config) {}

ApiResponse NetworkApi::to_error_response(ErrorCode code,
                                          const std::string &message) {
  return {error_code_to_http_status(code),
          {{"error",
            {{"code", error_code_to_string(code)}, {"message", message}}}}};
}

std::string NetworkApi::identity_from_authorization(const std::string &header) {
  std::string value = Utils::trim_copy(header);
  if (value.size() > 7 && Utils::iequals(value.substr(0, 7), "bearer "))
    return Utils::trim_copy(value.substr(7));
  return value;
}

std::optional<std::string> NetworkApi::param(const QueryParams &params,
                                             const std::string &name) {
  auto it = params.find(name);
  if (it == params.end())
    return std::nullopt;
  return it->second;
}

size_t NetworkApi::parse_limit(const QueryParams &params) const {
  auto raw = param(params, "limit");
  if (!raw)
    return window_config_.default_page_size;
  auto limit = Utils::string_to_number<size_t>(Utils::trim_copy(*raw));
  if (raw->empty() || !limit || *limit < 1 ||
      *limit > window_config_.max_page_size)
    throw ValidationError("limit must be between 1 and " +
                          std::to_string(window_config_.max_page_size));
  return *limit;
}

size_t NetworkApi::parse_offset(const QueryParams &params) {
  auto raw = param(params, "offset");
  if (!raw)
    return 0;
  auto offset = Utils::string_to_number<size_t>(Utils::trim_copy(*raw));
  if (!offset)
    throw ValidationError("offset must be a non-negative integer");
  return *offset;
}

RecordFilter NetworkApi::parse_filter(const QueryParams &params) {
  RecordFilter filter;
  auto text = [&params](const char *name) -> std::optional<std::string> {
    auto raw = param(params, name);
    if (!raw)
      return std::nullopt;
    std::string trimmed = Utils::trim_copy(*raw);
    if (trimmed.empty())
      return std::nullopt;
    return trimmed;
  };

  filter.source_ip = text("ip");
  filter.path = text("endpoint");
  filter.method = text("method");

  if (auto raw = text("status")) {
    auto status = Utils::string_to_number<int>(*raw);
    if (!status || *status < 100 || *status > 599)
      throw ValidationError("status must be an HTTP status code");
    filter.status = *status;
  }
  if (auto raw = text("has_tunnel")) {
    std::string lowered = Utils::to_lower_copy(*raw);
    if (lowered == "true" || lowered == "1")
      filter.has_tunnel = true;
    else if (lowered == "false" || lowered == "0")
      filter.has_tunnel = false;
    else
      throw ValidationError("has_tunnel must be true or false");
  }
  for (const char *name : {"start_time", "end_time"}) {
    auto raw = text(name);
    if (!raw)
      continue;
    auto ms = Utils::parse_timestamp_ms(*raw);
    if (!ms)
      throw ValidationError(std::string(name) +
                            " must be epoch milliseconds or ISO-8601");
    (std::string(name) == "start_time" ? filter.start_ms : filter.end_ms) = *ms;
  }
  if (filter.start_ms && filter.end_ms && *filter.start_ms > *filter.end_ms)
    throw ValidationError("start_time must not be after end_time");
  return filter;
}

nlohmann::json NetworkApi::parse_body(const std::string &body) {
  try {
    auto j = nlohmann::json::parse(body);
    if (!j.is_object())
      throw ValidationError("request body must be a JSON object");
    return j;
  } catch (const nlohmann::json::parse_error &e) {
    throw ValidationError(std::string("request body is not valid JSON: ") +
                          e.what());
  }
}

ApiResponse NetworkApi::ingest(const std::string &body,
                               const std::string &peer_address) {
  RawObservation raw = IngestAdapter::observation_from_json(parse_body(body));
  if (raw.peer_address.empty())
    raw.peer_address = peer_address;

  auto pending = services_.pipeline.submit(std::move(raw));
  if (pending.wait_for(INGEST_TIMEOUT) != std::future_status::ready)
    throw TransientTransportError("entry was queued but not processed in time");
  ProcessedRecord record = pending.get();

  nlohmann::json j;
  j["entry_id"] = record.entry->id;
  j["decision"] = record.decision.denied ? "deny" : "allow";
  if (record.decision.matched_rule)
    j["rule"] = JsonFormatter::rule_to_json(*record.decision.matched_rule);
  if (record.detection)
    j["tunnel"] = JsonFormatter::detection_to_json(*record.detection);
  return {200, j};
}

ApiResponse NetworkApi::list_logs(const QueryParams &params) const {
  size_t limit = parse_limit(params);
  size_t offset = parse_offset(params);
  RecordFilter filter = parse_filter(params);

  nlohmann::json entries = nlohmann::json::array();
  for (const auto &record : services_.store.list_entries(limit, offset, filter))
    entries.push_back(JsonFormatter::record_to_json(record));
  return {200,
          {{"entries", entries},
           {"count", entries.size()},
           {"limit", limit},
           {"offset", offset},
           {"total", services_.store.size()}}};
}

ApiResponse NetworkApi::search_logs(const QueryParams &params) const {
  auto query = param(params, "q");
  if (!query || Utils::trim_copy(*query).empty())
    throw ValidationError("q query parameter is required");
  size_t limit = parse_limit(params);

  nlohmann::json entries = nlohmann::json::array();
  for (const auto &record :
       services_.store.search(Utils::trim_copy(*query), limit))
    entries.push_back(JsonFormatter::record_to_json(record));
  return {200, {{"entries", entries}, {"count", entries.size()}}};
}

ApiResponse NetworkApi::export_logs(const std::string &body) const {
  nlohmann::json request =
      Utils::trim_copy(body).empty() ? nlohmann::json::object() : parse_body(body);

  std::string format_name = string_field(request, "format", false);
  auto format = export_format_from_string(format_name.empty() ? "json"
                                                              : format_name);
  if (!format)
    throw ValidationError("format must be one of json, csv, har");

  // Time bounds and filters share the /logs parsing
  QueryParams params;
  for (const char *key : {"start_time", "end_time"}) {
    auto it = request.find(key);
    if (it != request.end() && !it->is_null())
      params.emplace(key, it->is_string() ? it->get<std::string>() : it->dump());
  }
  if (auto filters = request.find("filters");
      filters != request.end() && !filters->is_null()) {
    if (!filters->is_object())
      throw ValidationError("filters must be an object");
    for (const auto &item : filters->items()) {
      if (item.value().is_null())
        continue;
      params.emplace(item.key(), item.value().is_string()
                                     ? item.value().get<std::string>()
                                     : item.value().dump());
    }
  }
  RecordFilter filter = parse_filter(params);

  auto records =
      services_.store.list_entries(services_.store.capacity(), 0, filter);
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Exporting " << records.size() << " entries as "
                   << export_format_to_string(*format));

  ApiResponse response;
  response.text = LogExporter::render(records, *format);
  response.content_type = LogExporter::content_type(*format);
  response.attachment_name =
      std::string("network_logs.") + export_format_to_string(*format);
  return response;
}

ApiResponse NetworkApi::get_log(const std::string &entry_id) const {
  auto record = services_.store.find(entry_id);
  if (!record)
    throw NotFoundError("log entry " + entry_id + " not found");
  return {200, JsonFormatter::record_to_json(*record)};
}

ApiResponse NetworkApi::list_tunnels(const QueryParams &params) const {
  size_t limit = parse_limit(params);
  size_t offset = parse_offset(params);
  Confidence floor = Confidence::LOW;
  if (auto raw = param(params, "min_confidence")) {
    auto parsed = confidence_from_string(*raw);
    if (!parsed)
      throw ValidationError("min_confidence must be one of low, medium, "
                            "high, confirmed");
    floor = *parsed;
  }

  nlohmann::json detections = nlohmann::json::array();
  for (const auto &detection :
       services_.store.list_detections(limit, offset, floor))
    detections.push_back(JsonFormatter::detection_to_json(*detection));
  return {200,
          {{"detections", detections}, {"limit", limit}, {"offset", offset}}};
}

ApiResponse NetworkApi::get_stats() const {
  return {200, JsonFormatter::stats_to_json(services_.stats.snapshot())};
}

ApiResponse NetworkApi::list_alerts(const QueryParams &params) const {
  if (!services_.alerts)
    throw NotFoundError("alerting is not enabled");
  nlohmann::json alerts = nlohmann::json::array();
  for (const auto &alert : services_.alerts->get_recent_alerts(parse_limit(params)))
    alerts.push_back(JsonFormatter::detection_to_json(*alert));
  return {200, {{"alerts", alerts}}};
}

ApiResponse NetworkApi::list_blocks() const {
  nlohmann::json j;
  for (size_t i = 0; i < BLOCK_RULE_KIND_COUNT; ++i) {
    auto kind = static_cast<BlockRuleKind>(i);
    j[block_rule_kind_to_string(kind)] =
        rules_to_json(services_.enforcer.list_rules(kind));
  }
  return {200, j};
}

ApiResponse NetworkApi::list_blocks(const std::string &kind_name) const {
  auto kind = block_rule_kind_from_string(kind_name);
  if (!kind)
    throw NotFoundError("unknown block rule kind: " + kind_name);
  return {200, {{"rules", rules_to_json(services_.enforcer.list_rules(*kind))}}};
}

ApiResponse NetworkApi::add_block(const std::string &kind_name,
                                  const std::string &body,
                                  const std::string &authorization) {
  auto kind = block_rule_kind_from_string(kind_name);
  if (!kind)
    throw NotFoundError("unknown block rule kind: " + kind_name);

  nlohmann::json j = parse_body(body);
  BlockRuleSpec spec;
  switch (*kind) {
  case BlockRuleKind::IP:
    spec = IpRule{string_field(j, "ip", true)};
    break;
  case BlockRuleKind::ENDPOINT:
    spec = EndpointRule{string_field(j, "method", false),
                        string_field(j, "pattern", true)};
    break;
  case BlockRuleKind::PATTERN:
    spec = PatternRule{string_field(j, "field", true),
                       string_field(j, "value", true)};
    break;
  }

  std::string rule_id = services_.enforcer.add_rule(
      std::move(spec), string_field(j, "reason", false),
      identity_from_authorization(authorization));

  for (const auto &rule : services_.enforcer.list_rules(*kind))
    if (rule.id == rule_id)
      return {201, {{"rule", JsonFormatter::rule_to_json(rule)}}};
  throw InvariantViolation("rule " + rule_id + " missing right after insert");
}

ApiResponse NetworkApi::removal_response(bool removed,
                                         const std::string &what) const {
  if (!removed) {
    ApiResponse response =
        to_error_response(ErrorCode::NOT_FOUND, what + " not found");
    response.body["removed"] = false;
    return response;
  }
  return {200, {{"removed", true}}};
}

ApiResponse NetworkApi::remove_ip_block(const std::string &ip) {
  IpRule rule{ip};
  return removal_response(services_.enforcer.remove_rule(rule),
                          "ip rule " + rule.value);
}

ApiResponse NetworkApi::remove_ip_block(const QueryParams &params) {
  auto ip = param(params, "ip");
  if (!ip || Utils::trim_copy(*ip).empty())
    throw ValidationError("ip query parameter is required");
  return remove_ip_block(Utils::trim_copy(*ip));
}

ApiResponse NetworkApi::remove_endpoint_block(const QueryParams &params) {
  auto pattern = param(params, "pattern");
  if (!pattern || pattern->empty())
    throw ValidationError("pattern query parameter is required");
  EndpointRule rule{param(params, "method").value_or("ALL"), *pattern};
  return removal_response(services_.enforcer.remove_rule(rule),
                          "endpoint rule " + *pattern);
}

ApiResponse NetworkApi::remove_pattern_block(const QueryParams &params) {
  auto field = param(params, "field");
  auto value = param(params, "value");
  if (!field || !value)
    throw ValidationError("field and value query parameters are required");
  PatternRule rule{*field, *value};
  return removal_response(services_.enforcer.remove_rule(rule),
                          "pattern rule " + *field + "=" + *value);
}

ApiResponse NetworkApi::remove_block_by_id(const std::string &rule_id) {
  return removal_response(services_.enforcer.remove_rule_by_id(rule_id),
                          "rule " + rule_id);
}

ApiResponse NetworkApi::submit_capture(const std::string &body) {
  Capture capture = HarParser::parse(body);
  Waterfall waterfall = Timeline::reconstruct(capture);
  nlohmann::json waterfall_json = JsonFormatter::waterfall_to_json(waterfall);
  std::string capture_id = services_.captures.add(std::move(waterfall));
  return {201, {{"capture_id", capture_id}, {"waterfall", waterfall_json}}};
}

ApiResponse NetworkApi::get_waterfall(const std::string &capture_id,
                                      const QueryParams &params) const {
  Waterfall view = services_.captures.get(capture_id);

  if (auto mime = param(params, "mime"); mime && !mime->empty())
    view = Timeline::filter_by_mime(view, *mime);
  if (auto sort = param(params, "sort"); sort && !sort->empty()) {
    auto key = Timeline::sort_key_from_string(*sort);
    if (!key)
      throw ValidationError("sort must be one of time, size, domain");
    view = Timeline::sort_by(view, *key);
  }
  return {200, JsonFormatter::waterfall_to_json(view)};
}

ApiResponse NetworkApi::stream_message(const std::string &subscriber_id,
                                       const std::string &body) {
  auto id = Utils::string_to_number<uint64_t>(subscriber_id);
  if (subscriber_id.empty() || !id)
    throw ValidationError("subscriber id must be numeric");

  nlohmann::json j = parse_body(body);
  if (string_field(j, "type", true) != "ping")
    throw ValidationError("only ping messages are accepted");
  if (!services_.bus.ping(*id))
    throw NotFoundError("subscriber " + subscriber_id + " not found");
  return {202, {{"accepted", true}}};
}

ApiResponse NetworkApi::health() const {
  return {200,
          {{"status", services_.pipeline.is_running() ? "ok" : "stopped"},
           {"partitions", services_.pipeline.partition_count()},
           {"subscribers", services_.bus.subscriber_count()},
           {"recent_entries", services_.store.size()},
           {"block_rules", services_.enforcer.rule_count()}}};
}
