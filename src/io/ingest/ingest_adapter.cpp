#include "ingest_adapter.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace {

constexpr const char *REDACTED = "[REDACTED]";

HeaderList headers_from_json(const nlohmann::json &j, const char *field) {
  HeaderList headers;
  if (j.is_null())
    return headers;

  if (j.is_object()) {
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (!it.value().is_string())
        throw ValidationError(std::string(field) + "." + it.key() +
                              " must be a string");
      headers.emplace_back(it.key(), it.value().get<std::string>());
    }
    return headers;
  }

  if (j.is_array()) {
    // Either [["name", "value"], ...] or [{"name": ..., "value": ...}, ...]
    for (const auto &item : j) {
      if (item.is_array() && item.size() == 2 && item[0].is_string() &&
          item[1].is_string())
        headers.emplace_back(item[0].get<std::string>(),
                             item[1].get<std::string>());
      else if (item.is_object() && item.contains("name") &&
               item.contains("value") && item["name"].is_string() &&
               item["value"].is_string())
        headers.emplace_back(item["name"].get<std::string>(),
                             item["value"].get<std::string>());
      else
        throw ValidationError(std::string(field) +
                              " entries must be name/value string pairs");
    }
    return headers;
  }

  throw ValidationError(std::string(field) + " must be an object or array");
}

} // namespace

IngestAdapter::IngestAdapter(const Config::IngestConfig &config)
    : config_(config),
      entries_counter_(MetricsRegistry::instance().create_counter(
          "tm_ingested_entries_total", "Observations normalised into entries")),
      truncated_counter_(MetricsRegistry::instance().create_counter(
          "tm_truncated_bodies_total",
          "Request or response bodies cut at the body-size cap")) {
  for (auto &name : config_.sensitive_headers)
    name = Utils::to_lower_copy(name);
}

LogEntryPtr IngestAdapter::normalize(RawObservation raw) {
  auto entry = std::make_shared<LogEntry>();

  entry->sequence = next_sequence_.fetch_add(1, std::memory_order_relaxed);
  entry->id = "req-" + std::to_string(entry->sequence);
  entry->timestamp_ms = raw.timestamp_ms.value_or(Utils::get_current_time_ms());
  entry->source_ip = resolve_client_ip(raw);
  entry->method = Utils::to_upper_copy(Utils::trim_copy(raw.method));
  if (entry->method.empty())
    entry->method = "GET";

  std::string path = std::move(raw.path);
  if (raw.query) {
    entry->query = std::move(*raw.query);
  } else {
    size_t qpos = path.find('?');
    if (qpos != std::string::npos) {
      entry->query = path.substr(qpos + 1);
      path.erase(qpos);
    }
  }
  entry->path = path.empty() ? "/" : std::move(path);

  entry->request_headers = sanitize_headers(std::move(raw.request_headers));
  entry->request_body =
      capture_body(std::move(raw.request_body), raw.request_body_size);
  entry->response_status = raw.response_status;
  entry->response_headers = sanitize_headers(std::move(raw.response_headers));
  entry->response_body =
      capture_body(std::move(raw.response_body), raw.response_body_size);
  entry->response_time_ms =
      raw.response_time_ms > 0 ? static_cast<uint64_t>(raw.response_time_ms) : 0;

  entries_counter_.Increment();
  LOG(LogLevel::TRACE, LogComponent::IO_INGEST,
      "Normalised " << entry->id << " " << entry->method << " " << entry->path
                    << " from " << entry->source_ip);
  return entry;
}

std::string IngestAdapter::resolve_client_ip(const RawObservation &raw) const {
  if (config_.trust_forwarded_headers) {
    if (auto forwarded = find_header(raw.request_headers, "x-forwarded-for")) {
      auto first = Utils::trim_copy(Utils::split_string_view(*forwarded, ',')[0]);
      if (!first.empty())
        return first;
    }
    if (auto real_ip = find_header(raw.request_headers, "x-real-ip")) {
      auto trimmed = Utils::trim_copy(*real_ip);
      if (!trimmed.empty())
        return trimmed;
    }
  }
  if (!raw.peer_address.empty())
    return raw.peer_address;
  return "unknown";
}

BodyCapture
IngestAdapter::capture_body(std::string body,
                            std::optional<uint64_t> declared_size) const {
  BodyCapture capture;
  capture.size = std::max<uint64_t>(declared_size.value_or(0), body.size());
  if (body.size() > config_.max_body_bytes) {
    body.resize(Utils::utf8_prefix_length(body, config_.max_body_bytes));
    body.shrink_to_fit();
  }
  capture.truncated = capture.size > body.size();
  capture.data = std::move(body);
  if (capture.truncated)
    truncated_counter_.Increment();
  return capture;
}

HeaderList IngestAdapter::sanitize_headers(HeaderList headers) const {
  for (auto &[name, value] : headers) {
    std::string lowered = Utils::to_lower_copy(name);
    if (std::find(config_.sensitive_headers.begin(),
                  config_.sensitive_headers.end(),
                  lowered) != config_.sensitive_headers.end())
      value = REDACTED;
  }
  return headers;
}

RawObservation IngestAdapter::observation_from_json(const nlohmann::json &j) {
  if (!j.is_object())
    throw ValidationError("observation must be a JSON object");

  RawObservation raw;
  try {
    if (!j.contains("path") || !j["path"].is_string())
      throw ValidationError("observation.path is required");
    raw.path = j["path"].get<std::string>();
    if (raw.path.empty())
      throw ValidationError("observation.path must not be empty");

    raw.method = j.value("method", std::string("GET"));
    raw.peer_address = j.value("client_ip", std::string());
    if (j.contains("query") && j["query"].is_string())
      raw.query = j["query"].get<std::string>();

    raw.request_headers =
        headers_from_json(j.value("request_headers", nlohmann::json()),
                          "request_headers");
    raw.response_headers =
        headers_from_json(j.value("response_headers", nlohmann::json()),
                          "response_headers");

    raw.request_body = j.value("request_body", std::string());
    raw.response_body = j.value("response_body", std::string());
    if (j.contains("request_body_size"))
      raw.request_body_size = j["request_body_size"].get<uint64_t>();
    if (j.contains("response_body_size"))
      raw.response_body_size = j["response_body_size"].get<uint64_t>();

    raw.response_status = j.value("status", 0);
    if (raw.response_status < 0 || raw.response_status > 999)
      throw ValidationError("observation.status is out of range");
    raw.response_time_ms = j.value("response_time_ms", int64_t{0});
    if (j.contains("timestamp_ms"))
      raw.timestamp_ms = j["timestamp_ms"].get<uint64_t>();
  } catch (const nlohmann::json::exception &e) {
    throw ValidationError(std::string("observation has a field of the wrong "
                                      "type: ") +
                          e.what());
  }
  return raw;
}
