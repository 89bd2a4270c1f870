#include "har_parser.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <cstdint>
#include <string>

namespace {

std::optional<int64_t> optional_integer(const nlohmann::json &object,
                                        const char *key) {
  if (!object.is_object())
    return std::nullopt;
  auto it = object.find(key);
  if (it == object.end() || !it->is_number())
    return std::nullopt;
  return it->get<int64_t>();
}

std::string optional_string(const nlohmann::json &object, const char *key) {
  if (!object.is_object())
    return "";
  auto it = object.find(key);
  if (it == object.end() || !it->is_string())
    return "";
  return it->get<std::string>();
}

const nlohmann::json &member_or_null(const nlohmann::json &object,
                                     const char *key) {
  static const nlohmann::json null_value;
  if (!object.is_object())
    return null_value;
  auto it = object.find(key);
  return it == object.end() ? null_value : *it;
}

} // namespace

namespace HarParser {

CapturedExchange parse_entry(const nlohmann::json &entry, size_t index) {
  if (!entry.is_object())
    throw ValidationError("entry " + std::to_string(index) +
                          ": not an object");

  const auto &request = member_or_null(entry, "request");
  std::string url = optional_string(request, "url");
  if (url.empty())
    throw ValidationError("entry " + std::to_string(index) +
                          ": missing request url");

  CapturedExchange exchange;
  exchange.index = index;
  exchange.url = std::move(url);
  exchange.method = optional_string(request, "method");
  if (exchange.method.empty())
    exchange.method = "GET";

  const auto &response = member_or_null(entry, "response");
  exchange.status =
      static_cast<int>(optional_integer(response, "status").value_or(0));
  exchange.body_size = optional_integer(response, "bodySize");

  const auto &content = member_or_null(response, "content");
  exchange.mime_type = optional_string(content, "mimeType");
  exchange.content_size = optional_integer(content, "size");

  const auto &timings = member_or_null(entry, "timings");
  if (timings.is_object())
    for (const auto &phase : timings.items())
      if (phase.value().is_number())
        exchange.timings.emplace_back(phase.key(),
                                      phase.value().get<double>());
  return exchange;
}

Capture parse(const nlohmann::json &document) {
  const nlohmann::json *entries = nullptr;
  const auto &log = member_or_null(document, "log");
  if (member_or_null(log, "entries").is_array())
    entries = &log["entries"];
  else if (member_or_null(document, "entries").is_array())
    entries = &document["entries"];
  else
    throw ValidationError("capture has neither log.entries nor entries array");

  Capture capture;
  capture.exchanges.reserve(entries->size());
  for (size_t i = 0; i < entries->size(); ++i) {
    try {
      capture.exchanges.push_back(parse_entry((*entries)[i], i));
    } catch (const ValidationError &e) {
      LOG(LogLevel::WARN, LogComponent::TIMELINE,
          "Skipping capture entry: " << e.what());
      capture.warnings.emplace_back(e.what());
    }
  }
  return capture;
}

Capture parse(const std::string &text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    throw ValidationError(std::string("capture is not valid JSON: ") +
                          e.what());
  }
  return parse(document);
}

} // namespace HarParser
