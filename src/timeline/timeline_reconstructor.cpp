#include "timeline_reconstructor.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/utils.hpp"

#include <algorithm>

namespace Timeline {

std::optional<SortKey> sort_key_from_string(std::string_view name) {
  std::string key = Utils::to_lower_copy(Utils::trim_copy(name));
  if (key == "time" || key == "duration")
    return SortKey::DURATION;
  if (key == "size")
    return SortKey::SIZE;
  if (key == "domain")
    return SortKey::DOMAIN;
  return std::nullopt;
}

std::string mime_category(std::string_view mime_type) {
  size_t slash = mime_type.find('/');
  if (slash == std::string_view::npos || slash == 0)
    return "other";
  return Utils::to_lower_copy(Utils::trim_copy(mime_type.substr(0, slash)));
}

uint64_t resolved_size(const CapturedExchange &exchange) {
  if (exchange.body_size && *exchange.body_size >= 0)
    return static_cast<uint64_t>(*exchange.body_size);
  if (exchange.content_size && *exchange.content_size >= 0)
    return static_cast<uint64_t>(*exchange.content_size);
  return 0;
}

// HAR uses -1 for phases that do not apply
double phase_duration(const CapturedExchange &exchange) {
  double total = 0.0;
  for (const auto &[phase, value] : exchange.timings)
    if (value > 0.0)
      total += value;
  return total;
}

Waterfall reconstruct(const Capture &capture) {
  static prometheus::Counter &reconstructions =
      MetricsRegistry::instance().create_counter(
          "tm_waterfall_reconstructions_total",
          "Captures reconstructed into a waterfall");

  Waterfall waterfall;
  waterfall.warnings = capture.warnings;
  waterfall.entries.reserve(capture.exchanges.size());

  double cursor = 0.0;
  for (const auto &exchange : capture.exchanges) {
    ResourceTiming timing;
    timing.index = exchange.index;
    timing.url = exchange.url;
    timing.method = exchange.method;
    timing.mime_category = mime_category(exchange.mime_type);
    timing.status = exchange.status;
    timing.size_bytes = resolved_size(exchange);
    timing.duration_ms = phase_duration(exchange);
    timing.start_offset_ms = cursor;
    timing.end_offset_ms = cursor + timing.duration_ms;
    timing.domain = Utils::url_host(exchange.url);
    cursor = timing.end_offset_ms;
    waterfall.entries.push_back(std::move(timing));
  }
  waterfall.total_duration_ms = cursor;

  reconstructions.Increment();
  LOG(LogLevel::DEBUG, LogComponent::TIMELINE,
      "Reconstructed " << waterfall.entries.size() << " entries ("
                       << waterfall.warnings.size() << " skipped), total "
                       << waterfall.total_duration_ms << " ms");
  return waterfall;
}

Waterfall filter_by_mime(const Waterfall &waterfall,
                         std::string_view category) {
  Waterfall view;
  view.warnings = waterfall.warnings;
  view.total_duration_ms = waterfall.total_duration_ms;
  for (const auto &entry : waterfall.entries)
    if (Utils::iequals(entry.mime_category, category))
      view.entries.push_back(entry);
  return view;
}

Waterfall sort_by(const Waterfall &waterfall, SortKey key) {
  Waterfall view = waterfall;
  auto &entries = view.entries;
  switch (key) {
  case SortKey::DURATION:
    std::stable_sort(entries.begin(), entries.end(),
                     [](const ResourceTiming &a, const ResourceTiming &b) {
                       return a.duration_ms > b.duration_ms;
                     });
    break;
  case SortKey::SIZE:
    std::stable_sort(entries.begin(), entries.end(),
                     [](const ResourceTiming &a, const ResourceTiming &b) {
                       return a.size_bytes > b.size_bytes;
                     });
    break;
  case SortKey::DOMAIN:
    std::stable_sort(entries.begin(), entries.end(),
                     [](const ResourceTiming &a, const ResourceTiming &b) {
                       return a.domain < b.domain;
                     });
    break;
  }
  return view;
}

} // namespace Timeline
