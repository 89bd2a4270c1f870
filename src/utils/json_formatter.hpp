#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/bus_event.hpp"
#include "core/recent_store.hpp"
#include "core/stats_snapshot.hpp"
#include "core/tunnel_detection.hpp"
#include "detection/block_rule.hpp"
#include "nlohmann/json.hpp"
#include "timeline/capture.hpp"

#include <string>

// JSON shapes shared by the HTTP interfaces, the live stream and the alert
// dispatchers
namespace JsonFormatter {

nlohmann::json headers_to_json(const HeaderList &headers);
nlohmann::json body_to_json(const BodyCapture &body);
nlohmann::json entry_to_json(const LogEntry &entry);

nlohmann::json rule_to_json(const BlockRule &rule);
nlohmann::json decision_to_json(const BlockDecision &decision);

nlohmann::json detection_to_json(const TunnelDetection &detection);
nlohmann::json record_to_json(const ProcessedRecord &record);

nlohmann::json stats_to_json(const StatsSnapshot &snapshot);

nlohmann::json resource_timing_to_json(const ResourceTiming &timing);
nlohmann::json waterfall_to_json(const Waterfall &waterfall);

// {"type": <kind>, "data": {...}}
nlohmann::json event_to_envelope(const BusEvent &event);

// Compact single-line form used for NDJSON output
std::string format_detection_line(const TunnelDetection &detection);

// Serialises for the wire; invalid UTF-8 in captured bodies and headers is
// replaced with U+FFFD instead of throwing
std::string dump(const nlohmann::json &j, int indent = -1);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
