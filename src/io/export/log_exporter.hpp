#ifndef LOG_EXPORTER_HPP
#define LOG_EXPORTER_HPP

#include "core/recent_store.hpp"
#include "nlohmann/json.hpp"

#include <optional>
#include <string>
#include <vector>

enum class ExportFormat { JSON, CSV, HAR };

std::optional<ExportFormat> export_format_from_string(const std::string &name);
const char *export_format_to_string(ExportFormat format);

// Renders processed records for download. Records are written in the order
// given (the recent window hands them out newest first).
namespace LogExporter {

std::string content_type(ExportFormat format);
std::string render(const std::vector<ProcessedRecord> &records,
                   ExportFormat format);

// One row per record: id, timestamp, ip, method, path, status,
// response_time_ms, has_tunnel, tunnel_type, confidence
std::string to_csv(const std::vector<ProcessedRecord> &records);

// HAR 1.2 document; the timeline reconstructor reads it back
nlohmann::json to_har(const std::vector<ProcessedRecord> &records);

} // namespace LogExporter

#endif // LOG_EXPORTER_HPP
