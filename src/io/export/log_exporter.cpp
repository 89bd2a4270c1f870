#include "log_exporter.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <sstream>
#include <string>

namespace {

std::string csv_field(const std::string &value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos)
    return value;
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

nlohmann::json har_headers(const HeaderList &headers) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto &[name, value] : headers)
    list.push_back({{"name", name}, {"value", value}});
  return list;
}

nlohmann::json har_query(const std::string &query) {
  nlohmann::json list = nlohmann::json::array();
  if (query.empty())
    return list;
  for (auto param : Utils::split_string_view(query, '&')) {
    auto eq = param.find('=');
    std::string_view name = param.substr(0, eq);
    std::string_view value =
        eq == std::string_view::npos ? std::string_view{} : param.substr(eq + 1);
    list.push_back(
        {{"name", Utils::url_decode(name)}, {"value", Utils::url_decode(value)}});
  }
  return list;
}

std::string entry_url(const LogEntry &entry) {
  std::string host = "unknown";
  if (auto header = entry.find_request_header("host"))
    host = Utils::trim_copy(*header);
  std::string url = "http://" + host + entry.path;
  if (!entry.query.empty())
    url += "?" + entry.query;
  return url;
}

nlohmann::json har_entry(const ProcessedRecord &record) {
  const LogEntry &entry = *record.entry;

  nlohmann::json request = {
      {"method", entry.method},
      {"url", entry_url(entry)},
      {"httpVersion", "HTTP/1.1"},
      {"headers", har_headers(entry.request_headers)},
      {"queryString", har_query(entry.query)},
      {"cookies", nlohmann::json::array()},
      {"headersSize", -1},
      {"bodySize", entry.request_body.size}};
  if (!entry.request_body.data.empty()) {
    auto content_type = entry.find_request_header("content-type");
    request["postData"] = {
        {"mimeType", content_type ? std::string(*content_type) : ""},
        {"text", entry.request_body.data}};
  }

  std::string mime(entry.response_content_type());
  nlohmann::json response = {
      {"status", entry.response_status},
      {"statusText", ""},
      {"httpVersion", "HTTP/1.1"},
      {"headers", har_headers(entry.response_headers)},
      {"cookies", nlohmann::json::array()},
      {"content",
       {{"size", entry.response_body.size},
        {"mimeType", mime},
        {"text", entry.response_body.data}}},
      {"redirectURL", ""},
      {"headersSize", -1},
      {"bodySize", entry.response_body.size}};

  // Only the total exchange time is observed; it is booked as waiting time
  nlohmann::json timings = {{"send", 0},
                            {"wait", entry.response_time_ms},
                            {"receive", 0}};

  nlohmann::json j = {{"startedDateTime", Utils::format_iso8601_ms(entry.timestamp_ms)},
                      {"time", entry.response_time_ms},
                      {"request", std::move(request)},
                      {"response", std::move(response)},
                      {"cache", nlohmann::json::object()},
                      {"timings", std::move(timings)},
                      {"serverIPAddress", ""},
                      {"_id", entry.id},
                      {"_sourceIp", entry.source_ip}};
  if (record.detection)
    j["_tunnel"] = JsonFormatter::detection_to_json(*record.detection);
  return j;
}

} // namespace

std::optional<ExportFormat> export_format_from_string(const std::string &name) {
  std::string lowered = Utils::to_lower_copy(Utils::trim_copy(name));
  if (lowered == "json")
    return ExportFormat::JSON;
  if (lowered == "csv")
    return ExportFormat::CSV;
  if (lowered == "har")
    return ExportFormat::HAR;
  return std::nullopt;
}

const char *export_format_to_string(ExportFormat format) {
  switch (format) {
  case ExportFormat::JSON:
    return "json";
  case ExportFormat::CSV:
    return "csv";
  case ExportFormat::HAR:
    return "har";
  }
  return "json";
}

namespace LogExporter {

std::string content_type(ExportFormat format) {
  return format == ExportFormat::CSV ? "text/csv" : "application/json";
}

std::string to_csv(const std::vector<ProcessedRecord> &records) {
  std::ostringstream out;
  out << "id,timestamp,ip,method,path,status,response_time_ms,has_tunnel,"
         "tunnel_type,confidence\r\n";
  for (const auto &record : records) {
    const LogEntry &entry = *record.entry;
    const auto &detection = record.detection;
    out << csv_field(entry.id) << ','
        << Utils::format_iso8601_ms(entry.timestamp_ms) << ','
        << csv_field(entry.source_ip) << ',' << csv_field(entry.method) << ','
        << csv_field(entry.path) << ',' << entry.response_status << ','
        << entry.response_time_ms << ',' << (detection ? "yes" : "no") << ','
        << (detection ? tunnel_type_to_string(detection->tunnel_type) : "")
        << ','
        << (detection ? confidence_to_string(detection->confidence) : "")
        << "\r\n";
  }
  return out.str();
}

nlohmann::json to_har(const std::vector<ProcessedRecord> &records) {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto &record : records)
    entries.push_back(har_entry(record));
  return {{"log",
           {{"version", "1.2"},
            {"creator", {{"name", "tunnel_monitor"}, {"version", "1.0.0"}}},
            {"pages", nlohmann::json::array()},
            {"entries", std::move(entries)}}}};
}

std::string render(const std::vector<ProcessedRecord> &records,
                   ExportFormat format) {
  switch (format) {
  case ExportFormat::CSV:
    return to_csv(records);
  case ExportFormat::HAR:
    return JsonFormatter::dump(to_har(records), 2);
  case ExportFormat::JSON:
    break;
  }
  nlohmann::json list = nlohmann::json::array();
  for (const auto &record : records)
    list.push_back(JsonFormatter::record_to_json(record));
  return JsonFormatter::dump(list, 2);
}

} // namespace LogExporter
