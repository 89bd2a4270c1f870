#include "indicators.hpp"
#include "utils/utils.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

namespace {

// Request headers every browser or HTTP library sends; never counted towards
// header entropy.
constexpr std::array<std::string_view, 24> STANDARD_REQUEST_HEADERS = {
    "accept",          "accept-encoding",  "accept-language",
    "authorization",   "cache-control",    "connection",
    "content-length",  "content-type",     "cookie",
    "host",            "if-modified-since", "if-none-match",
    "origin",          "pragma",           "referer",
    "sec-fetch-dest",  "sec-fetch-mode",   "sec-fetch-site",
    "sec-websocket-key", "sec-websocket-version", "upgrade",
    "user-agent",      "x-forwarded-for",  "x-real-ip"};

bool is_standard_header(std::string_view name) {
  for (auto standard : STANDARD_REQUEST_HEADERS)
    if (Utils::iequals(name, standard))
      return true;
  return false;
}

std::string path_and_query(const LogEntry &entry) {
  if (entry.query.empty())
    return entry.path;
  return entry.path + "?" + entry.query;
}

std::string format_ratio(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value;
  return oss.str();
}

bool content_type_matches(std::string_view header_value,
                          const std::vector<std::string> &content_types) {
  // Ignore parameters such as "; charset=binary"
  auto media_type = header_value.substr(0, header_value.find(';'));
  std::string trimmed = Utils::trim_copy(media_type);
  for (const auto &candidate : content_types)
    if (Utils::iequals(trimmed, candidate))
      return true;
  return false;
}

// libstdc++ regex recursion grows with the input; only prefixes are searched
constexpr size_t REGEX_SCAN_LIMIT = 4096;

std::string bounded(const std::string &text) {
  return text.substr(0, REGEX_SCAN_LIMIT);
}

bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

size_t find_ci(std::string_view haystack, std::string_view needle, size_t from) {
  for (size_t i = from; i + needle.size() <= haystack.size(); ++i)
    if (Utils::iequals(haystack.substr(i, needle.size()), needle))
      return i;
  return std::string_view::npos;
}

// "cmd=<word>&data=" anywhere in the text
bool has_cmd_data_pair(std::string_view text) {
  constexpr std::string_view cmd = "cmd=";
  constexpr std::string_view data = "&data=";
  size_t pos = find_ci(text, cmd, 0);
  while (pos != std::string_view::npos) {
    size_t i = pos + cmd.size();
    size_t word_start = i;
    while (i < text.size() && is_word_char(text[i]))
      ++i;
    if (i > word_start && Utils::iequals(text.substr(i, data.size()), data))
      return true;
    pos = find_ci(text, cmd, i > pos + 1 ? i : pos + 1);
  }
  return false;
}

// "action=read|write|open|close" anywhere in the text
bool has_socket_action(std::string_view text) {
  constexpr std::string_view action = "action=";
  static const std::array<std::string_view, 4> verbs = {"read", "write",
                                                        "open", "close"};
  for (size_t pos = find_ci(text, action, 0); pos != std::string_view::npos;
       pos = find_ci(text, action, pos + 1)) {
    auto rest = text.substr(pos + action.size());
    for (auto verb : verbs)
      if (rest.size() >= verb.size() &&
          Utils::iequals(rest.substr(0, verb.size()), verb))
        return true;
  }
  return false;
}

} // namespace

namespace Indicators {

Evidence tunnel_headers(const LogEntry &entry,
                        const std::vector<std::string> &header_names) {
  for (const auto &name : header_names)
    if (entry.find_request_header(name))
      return "tunnel header present: " + name;
  return std::nullopt;
}

Evidence opaque_content_type(const LogEntry &entry,
                             const std::vector<std::string> &content_types) {
  if (auto request_type = entry.find_request_header("content-type"))
    if (content_type_matches(*request_type, content_types))
      return "opaque request content type: " + std::string(*request_type);

  auto response_type = entry.response_content_type();
  if (!response_type.empty() &&
      content_type_matches(response_type, content_types))
    return "opaque response content type: " + std::string(response_type);
  return std::nullopt;
}

Evidence chunked_unbuffered(const LogEntry &entry) {
  auto transfer_encoding = entry.find_response_header("transfer-encoding");
  if (!transfer_encoding)
    transfer_encoding = entry.find_request_header("transfer-encoding");
  if (!transfer_encoding || !Utils::contains_ci(*transfer_encoding, "chunked"))
    return std::nullopt;

  if (entry.find_response_header("x-accel-buffering") ||
      entry.find_request_header("x-accel-buffering"))
    return std::string("chunked transfer with proxy buffering disabled");
  return std::nullopt;
}

Evidence suspicious_path(const LogEntry &entry,
                         const Utils::AhoCorasick &path_matcher) {
  if (path_matcher.empty())
    return std::nullopt;
  if (auto hit = path_matcher.find_first(entry.path))
    return "suspicious path segment: " + *hit;
  return std::nullopt;
}

Evidence webshell_command(const LogEntry &entry) {
  static const std::array<std::string_view, 4> signatures = {
      ".php?cmd=", ".asp?exec=", ".aspx?cmd=", ".jsp?c="};

  std::string target = path_and_query(entry);
  for (auto signature : signatures)
    if (Utils::contains_ci(target, signature))
      return "webshell command parameter: " + std::string(signature);
  return std::nullopt;
}

Evidence tunna_pattern(const LogEntry &entry) {
  static const std::regex conn_id(R"(/conn\?[a-f0-9]+)", std::regex::icase);

  std::string target = path_and_query(entry);
  if (std::regex_search(bounded(target), conn_id))
    return std::string("tunna connection id in url");
  if (has_cmd_data_pair(target) || has_cmd_data_pair(entry.request_body.data))
    return std::string("tunna cmd/data parameters");
  if (has_socket_action(target) || has_socket_action(entry.request_body.data))
    return std::string("tunna socket action parameter");

  if (auto x_cmd = entry.find_request_header("x-cmd")) {
    std::string value = Utils::to_lower_copy(Utils::trim_copy(*x_cmd));
    if (value == "read" || value == "write")
      return "tunna X-CMD header: " + value;
  }
  return std::nullopt;
}

Evidence high_body_entropy(const LogEntry &entry, double threshold,
                           size_t min_bytes) {
  const auto &body = entry.request_body.data;
  if (body.size() < min_bytes)
    return std::nullopt;

  double entropy = Utils::normalized_shannon_entropy(body);
  if (entropy > threshold)
    return "request body entropy " + format_ratio(entropy);
  return std::nullopt;
}

Evidence high_header_entropy(const LogEntry &entry, double threshold,
                             size_t min_bytes) {
  size_t custom_bytes = 0;
  double highest = 0.0;
  std::string highest_name;

  for (const auto &[name, value] : entry.request_headers) {
    if (is_standard_header(name))
      continue;
    custom_bytes += value.size();
    double entropy = Utils::relative_shannon_entropy(value);
    if (entropy > highest) {
      highest = entropy;
      highest_name = name;
    }
  }

  if (custom_bytes < min_bytes || highest <= threshold)
    return std::nullopt;
  return "high entropy header " + Utils::to_lower_copy(highest_name) + " (" +
         format_ratio(highest) + ")";
}

Evidence long_polling(const LogEntry &entry, uint64_t threshold_ms) {
  if (entry.response_time_ms > threshold_ms)
    return "response held open for " + std::to_string(entry.response_time_ms) +
           " ms";
  return std::nullopt;
}

Evidence large_upload_small_response(const LogEntry &entry,
                                     uint64_t min_request_bytes,
                                     uint64_t max_response_bytes) {
  if (entry.request_body.size > min_request_bytes &&
      entry.response_body.size < max_response_bytes)
    return "upload of " + std::to_string(entry.request_body.size) +
           " bytes answered with " + std::to_string(entry.response_body.size) +
           " bytes";
  return std::nullopt;
}

Evidence small_request_burst(const IpHistoryView &history, uint64_t window_ms,
                             size_t min_requests, uint64_t max_body_bytes) {
  if (history.empty())
    return std::nullopt;

  uint64_t latest = history.latest().timestamp_ms;
  uint64_t cutoff = latest > window_ms ? latest - window_ms : 0;

  size_t small = 0;
  for (size_t i = history.size(); i-- > 0;) {
    const auto &sample = history.at(i);
    if (sample.timestamp_ms < cutoff)
      break;
    if (sample.request_bytes < max_body_bytes)
      ++small;
  }

  if (small > min_requests)
    return std::to_string(small) + " small requests within " +
           std::to_string(window_ms / 1000) + " s";
  return std::nullopt;
}

Evidence beaconing(const IpHistoryView &history, size_t min_samples,
                   double max_coefficient_of_variation,
                   uint64_t max_mean_interval_ms) {
  if (history.size() < min_samples || history.size() < 3)
    return std::nullopt;

  size_t n = history.size() - 1;
  double sum = 0.0;
  for (size_t i = 1; i < history.size(); ++i)
    sum += static_cast<double>(history.at(i).timestamp_ms) -
           static_cast<double>(history.at(i - 1).timestamp_ms);
  double mean = sum / static_cast<double>(n);
  if (mean <= 0.0 || mean >= static_cast<double>(max_mean_interval_ms))
    return std::nullopt;

  double squared = 0.0;
  for (size_t i = 1; i < history.size(); ++i) {
    double interval = static_cast<double>(history.at(i).timestamp_ms) -
                      static_cast<double>(history.at(i - 1).timestamp_ms);
    squared += (interval - mean) * (interval - mean);
  }
  double cv = std::sqrt(squared / static_cast<double>(n)) / mean;

  if (cv < max_coefficient_of_variation)
    return "regular interval of " + std::to_string(static_cast<uint64_t>(mean)) +
           " ms (cv " + format_ratio(cv) + ")";
  return std::nullopt;
}

Evidence dns_over_http(const LogEntry &entry) {
  if (Utils::contains_ci(entry.path, "/dns-query"))
    return std::string("DNS-over-HTTPS endpoint");

  if (auto content_type = entry.find_request_header("content-type"))
    if (Utils::contains_ci(*content_type, "application/dns-message"))
      return std::string("DNS wire format request body");
  if (auto accept = entry.find_request_header("accept"))
    if (Utils::contains_ci(*accept, "application/dns-message"))
      return std::string("DNS wire format requested");

  for (auto param : Utils::split_string_view(entry.query, '&'))
    if (param.size() > 4 && Utils::iequals(param.substr(0, 4), "dns="))
      return std::string("DNS message in query string");
  return std::nullopt;
}

Evidence websocket_abuse(const LogEntry &entry,
                         const Utils::AhoCorasick &path_matcher,
                         double body_entropy_threshold,
                         size_t body_entropy_min_bytes) {
  auto upgrade = entry.find_request_header("upgrade");
  if (!upgrade || !Utils::iequals(Utils::trim_copy(*upgrade), "websocket"))
    return std::nullopt;

  if (!path_matcher.empty())
    if (auto hit = path_matcher.find_first(entry.path))
      return "websocket upgrade on suspicious path: " + *hit;
  if (high_body_entropy(entry, body_entropy_threshold, body_entropy_min_bytes))
    return std::string("websocket upgrade with opaque payload");
  if (!entry.find_request_header("origin"))
    return std::string("websocket upgrade without Origin header");
  return std::nullopt;
}

} // namespace Indicators
