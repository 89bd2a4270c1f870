#ifndef LOG_ENTRY_HPP
#define LOG_ENTRY_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Ordered header list. Names may repeat and keep their original casing.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// A body as stored by the monitor: `data` is at most the configured cap,
// `size` is always the length of the body that was actually observed.
struct BodyCapture {
  std::string data;
  bool truncated = false;
  uint64_t size = 0;
};

// One observed HTTP exchange. Built once by the ingest adapter and shared
// read-only afterwards.
struct LogEntry {
  uint64_t sequence = 0;
  std::string id;
  uint64_t timestamp_ms = 0;
  std::string source_ip;

  std::string method;
  std::string path;
  std::string query;
  HeaderList request_headers;
  BodyCapture request_body;

  int response_status = 0;
  HeaderList response_headers;
  BodyCapture response_body;
  uint64_t response_time_ms = 0;

  // First header with a case-insensitive name match
  std::optional<std::string_view>
  find_request_header(std::string_view name) const;
  std::optional<std::string_view>
  find_response_header(std::string_view name) const;

  std::string_view user_agent() const;
  std::string_view response_content_type() const;
};

using LogEntryPtr = std::shared_ptr<const LogEntry>;

std::optional<std::string_view> find_header(const HeaderList &headers,
                                            std::string_view name);

#endif // LOG_ENTRY_HPP
