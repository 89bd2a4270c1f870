#ifndef INGEST_ADAPTER_HPP
#define INGEST_ADAPTER_HPP

#include "core/config.hpp"
#include "core/log_entry.hpp"
#include "nlohmann/json.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace prometheus {
class Counter;
}

// What the monitored edge hands over for one exchange
struct RawObservation {
  std::string peer_address;
  std::string method;
  std::string path;
  std::optional<std::string> query;
  HeaderList request_headers;
  std::string request_body;
  // Set when the edge already cut the body; otherwise the body length is used
  std::optional<uint64_t> request_body_size;
  int response_status = 0;
  HeaderList response_headers;
  std::string response_body;
  std::optional<uint64_t> response_body_size;
  int64_t response_time_ms = 0;
  std::optional<uint64_t> timestamp_ms;
};

class IngestAdapter {
public:
  explicit IngestAdapter(const Config::IngestConfig &config);

  // Safe to call from any number of producer threads
  LogEntryPtr normalize(RawObservation raw);

  // Throws ValidationError on a malformed object
  static RawObservation observation_from_json(const nlohmann::json &j);

  std::string resolve_client_ip(const RawObservation &raw) const;

private:
  BodyCapture capture_body(std::string body,
                           std::optional<uint64_t> declared_size) const;
  HeaderList sanitize_headers(HeaderList headers) const;

  Config::IngestConfig config_;
  std::atomic<uint64_t> next_sequence_{1};
  prometheus::Counter &entries_counter_;
  prometheus::Counter &truncated_counter_;
};

#endif // INGEST_ADAPTER_HPP
