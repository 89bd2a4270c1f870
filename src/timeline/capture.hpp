#ifndef CAPTURE_HPP
#define CAPTURE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// One request/response pair as recorded in a HAR-like capture
struct CapturedExchange {
  size_t index = 0; // position in the original capture
  std::string url;
  std::string method;
  int status = 0;
  std::string mime_type;
  std::optional<int64_t> body_size;
  std::optional<int64_t> content_size;
  // Timing phases in capture order; non-numeric values are already dropped
  std::vector<std::pair<std::string, double>> timings;
};

struct Capture {
  std::vector<CapturedExchange> exchanges;
  // Entries that could not be used, one message per skipped entry
  std::vector<std::string> warnings;
};

struct ResourceTiming {
  size_t index = 0;
  std::string url;
  std::string method;
  std::string mime_category;
  int status = 0;
  uint64_t size_bytes = 0;
  double duration_ms = 0.0;
  double start_offset_ms = 0.0;
  double end_offset_ms = 0.0;
  std::string domain;
};

struct Waterfall {
  std::vector<ResourceTiming> entries;
  std::vector<std::string> warnings;
  double total_duration_ms = 0.0;
};

#endif // CAPTURE_HPP
