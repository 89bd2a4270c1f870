#ifndef TUNNEL_DETECTION_HPP
#define TUNNEL_DETECTION_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Totally ordered; comparisons between levels are meaningful
enum class Confidence { LOW = 0, MEDIUM = 1, HIGH = 2, CONFIRMED = 3 };

enum class TunnelType {
  HTTP_TUNNEL,
  DNS_TUNNEL,
  WEBSOCKET_COVERT,
  CHUNKED_ENCODING,
  LONG_POLLING,
  BEACONING,
  UNKNOWN
};

const char *confidence_to_string(Confidence confidence);
std::optional<Confidence> confidence_from_string(std::string_view name);

const char *tunnel_type_to_string(TunnelType type);

struct TunnelDetection {
  std::string detection_id;
  std::string entry_id;
  std::string source_ip;
  uint64_t timestamp_ms = 0;
  bool detected = true;
  TunnelType tunnel_type = TunnelType::UNKNOWN;
  Confidence confidence = Confidence::LOW;
  double risk_score = 0.0;
  std::vector<std::string> indicators;
};

using TunnelDetectionPtr = std::shared_ptr<const TunnelDetection>;

#endif // TUNNEL_DETECTION_HPP
