#include "tunnel_detection.hpp"
#include "utils/utils.hpp"

const char *confidence_to_string(Confidence confidence) {
  switch (confidence) {
  case Confidence::LOW:
    return "low";
  case Confidence::MEDIUM:
    return "medium";
  case Confidence::HIGH:
    return "high";
  case Confidence::CONFIRMED:
    return "confirmed";
  }
  return "low";
}

std::optional<Confidence> confidence_from_string(std::string_view name) {
  std::string lowered = Utils::to_lower_copy(Utils::trim_copy(name));
  if (lowered == "low")
    return Confidence::LOW;
  if (lowered == "medium")
    return Confidence::MEDIUM;
  if (lowered == "high")
    return Confidence::HIGH;
  if (lowered == "confirmed")
    return Confidence::CONFIRMED;
  return std::nullopt;
}

const char *tunnel_type_to_string(TunnelType type) {
  switch (type) {
  case TunnelType::HTTP_TUNNEL:
    return "http_tunnel";
  case TunnelType::DNS_TUNNEL:
    return "dns_tunnel";
  case TunnelType::WEBSOCKET_COVERT:
    return "websocket_covert";
  case TunnelType::CHUNKED_ENCODING:
    return "chunked_encoding";
  case TunnelType::LONG_POLLING:
    return "long_polling";
  case TunnelType::BEACONING:
    return "beaconing";
  case TunnelType::UNKNOWN:
    return "unknown";
  }
  return "unknown";
}
