#ifndef STATS_SNAPSHOT_HPP
#define STATS_SNAPSHOT_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct IpCount {
  std::string ip;
  uint64_t count = 0;
};

// Aggregate over the stats window. The status counts always sum to
// total_requests.
struct StatsSnapshot {
  uint64_t total_requests = 0;
  uint64_t tunnel_detections = 0;
  uint64_t denied_requests = 0;
  double average_response_time_ms = 0.0;
  std::map<int, uint64_t> status_counts;
  std::vector<IpCount> top_ips; // count desc, then ip asc
  uint64_t generated_at_ms = 0;
};

#endif // STATS_SNAPSHOT_HPP
