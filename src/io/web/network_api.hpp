#ifndef NETWORK_API_HPP
#define NETWORK_API_HPP

#include "analysis/stats_aggregator.hpp"
#include "core/alert_manager.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/event_bus.hpp"
#include "core/monitor_pipeline.hpp"
#include "core/recent_store.hpp"
#include "detection/block_enforcer.hpp"
#include "nlohmann/json.hpp"
#include "timeline/capture_store.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

struct ApiResponse {
  int status = 200;
  nlohmann::json body;
  // Set for downloads; sent verbatim instead of `body`
  std::optional<std::string> text;
  std::string content_type = "application/json";
  std::string attachment_name;
};

// Same shape as httplib::Params
using QueryParams = std::multimap<std::string, std::string>;

// Components the pull interfaces read from. The alert manager is optional.
struct NetworkServices {
  MonitorPipeline &pipeline;
  BlockEnforcer &enforcer;
  RecentStore &store;
  EventBus &bus;
  StatsAggregator &stats;
  CaptureStore &captures;
  AlertManager *alerts = nullptr;
};

// Request handling for /api/v1/network/*, independent of the HTTP server.
// Handlers throw MonitorError subclasses; to_error_response() maps them.
class NetworkApi {
public:
  NetworkApi(NetworkServices services,
             const Config::RecentWindowConfig &window_config);

  ApiResponse ingest(const std::string &body, const std::string &peer_address);

  // Filters: ip, endpoint, method, status, has_tunnel, start_time, end_time
  ApiResponse list_logs(const QueryParams &params) const;
  ApiResponse search_logs(const QueryParams &params) const;
  ApiResponse get_log(const std::string &entry_id) const;
  // {"format": json|csv|har, "start_time", "end_time", "filters": {...}}
  ApiResponse export_logs(const std::string &body) const;
  ApiResponse list_tunnels(const QueryParams &params) const;
  ApiResponse get_stats() const;
  ApiResponse list_alerts(const QueryParams &params) const;

  ApiResponse list_blocks() const;
  ApiResponse list_blocks(const std::string &kind) const;
  ApiResponse add_block(const std::string &kind, const std::string &body,
                        const std::string &authorization);
  ApiResponse remove_ip_block(const std::string &ip);
  // ?ip= form, needed for CIDR values that contain '/'
  ApiResponse remove_ip_block(const QueryParams &params);
  ApiResponse remove_endpoint_block(const QueryParams &params);
  ApiResponse remove_pattern_block(const QueryParams &params);
  ApiResponse remove_block_by_id(const std::string &rule_id);

  ApiResponse submit_capture(const std::string &body);
  ApiResponse get_waterfall(const std::string &capture_id,
                            const QueryParams &params) const;

  ApiResponse stream_message(const std::string &subscriber_id,
                             const std::string &body);

  ApiResponse health() const;

  static ApiResponse to_error_response(ErrorCode code,
                                       const std::string &message);

  // "Bearer abc" -> "abc"; anything else is returned trimmed
  static std::string identity_from_authorization(const std::string &header);

private:
  size_t parse_limit(const QueryParams &params) const;
  static size_t parse_offset(const QueryParams &params);
  static RecordFilter parse_filter(const QueryParams &params);
  static std::optional<std::string> param(const QueryParams &params,
                                          const std::string &name);
  static nlohmann::json parse_body(const std::string &body);
  ApiResponse removal_response(bool removed, const std::string &what) const;

  NetworkServices services_;
  Config::RecentWindowConfig window_config_;
};

#endif // NETWORK_API_HPP
