#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *WORKER_THREADS = "worker_threads";
constexpr const char *INGEST_SOURCE_ENABLED = "ingest_source_enabled";
constexpr const char *INGEST_SOURCE_PATH = "ingest_source_path";
constexpr const char *READER_POLL_INTERVAL_MS = "reader_poll_interval_ms";

// Ingest Settings
constexpr const char *IN_MAX_BODY_BYTES = "max_body_bytes";
constexpr const char *IN_TRUST_FORWARDED_HEADERS = "trust_forwarded_headers";
constexpr const char *IN_SENSITIVE_HEADERS = "sensitive_headers";

// Classifier Settings
constexpr const char *CL_ENABLED = "enabled";
constexpr const char *CL_MIN_INDICATORS = "min_indicators";
constexpr const char *CL_MIN_REPORT_CONFIDENCE = "min_report_confidence";
constexpr const char *CL_BAND_MEDIUM = "band_medium";
constexpr const char *CL_BAND_HIGH = "band_high";
constexpr const char *CL_BAND_CONFIRMED = "band_confirmed";
constexpr const char *CL_IP_ARENA_CAPACITY = "ip_arena_capacity";
constexpr const char *CL_IP_RING_SIZE = "ip_ring_size";
constexpr const char *CL_TUNNEL_HEADERS = "tunnel_header_names";
constexpr const char *CL_SUSPICIOUS_PATHS = "suspicious_path_substrings";
constexpr const char *CL_OPAQUE_CONTENT_TYPES = "opaque_content_types";
constexpr const char *CL_BODY_ENTROPY_THRESHOLD = "body_entropy_threshold";
constexpr const char *CL_BODY_ENTROPY_MIN_BYTES = "body_entropy_min_bytes";
constexpr const char *CL_HEADER_ENTROPY_THRESHOLD = "header_entropy_threshold";
constexpr const char *CL_HEADER_ENTROPY_MIN_BYTES = "header_entropy_min_bytes";
constexpr const char *CL_LONG_POLL_MS = "long_poll_threshold_ms";
constexpr const char *CL_LARGE_UPLOAD_BYTES = "large_upload_min_bytes";
constexpr const char *CL_LARGE_UPLOAD_MAX_RESPONSE =
    "large_upload_max_response_bytes";
constexpr const char *CL_BURST_WINDOW_SECONDS = "burst_window_seconds";
constexpr const char *CL_BURST_MIN_REQUESTS = "burst_min_requests";
constexpr const char *CL_BURST_MAX_BODY_BYTES = "burst_max_body_bytes";
constexpr const char *CL_BEACON_MIN_SAMPLES = "beacon_min_samples";
constexpr const char *CL_BEACON_MAX_CV = "beacon_max_cv";
constexpr const char *CL_BEACON_MAX_MEAN_INTERVAL_MS =
    "beacon_max_mean_interval_ms";

constexpr const char *CL_WEIGHT_TUNNEL_HEADERS = "weight_tunnel_headers";
constexpr const char *CL_WEIGHT_OPAQUE_CONTENT = "weight_opaque_content";
constexpr const char *CL_WEIGHT_CHUNKED_UNBUFFERED = "weight_chunked_unbuffered";
constexpr const char *CL_WEIGHT_SUSPICIOUS_PATH = "weight_suspicious_path";
constexpr const char *CL_WEIGHT_WEBSHELL = "weight_webshell";
constexpr const char *CL_WEIGHT_TUNNA = "weight_tunna_pattern";
constexpr const char *CL_WEIGHT_BODY_ENTROPY = "weight_body_entropy";
constexpr const char *CL_WEIGHT_HEADER_ENTROPY = "weight_header_entropy";
constexpr const char *CL_WEIGHT_LONG_POLL = "weight_long_poll";
constexpr const char *CL_WEIGHT_LARGE_UPLOAD = "weight_large_upload";
constexpr const char *CL_WEIGHT_BURST = "weight_small_burst";
constexpr const char *CL_WEIGHT_BEACONING = "weight_beaconing";
constexpr const char *CL_WEIGHT_DNS_OVER_HTTP = "weight_dns_over_http";
constexpr const char *CL_WEIGHT_WEBSOCKET = "weight_websocket_abuse";

// Blocking Settings
constexpr const char *BL_ENABLED = "enabled";
constexpr const char *BL_MAX_RULES_PER_KIND = "max_rules_per_kind";

// Event Bus Settings
constexpr const char *EB_MAX_QUEUE = "max_queue";
constexpr const char *EB_MAX_SUBSCRIBERS = "max_subscribers";
constexpr const char *EB_RECEIVE_TIMEOUT_MS = "receive_timeout_ms";

// Stats Settings
constexpr const char *ST_WINDOW_SECONDS = "window_seconds";
constexpr const char *ST_MAX_WINDOW_ENTRIES = "max_window_entries";
constexpr const char *ST_PUBLISH_INTERVAL_MS = "publish_interval_ms";
constexpr const char *ST_TOP_IPS_LIMIT = "top_ips_limit";

// Recent Window Settings
constexpr const char *RW_MAX_ENTRIES = "max_entries";
constexpr const char *RW_DEFAULT_PAGE_SIZE = "default_page_size";
constexpr const char *RW_MAX_PAGE_SIZE = "max_page_size";

// Timeline Settings
constexpr const char *TL_MAX_CAPTURES = "max_captures";

// Alerting Settings
constexpr const char *AL_STDOUT_ENABLED = "stdout_enabled";
constexpr const char *AL_FILE_ENABLED = "file_enabled";
constexpr const char *AL_FILE_PATH = "file_path";
constexpr const char *AL_HTTP_ENABLED = "http_enabled";
constexpr const char *AL_HTTP_WEBHOOK_URL = "http_webhook_url";
constexpr const char *AL_THROTTLE_SECONDS = "throttle_seconds";
constexpr const char *AL_THROTTLE_MAX_INTERVENING = "throttle_max_intervening";
constexpr const char *AL_MAX_QUEUED_ALERTS = "max_queued_alerts";

// Stream Client Settings
constexpr const char *SC_SERVER_URL = "server_url";
constexpr const char *SC_STREAM_PATH = "stream_path";
constexpr const char *SC_INITIAL_BACKOFF_MS = "initial_backoff_ms";
constexpr const char *SC_BACKOFF_MULTIPLIER = "backoff_multiplier";
constexpr const char *SC_MAX_BACKOFF_MS = "max_backoff_ms";
constexpr const char *SC_MAX_RECONNECT_ATTEMPTS = "max_reconnect_attempts";
constexpr const char *SC_PING_INTERVAL_MS = "ping_interval_ms";
constexpr const char *SC_IDLE_TIMEOUT_MS = "idle_timeout_ms";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Monitoring Settings
constexpr const char *MONITORING_WEB_SERVER_ENABLED = "web_server_enabled";
constexpr const char *MONITORING_WEB_SERVER_HOST = "web_server_host";
constexpr const char *MONITORING_WEB_SERVER_PORT = "web_server_port";
constexpr const char *MONITORING_WEB_SERVER_THREADS = "web_server_threads";
constexpr const char *MONITORING_MAX_STREAM_CLIENTS = "max_stream_clients";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

// Upper bound for the captured body prefix of one exchange
constexpr size_t MAX_BODY_BYTES_LIMIT = 1024 * 1024;

struct IngestConfig {
  size_t max_body_bytes = 10240;
  bool trust_forwarded_headers = true;
  std::vector<std::string> sensitive_headers = {"authorization", "cookie",
                                                "set-cookie", "x-api-key"};
};

struct ClassifierConfig {
  bool enabled = true;
  size_t min_indicators = 1;
  std::string min_report_confidence = "low";

  // Lower bounds of the medium / high / confirmed bands on the 0-100 scale
  double band_medium = 40.0;
  double band_high = 70.0;
  double band_confirmed = 90.0;

  size_t ip_arena_capacity = 4096;
  size_t ip_ring_size = 64;

  std::vector<std::string> tunnel_header_names = {"x-tunnel", "x-forwarded-tcp",
                                                  "x-socket-id", "x-cmd"};
  std::vector<std::string> suspicious_path_substrings = {
      "/proxy", "/tunnel", "/conn", "/socket", "/relay"};
  std::vector<std::string> opaque_content_types = {"application/octet-stream",
                                                   "binary/octet-stream"};

  double body_entropy_threshold = 0.9; // normalised, 0.0 - 1.0
  size_t body_entropy_min_bytes = 100;
  double header_entropy_threshold = 0.85;
  size_t header_entropy_min_bytes = 64;
  uint64_t long_poll_threshold_ms = 30000;
  uint64_t large_upload_min_bytes = 10000;
  uint64_t large_upload_max_response_bytes = 100;
  uint64_t burst_window_seconds = 60;
  size_t burst_min_requests = 50;
  uint64_t burst_max_body_bytes = 50;
  size_t beacon_min_samples = 10;
  double beacon_max_cv = 0.3;
  uint64_t beacon_max_mean_interval_ms = 300000;

  double weight_tunnel_headers = 40.0;
  double weight_opaque_content = 20.0;
  double weight_chunked_unbuffered = 25.0;
  double weight_suspicious_path = 30.0;
  double weight_webshell = 50.0;
  double weight_tunna_pattern = 45.0;
  double weight_body_entropy = 25.0;
  double weight_header_entropy = 15.0;
  double weight_long_poll = 20.0;
  double weight_large_upload = 30.0;
  double weight_small_burst = 20.0;
  double weight_beaconing = 35.0;
  double weight_dns_over_http = 35.0;
  double weight_websocket_abuse = 30.0;
};

struct BlockingConfig {
  bool enabled = true;
  size_t max_rules_per_kind = 10000;
};

struct EventBusConfig {
  size_t max_queue = 500;
  size_t max_subscribers = 256;
  uint64_t receive_timeout_ms = 1000;
};

struct StatsConfig {
  uint64_t window_seconds = 3600;
  size_t max_window_entries = 10000;
  uint64_t publish_interval_ms = 5000;
  size_t top_ips_limit = 10;
};

struct RecentWindowConfig {
  size_t max_entries = 10000;
  size_t default_page_size = 100;
  size_t max_page_size = 1000;
};

struct TimelineConfig {
  size_t max_captures = 100;
};

struct AlertingConfig {
  bool stdout_enabled = true;
  bool file_enabled = false;
  std::string file_path = "data/tunnel_alerts.json";
  bool http_enabled = false;
  std::string http_webhook_url;
  uint64_t throttle_seconds = 300;
  size_t throttle_max_intervening = 10;
  // Alerts waiting for the dispatchers; the oldest is dropped when full
  size_t max_queued_alerts = 1000;
};

struct StreamClientConfig {
  std::string server_url = "http://127.0.0.1:9090";
  std::string stream_path = "/api/v1/network/stream";
  uint64_t initial_backoff_ms = 1000;
  double backoff_multiplier = 2.0;
  uint64_t max_backoff_ms = 30000;
  uint32_t max_reconnect_attempts = 0; // 0 means retry forever
  uint64_t ping_interval_ms = 30000;
  uint64_t idle_timeout_ms = 90000;
};

struct MonitoringConfig {
  bool web_server_enabled = true;
  std::string web_server_host = "0.0.0.0";
  int web_server_port = 9090;
  // Each live stream client holds one of the server threads
  size_t web_server_threads = 16;
  size_t max_stream_clients = 8;
};

struct AppConfig {
  size_t worker_threads = 0; // 0 means one per hardware thread
  bool ingest_source_enabled = false;
  std::string ingest_source_path = "data/observations.ndjson";
  uint64_t reader_poll_interval_ms = 200;

  IngestConfig ingest;
  ClassifierConfig classifier;
  BlockingConfig blocking;
  EventBusConfig event_bus;
  StatsConfig stats;
  RecentWindowConfig recent_window;
  TimelineConfig timeline;
  AlertingConfig alerting;
  StreamClientConfig stream_client;
  LoggingConfig logging;
  MonitoringConfig monitoring;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_classifier_config(const ClassifierConfig &config,
                                std::vector<std::string> &errors);
bool validate_event_bus_config(const EventBusConfig &config,
                               std::vector<std::string> &errors);
bool validate_stream_client_config(const StreamClientConfig &config,
                                   std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Fills in the default per-component log levels
void apply_default_log_levels(LoggingConfig &logging);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
