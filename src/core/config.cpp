#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"pipeline", LogComponent::PIPELINE},
    {"io.ingest", LogComponent::IO_INGEST},
    {"io.reader", LogComponent::IO_READER},
    {"io.dispatch", LogComponent::IO_DISPATCH},
    {"io.web", LogComponent::IO_WEB},
    {"io.stream", LogComponent::IO_STREAM},
    {"rules.block", LogComponent::RULES_BLOCK},
    {"classifier", LogComponent::CLASSIFIER},
    {"bus", LogComponent::BUS},
    {"stats", LogComponent::STATS},
    {"timeline", LogComponent::TIMELINE}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

// Comma separated list, trimmed and lower-cased, empty items dropped
std::vector<std::string> string_to_list(const std::string &value) {
  std::vector<std::string> items;
  for (auto &item : Utils::split_string(value, ',')) {
    std::string trimmed = Utils::to_lower_copy(Utils::trim_copy(item));
    if (!trimmed.empty())
      items.push_back(std::move(trimmed));
  }
  return items;
}

void apply_default_log_levels(LoggingConfig &logging) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

bool validate_classifier_config(const ClassifierConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (!(config.band_medium > 0.0 && config.band_medium < config.band_high &&
        config.band_high < config.band_confirmed &&
        config.band_confirmed <= 100.0)) {
    errors.push_back("Classifier confidence bands must satisfy 0 < medium < "
                     "high < confirmed <= 100");
    valid = false;
  }

  // A confirmed verdict has to sit in the top decile of the score scale
  if (config.band_confirmed < 90.0) {
    errors.push_back("Classifier band_confirmed must be at least 90");
    valid = false;
  }

  const std::string &floor = config.min_report_confidence;
  if (floor != "low" && floor != "medium" && floor != "high" &&
      floor != "confirmed") {
    errors.push_back("Classifier min_report_confidence must be one of low, "
                     "medium, high, confirmed");
    valid = false;
  }

  if (config.min_indicators < 1) {
    errors.push_back("Classifier min_indicators must be at least 1");
    valid = false;
  }

  if (config.ip_arena_capacity < 1 || config.ip_ring_size < 2) {
    errors.push_back("Classifier ip_arena_capacity must be >= 1 and "
                     "ip_ring_size must be >= 2");
    valid = false;
  }

  if (config.body_entropy_threshold <= 0.0 ||
      config.body_entropy_threshold > 1.0 ||
      config.header_entropy_threshold <= 0.0 ||
      config.header_entropy_threshold > 1.0) {
    errors.push_back("Classifier entropy thresholds must be in (0, 1]");
    valid = false;
  }

  if (config.beacon_min_samples < 3) {
    errors.push_back("Classifier beacon_min_samples must be at least 3");
    valid = false;
  }

  const double weights[] = {
      config.weight_tunnel_headers,     config.weight_opaque_content,
      config.weight_chunked_unbuffered, config.weight_suspicious_path,
      config.weight_webshell,           config.weight_tunna_pattern,
      config.weight_body_entropy,       config.weight_header_entropy,
      config.weight_long_poll,          config.weight_large_upload,
      config.weight_small_burst,        config.weight_beaconing,
      config.weight_dns_over_http,      config.weight_websocket_abuse};
  for (double weight : weights) {
    if (weight < 0.0) {
      errors.push_back("Classifier indicator weights must be non-negative");
      valid = false;
      break;
    }
  }

  return valid;
}

bool validate_event_bus_config(const EventBusConfig &config,
                               std::vector<std::string> &errors) {
  bool valid = true;

  if (config.max_queue < 1) {
    errors.push_back("EventBus max_queue must be at least 1");
    valid = false;
  }

  if (config.max_subscribers < 1) {
    errors.push_back("EventBus max_subscribers must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_stream_client_config(const StreamClientConfig &config,
                                   std::vector<std::string> &errors) {
  bool valid = true;

  if (config.initial_backoff_ms < 1 ||
      config.max_backoff_ms < config.initial_backoff_ms) {
    errors.push_back("Stream initial_backoff_ms must be >= 1 and not exceed "
                     "max_backoff_ms");
    valid = false;
  }

  if (config.backoff_multiplier < 1.0) {
    errors.push_back("Stream backoff_multiplier must be at least 1.0");
    valid = false;
  }

  if (config.stream_path.empty() || config.stream_path[0] != '/') {
    errors.push_back("Stream stream_path must start with '/'");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  valid &= validate_classifier_config(config.classifier, errors);
  valid &= validate_event_bus_config(config.event_bus, errors);
  valid &= validate_stream_client_config(config.stream_client, errors);

  if (config.ingest.max_body_bytes < 1 ||
      config.ingest.max_body_bytes > MAX_BODY_BYTES_LIMIT) {
    errors.push_back("Ingest max_body_bytes must be between 1 and " +
                     std::to_string(MAX_BODY_BYTES_LIMIT));
    valid = false;
  }

  if (config.recent_window.max_entries < 1 ||
      config.recent_window.max_page_size < 1 ||
      config.recent_window.default_page_size < 1 ||
      config.recent_window.default_page_size >
          config.recent_window.max_page_size) {
    errors.push_back("RecentWindow sizes must be positive and "
                     "default_page_size must not exceed max_page_size");
    valid = false;
  }

  if (config.stats.window_seconds < 1 && config.stats.max_window_entries < 1) {
    errors.push_back("Stats window must be bounded by time or by count");
    valid = false;
  }

  if (config.stats.publish_interval_ms < 100) {
    errors.push_back("Stats publish_interval_ms must be at least 100");
    valid = false;
  }

  if (config.timeline.max_captures < 1) {
    errors.push_back("Timeline max_captures must be at least 1");
    valid = false;
  }

  if (config.monitoring.web_server_port < 1 ||
      config.monitoring.web_server_port > 65535) {
    errors.push_back("Monitoring web_server_port must be between 1 and 65535");
    valid = false;
  }

  if (config.monitoring.max_stream_clients < 1 ||
      config.monitoring.max_stream_clients >=
          config.monitoring.web_server_threads) {
    errors.push_back("Monitoring max_stream_clients must be at least 1 and "
                     "below web_server_threads");
    valid = false;
  }

  if (config.alerting.max_queued_alerts < 1) {
    errors.push_back("Alerting max_queued_alerts must be at least 1");
    valid = false;
  }

  if (config.alerting.http_enabled && config.alerting.http_webhook_url.empty()) {
    errors.push_back("Alerting http_enabled requires http_webhook_url");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  apply_default_log_levels(config.logging);

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::WORKER_THREADS)
          config.worker_threads =
              Utils::string_to_number<size_t>(value).value_or(
                  config.worker_threads);
        else if (key == Keys::INGEST_SOURCE_ENABLED)
          config.ingest_source_enabled = string_to_bool(value);
        else if (key == Keys::INGEST_SOURCE_PATH)
          config.ingest_source_path = value;
        else if (key == Keys::READER_POLL_INTERVAL_MS)
          config.reader_poll_interval_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.reader_poll_interval_ms);
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Ingest") {
        if (key == Keys::IN_MAX_BODY_BYTES)
          config.ingest.max_body_bytes =
              Utils::string_to_number<size_t>(value).value_or(
                  config.ingest.max_body_bytes);
        else if (key == Keys::IN_TRUST_FORWARDED_HEADERS)
          config.ingest.trust_forwarded_headers = string_to_bool(value);
        else if (key == Keys::IN_SENSITIVE_HEADERS)
          config.ingest.sensitive_headers = string_to_list(value);

      } else if (current_section == "Classifier") {
        auto &cl = config.classifier;
        if (key == Keys::CL_ENABLED)
          cl.enabled = string_to_bool(value);
        else if (key == Keys::CL_MIN_INDICATORS)
          cl.min_indicators = Utils::string_to_number<size_t>(value).value_or(
              cl.min_indicators);
        else if (key == Keys::CL_MIN_REPORT_CONFIDENCE)
          cl.min_report_confidence = Utils::to_lower_copy(value);
        else if (key == Keys::CL_BAND_MEDIUM)
          cl.band_medium =
              Utils::string_to_number<double>(value).value_or(cl.band_medium);
        else if (key == Keys::CL_BAND_HIGH)
          cl.band_high =
              Utils::string_to_number<double>(value).value_or(cl.band_high);
        else if (key == Keys::CL_BAND_CONFIRMED)
          cl.band_confirmed = Utils::string_to_number<double>(value).value_or(
              cl.band_confirmed);
        else if (key == Keys::CL_IP_ARENA_CAPACITY)
          cl.ip_arena_capacity =
              Utils::string_to_number<size_t>(value).value_or(
                  cl.ip_arena_capacity);
        else if (key == Keys::CL_IP_RING_SIZE)
          cl.ip_ring_size = Utils::string_to_number<size_t>(value).value_or(
              cl.ip_ring_size);
        else if (key == Keys::CL_TUNNEL_HEADERS)
          cl.tunnel_header_names = string_to_list(value);
        else if (key == Keys::CL_SUSPICIOUS_PATHS)
          cl.suspicious_path_substrings = string_to_list(value);
        else if (key == Keys::CL_OPAQUE_CONTENT_TYPES)
          cl.opaque_content_types = string_to_list(value);
        else if (key == Keys::CL_BODY_ENTROPY_THRESHOLD)
          cl.body_entropy_threshold =
              Utils::string_to_number<double>(value).value_or(
                  cl.body_entropy_threshold);
        else if (key == Keys::CL_BODY_ENTROPY_MIN_BYTES)
          cl.body_entropy_min_bytes =
              Utils::string_to_number<size_t>(value).value_or(
                  cl.body_entropy_min_bytes);
        else if (key == Keys::CL_HEADER_ENTROPY_THRESHOLD)
          cl.header_entropy_threshold =
              Utils::string_to_number<double>(value).value_or(
                  cl.header_entropy_threshold);
        else if (key == Keys::CL_HEADER_ENTROPY_MIN_BYTES)
          cl.header_entropy_min_bytes =
              Utils::string_to_number<size_t>(value).value_or(
                  cl.header_entropy_min_bytes);
        else if (key == Keys::CL_LONG_POLL_MS)
          cl.long_poll_threshold_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  cl.long_poll_threshold_ms);
        else if (key == Keys::CL_LARGE_UPLOAD_BYTES)
          cl.large_upload_min_bytes =
              Utils::string_to_number<uint64_t>(value).value_or(
                  cl.large_upload_min_bytes);
        else if (key == Keys::CL_LARGE_UPLOAD_MAX_RESPONSE)
          cl.large_upload_max_response_bytes =
              Utils::string_to_number<uint64_t>(value).value_or(
                  cl.large_upload_max_response_bytes);
        else if (key == Keys::CL_BURST_WINDOW_SECONDS)
          cl.burst_window_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  cl.burst_window_seconds);
        else if (key == Keys::CL_BURST_MIN_REQUESTS)
          cl.burst_min_requests =
              Utils::string_to_number<size_t>(value).value_or(
                  cl.burst_min_requests);
        else if (key == Keys::CL_BURST_MAX_BODY_BYTES)
          cl.burst_max_body_bytes =
              Utils::string_to_number<uint64_t>(value).value_or(
                  cl.burst_max_body_bytes);
        else if (key == Keys::CL_BEACON_MIN_SAMPLES)
          cl.beacon_min_samples =
              Utils::string_to_number<size_t>(value).value_or(
                  cl.beacon_min_samples);
        else if (key == Keys::CL_BEACON_MAX_CV)
          cl.beacon_max_cv = Utils::string_to_number<double>(value).value_or(
              cl.beacon_max_cv);
        else if (key == Keys::CL_BEACON_MAX_MEAN_INTERVAL_MS)
          cl.beacon_max_mean_interval_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  cl.beacon_max_mean_interval_ms);
        else if (key == Keys::CL_WEIGHT_TUNNEL_HEADERS)
          cl.weight_tunnel_headers =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_tunnel_headers);
        else if (key == Keys::CL_WEIGHT_OPAQUE_CONTENT)
          cl.weight_opaque_content =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_opaque_content);
        else if (key == Keys::CL_WEIGHT_CHUNKED_UNBUFFERED)
          cl.weight_chunked_unbuffered =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_chunked_unbuffered);
        else if (key == Keys::CL_WEIGHT_SUSPICIOUS_PATH)
          cl.weight_suspicious_path =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_suspicious_path);
        else if (key == Keys::CL_WEIGHT_WEBSHELL)
          cl.weight_webshell = Utils::string_to_number<double>(value).value_or(
              cl.weight_webshell);
        else if (key == Keys::CL_WEIGHT_TUNNA)
          cl.weight_tunna_pattern =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_tunna_pattern);
        else if (key == Keys::CL_WEIGHT_BODY_ENTROPY)
          cl.weight_body_entropy =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_body_entropy);
        else if (key == Keys::CL_WEIGHT_HEADER_ENTROPY)
          cl.weight_header_entropy =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_header_entropy);
        else if (key == Keys::CL_WEIGHT_LONG_POLL)
          cl.weight_long_poll = Utils::string_to_number<double>(value).value_or(
              cl.weight_long_poll);
        else if (key == Keys::CL_WEIGHT_LARGE_UPLOAD)
          cl.weight_large_upload =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_large_upload);
        else if (key == Keys::CL_WEIGHT_BURST)
          cl.weight_small_burst =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_small_burst);
        else if (key == Keys::CL_WEIGHT_BEACONING)
          cl.weight_beaconing = Utils::string_to_number<double>(value).value_or(
              cl.weight_beaconing);
        else if (key == Keys::CL_WEIGHT_DNS_OVER_HTTP)
          cl.weight_dns_over_http =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_dns_over_http);
        else if (key == Keys::CL_WEIGHT_WEBSOCKET)
          cl.weight_websocket_abuse =
              Utils::string_to_number<double>(value).value_or(
                  cl.weight_websocket_abuse);

      } else if (current_section == "Blocking") {
        if (key == Keys::BL_ENABLED)
          config.blocking.enabled = string_to_bool(value);
        else if (key == Keys::BL_MAX_RULES_PER_KIND)
          config.blocking.max_rules_per_kind =
              Utils::string_to_number<size_t>(value).value_or(
                  config.blocking.max_rules_per_kind);

      } else if (current_section == "EventBus") {
        if (key == Keys::EB_MAX_QUEUE)
          config.event_bus.max_queue =
              Utils::string_to_number<size_t>(value).value_or(
                  config.event_bus.max_queue);
        else if (key == Keys::EB_MAX_SUBSCRIBERS)
          config.event_bus.max_subscribers =
              Utils::string_to_number<size_t>(value).value_or(
                  config.event_bus.max_subscribers);
        else if (key == Keys::EB_RECEIVE_TIMEOUT_MS)
          config.event_bus.receive_timeout_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.event_bus.receive_timeout_ms);

      } else if (current_section == "Stats") {
        if (key == Keys::ST_WINDOW_SECONDS)
          config.stats.window_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.stats.window_seconds);
        else if (key == Keys::ST_MAX_WINDOW_ENTRIES)
          config.stats.max_window_entries =
              Utils::string_to_number<size_t>(value).value_or(
                  config.stats.max_window_entries);
        else if (key == Keys::ST_PUBLISH_INTERVAL_MS)
          config.stats.publish_interval_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.stats.publish_interval_ms);
        else if (key == Keys::ST_TOP_IPS_LIMIT)
          config.stats.top_ips_limit =
              Utils::string_to_number<size_t>(value).value_or(
                  config.stats.top_ips_limit);

      } else if (current_section == "RecentWindow") {
        if (key == Keys::RW_MAX_ENTRIES)
          config.recent_window.max_entries =
              Utils::string_to_number<size_t>(value).value_or(
                  config.recent_window.max_entries);
        else if (key == Keys::RW_DEFAULT_PAGE_SIZE)
          config.recent_window.default_page_size =
              Utils::string_to_number<size_t>(value).value_or(
                  config.recent_window.default_page_size);
        else if (key == Keys::RW_MAX_PAGE_SIZE)
          config.recent_window.max_page_size =
              Utils::string_to_number<size_t>(value).value_or(
                  config.recent_window.max_page_size);

      } else if (current_section == "Timeline") {
        if (key == Keys::TL_MAX_CAPTURES)
          config.timeline.max_captures =
              Utils::string_to_number<size_t>(value).value_or(
                  config.timeline.max_captures);

      } else if (current_section == "Alerting") {
        if (key == Keys::AL_STDOUT_ENABLED)
          config.alerting.stdout_enabled = string_to_bool(value);
        else if (key == Keys::AL_FILE_ENABLED)
          config.alerting.file_enabled = string_to_bool(value);
        else if (key == Keys::AL_FILE_PATH)
          config.alerting.file_path = value;
        else if (key == Keys::AL_HTTP_ENABLED)
          config.alerting.http_enabled = string_to_bool(value);
        else if (key == Keys::AL_HTTP_WEBHOOK_URL)
          config.alerting.http_webhook_url = value;
        else if (key == Keys::AL_THROTTLE_SECONDS)
          config.alerting.throttle_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.alerting.throttle_seconds);
        else if (key == Keys::AL_THROTTLE_MAX_INTERVENING)
          config.alerting.throttle_max_intervening =
              Utils::string_to_number<size_t>(value).value_or(
                  config.alerting.throttle_max_intervening);
        else if (key == Keys::AL_MAX_QUEUED_ALERTS)
          config.alerting.max_queued_alerts =
              Utils::string_to_number<size_t>(value).value_or(
                  config.alerting.max_queued_alerts);

      } else if (current_section == "Stream") {
        auto &sc = config.stream_client;
        if (key == Keys::SC_SERVER_URL)
          sc.server_url = value;
        else if (key == Keys::SC_STREAM_PATH)
          sc.stream_path = value;
        else if (key == Keys::SC_INITIAL_BACKOFF_MS)
          sc.initial_backoff_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  sc.initial_backoff_ms);
        else if (key == Keys::SC_BACKOFF_MULTIPLIER)
          sc.backoff_multiplier =
              Utils::string_to_number<double>(value).value_or(
                  sc.backoff_multiplier);
        else if (key == Keys::SC_MAX_BACKOFF_MS)
          sc.max_backoff_ms = Utils::string_to_number<uint64_t>(value).value_or(
              sc.max_backoff_ms);
        else if (key == Keys::SC_MAX_RECONNECT_ATTEMPTS)
          sc.max_reconnect_attempts =
              Utils::string_to_number<uint32_t>(value).value_or(
                  sc.max_reconnect_attempts);
        else if (key == Keys::SC_PING_INTERVAL_MS)
          sc.ping_interval_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  sc.ping_interval_ms);
        else if (key == Keys::SC_IDLE_TIMEOUT_MS)
          sc.idle_timeout_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  sc.idle_timeout_ms);

      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "io.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map)
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
          }
        }

      } else if (current_section == "Monitoring") {
        if (key == Keys::MONITORING_WEB_SERVER_ENABLED)
          config.monitoring.web_server_enabled = string_to_bool(value);
        else if (key == Keys::MONITORING_WEB_SERVER_HOST)
          config.monitoring.web_server_host = value;
        else if (key == Keys::MONITORING_WEB_SERVER_PORT)
          config.monitoring.web_server_port =
              Utils::string_to_number<int>(value).value_or(
                  config.monitoring.web_server_port);
        else if (key == Keys::MONITORING_WEB_SERVER_THREADS)
          config.monitoring.web_server_threads =
              Utils::string_to_number<size_t>(value).value_or(
                  config.monitoring.web_server_threads);
        else if (key == Keys::MONITORING_MAX_STREAM_CLIENTS)
          config.monitoring.max_stream_clients =
              Utils::string_to_number<size_t>(value).value_or(
                  config.monitoring.max_stream_clients);
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors)
      std::cerr << "  - " << error << std::endl;
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
