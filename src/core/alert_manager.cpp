#include "alert_manager.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/alert_dispatch/file_dispatcher.hpp"
#include "io/alert_dispatch/http_dispatcher.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <variant>

namespace {
constexpr auto DISPATCH_POLL_INTERVAL = std::chrono::milliseconds(100);
}

AlertManager::AlertManager(const Config::AlertingConfig &config, EventBus &bus)
    : config_(config), bus_(bus), subscription_(bus.subscribe()),
      alert_queue_(config.max_queued_alerts),
      throttle_duration_ms_(config.throttle_seconds * 1000),
      alerts_counter_(MetricsRegistry::instance().create_counter(
          "tm_alerts_total", "Tunnel alerts accepted for dispatch")),
      throttled_counter_(MetricsRegistry::instance().create_counter(
          "tm_alerts_throttled_total",
          "Tunnel alerts suppressed by throttling")),
      dropped_counter_(MetricsRegistry::instance().create_counter(
          "tm_alerts_dropped_total",
          "Queued alerts discarded because the dispatch queue was full")) {}

AlertManager::~AlertManager() {
  stop();
  bus_.unsubscribe(subscription_->id());
}

void AlertManager::configure_dispatchers() {
  dispatchers_.clear();

  if (config_.file_enabled && !config_.file_path.empty()) {
    dispatchers_.push_back(std::make_unique<FileDispatcher>(config_.file_path));
    LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
        "FileDispatcher enabled, outputting to " << config_.file_path);
  }

  if (config_.http_enabled && !config_.http_webhook_url.empty()) {
    dispatchers_.push_back(
        std::make_unique<HttpDispatcher>(config_.http_webhook_url));
    LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
        "HttpDispatcher enabled for URL: " << config_.http_webhook_url);
  }

  LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
      "AlertManager configured. Active dispatchers: " << dispatchers_.size());
}

void AlertManager::add_dispatcher(std::unique_ptr<IAlertDispatcher> dispatcher) {
  dispatchers_.push_back(std::move(dispatcher));
}

void AlertManager::start() {
  if (running_.exchange(true))
    return;
  draining_ = false;
  dispatcher_thread_ = std::thread(&AlertManager::dispatcher_loop, this);
  bus_thread_ = std::thread(&AlertManager::bus_loop, this);
}

void AlertManager::stop() {
  if (!running_.exchange(false))
    return;
  if (bus_thread_.joinable())
    bus_thread_.join();
  // No more producers; the dispatcher empties the queue and exits
  draining_ = true;
  if (dispatcher_thread_.joinable())
    dispatcher_thread_.join();
}

bool AlertManager::record_alert(const TunnelDetectionPtr &detection) {
  if (!detection)
    return false;

  if (throttle_duration_ms_ > 0) {
    std::string throttle_key = detection->source_ip + ":" +
                               tunnel_type_to_string(detection->tunnel_type);
    std::lock_guard<std::mutex> lock(throttle_mutex_);
    auto it = recent_alert_timestamps_.find(throttle_key);

    if (it != recent_alert_timestamps_.end()) {
      auto [last_alert_time, last_alert_global_count] = it->second;
      size_t intervening_alerts =
          total_alerts_recorded_ - last_alert_global_count;

      bool is_in_time_window =
          detection->timestamp_ms < last_alert_time + throttle_duration_ms_;
      bool has_exceeded_intervening_limit =
          config_.throttle_max_intervening > 0 &&
          intervening_alerts >= config_.throttle_max_intervening;

      if (is_in_time_window && !has_exceeded_intervening_limit) {
        alerts_throttled_++;
        throttled_counter_.Increment();
        LOG(LogLevel::DEBUG, LogComponent::IO_DISPATCH,
            "Alert " << detection->detection_id << " throttled (key "
                     << throttle_key << ")");
        return false;
      }
    }

    total_alerts_recorded_++;
    recent_alert_timestamps_[throttle_key] = {detection->timestamp_ms,
                                              total_alerts_recorded_};
    prune_throttle_keys(detection->timestamp_ms);
  }

  {
    std::lock_guard<std::mutex> lock(recent_alerts_mutex_);
    recent_alerts_.push_front(detection);
    if (recent_alerts_.size() > MAX_RECENT_ALERTS)
      recent_alerts_.pop_back();
  }

  alerts_counter_.Increment();
  if (alert_queue_.push(detection)) {
    dropped_counter_.Increment();
    LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
        "Alert queue full (" << alert_queue_.capacity()
                             << "), dropped the oldest queued alert");
  }
  return true;
}

// Caller holds throttle_mutex_. Keys whose window has passed can no longer
// throttle anything, so they are swept once per window.
void AlertManager::prune_throttle_keys(uint64_t now_ms) {
  if (now_ms < last_prune_ms_ + throttle_duration_ms_)
    return;
  last_prune_ms_ = now_ms;

  size_t before = recent_alert_timestamps_.size();
  for (auto it = recent_alert_timestamps_.begin();
       it != recent_alert_timestamps_.end();) {
    if (it->second.first + throttle_duration_ms_ <= now_ms)
      it = recent_alert_timestamps_.erase(it);
    else
      ++it;
  }
  if (before != recent_alert_timestamps_.size())
    LOG(LogLevel::DEBUG, LogComponent::IO_DISPATCH,
        "Pruned " << before - recent_alert_timestamps_.size()
                  << " expired throttle keys");
}

size_t AlertManager::throttle_keys() const {
  std::lock_guard<std::mutex> lock(throttle_mutex_);
  return recent_alert_timestamps_.size();
}

std::vector<TunnelDetectionPtr>
AlertManager::get_recent_alerts(size_t limit) const {
  std::lock_guard<std::mutex> lock(recent_alerts_mutex_);
  std::vector<TunnelDetectionPtr> alerts_copy;
  for (const auto &alert : recent_alerts_) {
    if (alerts_copy.size() >= limit)
      break;
    alerts_copy.push_back(alert);
  }
  return alerts_copy;
}

std::string AlertManager::format_alert_to_human_readable(
    const TunnelDetection &detection) const {
  std::string formatted_alert = "TUNNEL DETECTED:\n";

  auto time_in_seconds =
      static_cast<std::time_t>(detection.timestamp_ms / 1000);
  char time_buffer[100];
  std::tm tm_buf;
  if (localtime_r(&time_in_seconds, &tm_buf))
    std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S",
                  &tm_buf);
  else
    std::snprintf(time_buffer, sizeof(time_buffer), "%llu",
                  static_cast<unsigned long long>(detection.timestamp_ms));

  formatted_alert += "  Timestamp:  " + std::string(time_buffer) + "." +
                     std::to_string(detection.timestamp_ms % 1000) + "\n";
  formatted_alert += "  Detection:  " + detection.detection_id + " (entry " +
                     detection.entry_id + ")\n";
  formatted_alert += "  Source IP:  " + detection.source_ip + "\n";
  formatted_alert += "  Type:       " +
                     std::string(tunnel_type_to_string(detection.tunnel_type)) +
                     "\n";
  formatted_alert +=
      "  Confidence: " +
      std::string(confidence_to_string(detection.confidence)) + " (risk " +
      std::to_string(static_cast<int>(detection.risk_score)) + ")\n";
  for (const auto &indicator : detection.indicators)
    formatted_alert += "    - " + indicator + "\n";

  formatted_alert += "----------------------------------------";
  return formatted_alert;
}

void AlertManager::dispatch(const TunnelDetection &detection) {
  static prometheus::Histogram &dispatch_latency =
      MetricsRegistry::instance().create_histogram(
          "tm_alert_dispatch_duration_seconds",
          "Time taken to hand one alert to every dispatcher",
          {0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1.0, 5.0});

  auto start_time = std::chrono::steady_clock::now();
  if (config_.stdout_enabled)
    std::cout << format_alert_to_human_readable(detection) << std::endl;

  for (const auto &dispatcher : dispatchers_) {
    bool success = dispatcher->dispatch(detection);
    MetricsRegistry::instance()
        .create_counter("tm_alert_dispatch_total",
                        "Alert dispatch attempts by outcome",
                        {{"dispatcher_type", dispatcher->get_dispatcher_type()},
                         {"outcome", success ? "success" : "failure"}})
        .Increment();
    if (!success)
      LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
          dispatcher->get_name() << " failed for " << detection.detection_id);
  }
  dispatch_latency.Observe(std::chrono::duration<double>(
                               std::chrono::steady_clock::now() - start_time)
                               .count());
}

void AlertManager::bus_loop() {
  LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
      "Alert manager bus consumer started.");
  while (running_) {
    auto event = subscription_->receive(bus_.default_receive_timeout());
    if (!event) {
      if (subscription_->is_closed())
        break;
      continue;
    }
    if (const auto *alert = std::get_if<TunnelAlertEvent>(event->get()))
      record_alert(alert->detection);
  }
}

void AlertManager::dispatcher_loop() {
  while (true) {
    auto detection = alert_queue_.wait_and_pop_for(DISPATCH_POLL_INTERVAL);
    if (detection) {
      dispatch(**detection);
      continue;
    }
    if (draining_)
      break;
  }
  LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
      "Alert dispatcher thread shutting down.");
}
