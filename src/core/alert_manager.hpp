#ifndef ALERT_MANAGER_HPP
#define ALERT_MANAGER_HPP

#include "config.hpp"
#include "core/event_bus.hpp"
#include "core/tunnel_detection.hpp"
#include "io/alert_dispatch/base_dispatcher.hpp"
#include "utils/drop_oldest_queue.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace prometheus {
class Counter;
}

// Consumes tunnel_alert events from the bus, throttles repeats per
// source_ip + tunnel_type and hands the rest to the configured dispatchers.
class AlertManager {
public:
  AlertManager(const Config::AlertingConfig &config, EventBus &bus);
  ~AlertManager();

  AlertManager(const AlertManager &) = delete;
  AlertManager &operator=(const AlertManager &) = delete;

  // Builds the file / webhook dispatchers named by the configuration
  void configure_dispatchers();
  void add_dispatcher(std::unique_ptr<IAlertDispatcher> dispatcher);

  void start();

  // Stops consuming the bus and dispatches whatever is still queued
  void stop();

  // Returns false when the alert was suppressed by the throttle
  bool record_alert(const TunnelDetectionPtr &detection);

  std::vector<TunnelDetectionPtr> get_recent_alerts(size_t limit) const;
  size_t alerts_throttled() const { return alerts_throttled_.load(); }
  size_t alerts_dropped() const { return alert_queue_.dropped_count(); }
  size_t throttle_keys() const;
  size_t dispatcher_count() const { return dispatchers_.size(); }

private:
  void bus_loop();
  void dispatcher_loop();
  void dispatch(const TunnelDetection &detection);
  void prune_throttle_keys(uint64_t now_ms);
  std::string format_alert_to_human_readable(
      const TunnelDetection &detection) const;

  Config::AlertingConfig config_;
  EventBus &bus_;
  std::shared_ptr<Subscription> subscription_;

  std::vector<std::unique_ptr<IAlertDispatcher>> dispatchers_;
  DropOldestQueue<TunnelDetectionPtr> alert_queue_;
  std::thread bus_thread_;
  std::thread dispatcher_thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> draining_{false};

  mutable std::mutex throttle_mutex_;
  uint64_t throttle_duration_ms_ = 0;
  size_t total_alerts_recorded_ = 0;
  // key -> (timestamp of last recorded alert, total count at that time)
  std::unordered_map<std::string, std::pair<uint64_t, size_t>>
      recent_alert_timestamps_;
  uint64_t last_prune_ms_ = 0;
  std::atomic<size_t> alerts_throttled_{0};

  mutable std::mutex recent_alerts_mutex_;
  std::deque<TunnelDetectionPtr> recent_alerts_;
  static constexpr size_t MAX_RECENT_ALERTS = 50;

  prometheus::Counter &alerts_counter_;
  prometheus::Counter &throttled_counter_;
  prometheus::Counter &dropped_counter_;
};

#endif // ALERT_MANAGER_HPP
