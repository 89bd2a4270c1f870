#ifndef STATS_AGGREGATOR_HPP
#define STATS_AGGREGATOR_HPP

#include "core/bus_event.hpp"
#include "core/config.hpp"
#include "core/event_bus.hpp"
#include "core/stats_snapshot.hpp"
#include "utils/sliding_window.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

// Rolling traffic statistics fed exclusively by `log` events from the bus.
// Each entry id is counted at most once while it is inside the window.
class StatsAggregator {
public:
  using Clock = std::function<uint64_t()>;

  StatsAggregator(const Config::StatsConfig &config, EventBus &bus,
                  Clock clock = {});
  ~StatsAggregator();

  StatsAggregator(const StatsAggregator &) = delete;
  StatsAggregator &operator=(const StatsAggregator &) = delete;

  // Starts the consumer thread that also publishes stats_update events
  void start();
  void stop();

  // Drains whatever is queued on the subscription without blocking. Returns
  // the number of log events accepted into the window.
  size_t process_pending();

  StatsSnapshot snapshot();

  // Computes a snapshot and publishes it as a stats_update event
  void publish_snapshot();

  size_t window_size() const;

private:
  struct StatsRecord {
    std::string entry_id;
    std::string source_ip;
    int status = 0;
    uint64_t response_time_ms = 0;
    bool detected = false;
    bool denied = false;
  };

  bool consume(const BusEvent &event);
  void run_loop();
  uint64_t window_timestamp_locked();
  void prune_locked(uint64_t now_ms);

  Config::StatsConfig config_;
  EventBus &bus_;
  Clock clock_;
  std::shared_ptr<Subscription> subscription_;

  mutable std::mutex window_mutex_;
  SlidingWindow<StatsRecord> window_;
  std::unordered_set<std::string> ids_in_window_;
  uint64_t last_timestamp_ms_ = 0;

  std::thread worker_thread_;
  std::atomic<bool> running_{false};
};

#endif // STATS_AGGREGATOR_HPP
