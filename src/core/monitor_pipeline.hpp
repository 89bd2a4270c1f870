#ifndef MONITOR_PIPELINE_HPP
#define MONITOR_PIPELINE_HPP

#include "analysis/ip_rate_arena.hpp"
#include "core/config.hpp"
#include "core/event_bus.hpp"
#include "core/recent_store.hpp"
#include "detection/block_enforcer.hpp"
#include "detection/tunnel_classifier.hpp"
#include "io/ingest/ingest_adapter.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <thread>
#include <vector>

namespace prometheus {
class Counter;
}

// Ingest -> partition worker -> block check -> classifier -> store -> bus.
// Every entry of one source IP is handled by the same worker, in submission
// order.
class MonitorPipeline {
public:
  MonitorPipeline(const Config::AppConfig &config, BlockEnforcer &enforcer,
                  const TunnelClassifier &classifier, RecentStore &store,
                  EventBus &bus);
  ~MonitorPipeline();

  MonitorPipeline(const MonitorPipeline &) = delete;
  MonitorPipeline &operator=(const MonitorPipeline &) = delete;

  void start();

  // Stops accepting work, lets the workers drain their queues and joins them
  void stop();

  // Normalises on the caller's thread and queues the entry to its partition.
  // The future resolves once the entry has been stored and published. Throws
  // ValidationError for a malformed observation and TransientTransportError
  // when the pipeline is not running.
  std::future<ProcessedRecord> submit(RawObservation raw);

  size_t partition_count() const { return partitions_.size(); }
  size_t partition_for(const std::string &source_ip) const;
  bool is_running() const { return running_; }

  IngestAdapter &ingest_adapter() { return adapter_; }

private:
  struct WorkItem {
    LogEntryPtr entry;
    std::shared_ptr<std::promise<ProcessedRecord>> done;
  };

  struct Partition {
    Partition(size_t arena_capacity, size_t ring_size)
        : arena(arena_capacity, ring_size) {}

    ThreadSafeQueue<WorkItem> queue;
    IpRateArena arena;
    std::thread worker;
  };

  void worker_loop(size_t index);
  ProcessedRecord process(const LogEntryPtr &entry, IpRateArena &arena);

  IngestAdapter adapter_;
  BlockEnforcer &enforcer_;
  const TunnelClassifier &classifier_;
  RecentStore &store_;
  EventBus &bus_;

  std::vector<std::unique_ptr<Partition>> partitions_;
  std::atomic<bool> running_{false};

  prometheus::Counter &processed_counter_;
  prometheus::Counter &failed_counter_;
};

#endif // MONITOR_PIPELINE_HPP
