#include "monitor_pipeline.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <string>
#include <utility>

MonitorPipeline::MonitorPipeline(const Config::AppConfig &config,
                                 BlockEnforcer &enforcer,
                                 const TunnelClassifier &classifier,
                                 RecentStore &store, EventBus &bus)
    : adapter_(config.ingest), enforcer_(enforcer), classifier_(classifier),
      store_(store), bus_(bus),
      processed_counter_(MetricsRegistry::instance().create_counter(
          "tm_processed_entries_total",
          "Entries stored and published by a partition worker")),
      failed_counter_(MetricsRegistry::instance().create_counter(
          "tm_failed_entries_total",
          "Entries whose processing failed with an internal error")) {
  size_t worker_count = config.worker_threads;
  if (worker_count == 0)
    worker_count = std::max(1u, std::thread::hardware_concurrency());

  partitions_.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i)
    partitions_.push_back(std::make_unique<Partition>(
        config.classifier.ip_arena_capacity, config.classifier.ip_ring_size));

  enforcer_.set_rule_added_listener(
      [this](const BlockRule &rule) { bus_.publish(BlockAddedEvent{rule}); });

  LOG(LogLevel::INFO, LogComponent::PIPELINE,
      "MonitorPipeline created with " << worker_count << " partitions.");
}

MonitorPipeline::~MonitorPipeline() {
  stop();
  enforcer_.set_rule_added_listener(nullptr);
}

void MonitorPipeline::start() {
  if (running_.exchange(true))
    return;
  for (size_t i = 0; i < partitions_.size(); ++i)
    partitions_[i]->worker =
        std::thread(&MonitorPipeline::worker_loop, this, i);
}

void MonitorPipeline::stop() {
  if (!running_.exchange(false))
    return;
  for (auto &partition : partitions_)
    partition->queue.shutdown();
  for (auto &partition : partitions_)
    if (partition->worker.joinable())
      partition->worker.join();
  LOG(LogLevel::INFO, LogComponent::PIPELINE, "All partition workers joined.");
}

size_t MonitorPipeline::partition_for(const std::string &source_ip) const {
  return std::hash<std::string>{}(source_ip) % partitions_.size();
}

std::future<ProcessedRecord> MonitorPipeline::submit(RawObservation raw) {
  if (!running_)
    throw TransientTransportError("pipeline is not running");

  LogEntryPtr entry = adapter_.normalize(std::move(raw));

  WorkItem item{entry, std::make_shared<std::promise<ProcessedRecord>>()};
  auto result = item.done->get_future();

  size_t index = partition_for(entry->source_ip);
  if (!partitions_[index]->queue.push(std::move(item)))
    throw TransientTransportError("partition " + std::to_string(index) +
                                  " is shutting down");
  return result;
}

void MonitorPipeline::worker_loop(size_t index) {
  LOG(LogLevel::INFO, LogComponent::PIPELINE,
      "Partition worker " << index << " started.");
  Partition &partition = *partitions_[index];

  WorkItem item;
  while (partition.queue.wait_and_pop(item)) {
    try {
      item.done->set_value(process(item.entry, partition.arena));
      processed_counter_.Increment();
    } catch (const MonitorError &e) {
      failed_counter_.Increment();
      LOG(LogLevel::ERROR, LogComponent::PIPELINE,
          "Processing " << item.entry->id << " failed ("
                        << error_code_to_string(e.code()) << "): " << e.what());
      item.done->set_exception(std::current_exception());
    } catch (const std::exception &e) {
      // Only this entry is lost; the partition keeps serving its IPs
      failed_counter_.Increment();
      LOG(LogLevel::ERROR, LogComponent::PIPELINE,
          "Processing " << item.entry->id
                        << " failed with unexpected error: " << e.what());
      item.done->set_exception(std::make_exception_ptr(
          InvariantViolation("processing " + item.entry->id +
                             " failed: " + e.what())));
    }
  }
  LOG(LogLevel::INFO, LogComponent::PIPELINE,
      "Partition worker " << index << " shutting down.");
}

ProcessedRecord MonitorPipeline::process(const LogEntryPtr &entry,
                                         IpRateArena &arena) {
  ProcessedRecord record;
  record.entry = entry;
  record.decision = enforcer_.evaluate(*entry);

  if (record.decision.denied) {
    LOG(LogLevel::DEBUG, LogComponent::PIPELINE,
        entry->id << " from " << entry->source_ip << " denied by rule "
                  << record.decision.matched_rule->id
                  << ", classification skipped.");
  } else {
    IpSample sample{entry->timestamp_ms, entry->request_body.size,
                    entry->response_body.size};
    IpHistoryView history = arena.record(entry->source_ip, sample);
    if (auto detection = classifier_.classify(*entry, history))
      record.detection =
          std::make_shared<const TunnelDetection>(std::move(*detection));
  }

  store_.add(record);
  bus_.publish(LogEvent{record.entry, record.decision, record.detection});
  if (record.detection)
    bus_.publish(TunnelAlertEvent{record.detection});
  return record;
}
