#include "stats_aggregator.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_map>
#include <variant>
#include <vector>

StatsAggregator::StatsAggregator(const Config::StatsConfig &config,
                                 EventBus &bus, Clock clock)
    : config_(config), bus_(bus),
      clock_(clock ? std::move(clock) : Clock(&Utils::get_current_time_ms)),
      subscription_(bus.subscribe()),
      window_(config.window_seconds * 1000, config.max_window_entries) {
  LOG(LogLevel::INFO, LogComponent::STATS,
      "StatsAggregator subscribed to bus as subscriber "
          << subscription_->id() << " (window " << config_.window_seconds
          << "s, max " << config_.max_window_entries << " entries)");
}

StatsAggregator::~StatsAggregator() {
  stop();
  bus_.unsubscribe(subscription_->id());
}

void StatsAggregator::start() {
  if (running_.exchange(true))
    return;
  worker_thread_ = std::thread(&StatsAggregator::run_loop, this);
}

void StatsAggregator::stop() {
  if (!running_.exchange(false))
    return;
  if (worker_thread_.joinable())
    worker_thread_.join();
}

// Receive time, never moving backwards, keeps the window sorted even though
// partitions publish out of order
uint64_t StatsAggregator::window_timestamp_locked() {
  last_timestamp_ms_ = std::max(last_timestamp_ms_, clock_());
  return last_timestamp_ms_;
}

void StatsAggregator::prune_locked(uint64_t now_ms) {
  window_.prune_old_events(now_ms, [this](const StatsRecord &record) {
    ids_in_window_.erase(record.entry_id);
  });
}

bool StatsAggregator::consume(const BusEvent &event) {
  const auto *log_event = std::get_if<LogEvent>(&event);
  if (!log_event || !log_event->entry)
    return false;

  const LogEntry &entry = *log_event->entry;
  std::lock_guard<std::mutex> lock(window_mutex_);
  if (ids_in_window_.count(entry.id)) {
    LOG(LogLevel::TRACE, LogComponent::STATS,
        "Entry " << entry.id << " already in window, ignored.");
    return false;
  }

  StatsRecord record;
  record.entry_id = entry.id;
  record.source_ip = entry.source_ip;
  record.status = entry.response_status;
  record.response_time_ms = entry.response_time_ms;
  record.detected = static_cast<bool>(log_event->detection);
  record.denied = log_event->decision.denied;

  uint64_t now_ms = window_timestamp_locked();
  ids_in_window_.insert(record.entry_id);
  window_.add_event(now_ms, std::move(record));
  prune_locked(now_ms);
  return true;
}

size_t StatsAggregator::process_pending() {
  size_t accepted = 0;
  while (auto event = subscription_->try_receive())
    if (consume(**event))
      ++accepted;
  return accepted;
}

StatsSnapshot StatsAggregator::snapshot() {
  std::lock_guard<std::mutex> lock(window_mutex_);
  uint64_t now_ms = window_timestamp_locked();
  prune_locked(now_ms);

  StatsSnapshot snap;
  snap.generated_at_ms = Utils::get_current_time_ms();

  std::unordered_map<std::string, uint64_t> per_ip;
  uint64_t response_time_sum = 0;
  for (const auto &[timestamp, record] : window_.get_raw_window_data()) {
    snap.total_requests++;
    snap.status_counts[record.status]++;
    response_time_sum += record.response_time_ms;
    if (record.detected)
      snap.tunnel_detections++;
    if (record.denied)
      snap.denied_requests++;
    per_ip[record.source_ip]++;
  }
  if (snap.total_requests > 0)
    snap.average_response_time_ms = static_cast<double>(response_time_sum) /
                                    static_cast<double>(snap.total_requests);

  snap.top_ips.reserve(per_ip.size());
  for (auto &[ip, count] : per_ip)
    snap.top_ips.push_back({ip, count});
  std::sort(snap.top_ips.begin(), snap.top_ips.end(),
            [](const IpCount &a, const IpCount &b) {
              if (a.count != b.count)
                return a.count > b.count;
              return a.ip < b.ip;
            });
  if (snap.top_ips.size() > config_.top_ips_limit)
    snap.top_ips.resize(config_.top_ips_limit);
  return snap;
}

void StatsAggregator::publish_snapshot() {
  bus_.publish(StatsUpdateEvent{snapshot()});
}

size_t StatsAggregator::window_size() const {
  std::lock_guard<std::mutex> lock(window_mutex_);
  return window_.get_event_count();
}

void StatsAggregator::run_loop() {
  LOG(LogLevel::INFO, LogComponent::STATS, "Stats publisher thread started.");
  const auto interval = std::chrono::milliseconds(config_.publish_interval_ms);
  auto next_publish = std::chrono::steady_clock::now() + interval;

  while (running_) {
    auto now = std::chrono::steady_clock::now();
    auto wait = std::min(
        std::chrono::duration_cast<std::chrono::milliseconds>(next_publish -
                                                              now),
        bus_.default_receive_timeout());
    if (wait.count() < 0)
      wait = std::chrono::milliseconds(0);

    if (auto event = subscription_->receive(wait))
      consume(**event);
    process_pending();

    if (std::chrono::steady_clock::now() >= next_publish) {
      publish_snapshot();
      next_publish = std::chrono::steady_clock::now() + interval;
    }
    if (subscription_->is_closed())
      break;
  }
  LOG(LogLevel::INFO, LogComponent::STATS, "Stats publisher thread stopped.");
}
