#ifndef EVENT_BUS_HPP
#define EVENT_BUS_HPP

#include "core/bus_event.hpp"
#include "core/config.hpp"
#include "utils/drop_oldest_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace prometheus {
class Counter;
class Gauge;
} // namespace prometheus

class EventBus;

// One subscriber's view of the bus. Its queue keeps the newest `max_queue`
// events; older ones are dropped silently.
class Subscription {
public:
  Subscription(uint64_t id, size_t max_queue) : id_(id), queue_(max_queue) {}

  uint64_t id() const { return id_; }

  // Blocks until an event arrives, the timeout passes or the subscription is
  // closed. Returns nullopt in the last two cases.
  std::optional<BusEventPtr> receive(std::chrono::milliseconds timeout);
  std::optional<BusEventPtr> try_receive();

  bool is_closed() const { return queue_.is_closed(); }
  size_t dropped_count() const { return queue_.dropped_count(); }
  size_t queued() const { return queue_.size(); }

private:
  friend class EventBus;

  // True when the push displaced an older event
  bool deliver(BusEventPtr event) { return queue_.push(std::move(event)); }
  void close() { queue_.close(); }

  const uint64_t id_;
  DropOldestQueue<BusEventPtr> queue_;
};

// Fan-out of pipeline events. publish() never waits on a consumer: every
// subscriber has its own bounded queue and lock.
class EventBus {
public:
  explicit EventBus(const Config::EventBusConfig &config);
  ~EventBus();

  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;

  // Throws TransientTransportError when the subscriber limit is reached
  std::shared_ptr<Subscription> subscribe();

  // False when the id is unknown
  bool unsubscribe(uint64_t subscriber_id);

  void publish(BusEvent event);

  // Queues a pong for this subscriber only. False when the id is unknown.
  bool ping(uint64_t subscriber_id);

  // The subscriber's transport failed; it is dropped from the bus
  void report_send_failure(uint64_t subscriber_id, const std::string &reason);

  std::shared_ptr<Subscription> find(uint64_t subscriber_id) const;
  size_t subscriber_count() const;
  uint64_t published_count() const { return published_.load(); }

  // Closes every subscription, used on shutdown
  void close_all();

  std::chrono::milliseconds default_receive_timeout() const {
    return std::chrono::milliseconds(config_.receive_timeout_ms);
  }

private:
  void deliver_to(Subscription &subscription, BusEventPtr event);
  void update_subscriber_gauge_locked();

  Config::EventBusConfig config_;
  mutable std::shared_mutex subscribers_mutex_;
  std::map<uint64_t, std::shared_ptr<Subscription>> subscribers_;
  std::atomic<uint64_t> next_subscriber_id_{1};
  std::atomic<uint64_t> published_{0};

  prometheus::Counter &published_counter_;
  prometheus::Counter &dropped_counter_;
  prometheus::Gauge &subscribers_gauge_;
};

#endif // EVENT_BUS_HPP
