#include "event_bus.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/utils.hpp"

#include <mutex>
#include <utility>
#include <vector>

std::optional<BusEventPtr>
Subscription::receive(std::chrono::milliseconds timeout) {
  return queue_.wait_and_pop_for(timeout);
}

std::optional<BusEventPtr> Subscription::try_receive() {
  return queue_.try_pop();
}

EventBus::EventBus(const Config::EventBusConfig &config)
    : config_(config),
      published_counter_(MetricsRegistry::instance().create_counter(
          "tm_bus_events_published_total", "Events published on the bus")),
      dropped_counter_(MetricsRegistry::instance().create_counter(
          "tm_bus_events_dropped_total",
          "Events discarded from full subscriber queues")),
      subscribers_gauge_(MetricsRegistry::instance().create_gauge(
          "tm_bus_subscribers_active", "Currently attached bus subscribers")) {
  LOG(LogLevel::INFO, LogComponent::BUS,
      "EventBus created (max_queue=" << config_.max_queue
                                     << ", max_subscribers="
                                     << config_.max_subscribers << ")");
}

EventBus::~EventBus() { close_all(); }

std::shared_ptr<Subscription> EventBus::subscribe() {
  std::shared_ptr<Subscription> subscription;
  {
    std::unique_lock<std::shared_mutex> lock(subscribers_mutex_);
    if (subscribers_.size() >= config_.max_subscribers)
      throw TransientTransportError("subscriber limit of " +
                                    std::to_string(config_.max_subscribers) +
                                    " reached");

    uint64_t id = next_subscriber_id_.fetch_add(1);
    subscription = std::make_shared<Subscription>(id, config_.max_queue);
    // Queued before the subscriber becomes visible to publish()
    subscription->deliver(
        std::make_shared<const BusEvent>(ConnectedEvent{id}));
    subscribers_.emplace(id, subscription);
    update_subscriber_gauge_locked();
  }
  LOG(LogLevel::DEBUG, LogComponent::BUS,
      "Subscriber " << subscription->id() << " attached.");
  return subscription;
}

bool EventBus::unsubscribe(uint64_t subscriber_id) {
  std::shared_ptr<Subscription> removed;
  {
    std::unique_lock<std::shared_mutex> lock(subscribers_mutex_);
    auto it = subscribers_.find(subscriber_id);
    if (it == subscribers_.end())
      return false;
    removed = std::move(it->second);
    subscribers_.erase(it);
    update_subscriber_gauge_locked();
  }
  removed->close();
  LOG(LogLevel::DEBUG, LogComponent::BUS,
      "Subscriber " << subscriber_id << " detached (dropped "
                    << removed->dropped_count() << " events).");
  return true;
}

void EventBus::deliver_to(Subscription &subscription, BusEventPtr event) {
  if (subscription.deliver(std::move(event))) {
    dropped_counter_.Increment();
    LOG(LogLevel::TRACE, LogComponent::BUS,
        "Subscriber " << subscription.id()
                      << " queue full, oldest event dropped.");
  }
}

void EventBus::publish(BusEvent event) {
  auto shared_event = std::make_shared<const BusEvent>(std::move(event));
  published_.fetch_add(1);
  published_counter_.Increment();

  std::shared_lock<std::shared_mutex> lock(subscribers_mutex_);
  for (auto &[id, subscription] : subscribers_)
    deliver_to(*subscription, shared_event);
}

bool EventBus::ping(uint64_t subscriber_id) {
  auto subscription = find(subscriber_id);
  if (!subscription)
    return false;
  deliver_to(*subscription, std::make_shared<const BusEvent>(
                                PongEvent{Utils::get_current_time_ms()}));
  return true;
}

void EventBus::report_send_failure(uint64_t subscriber_id,
                                   const std::string &reason) {
  LOG(LogLevel::WARN, LogComponent::BUS,
      "Send to subscriber " << subscriber_id << " failed: " << reason
                            << ". Dropping subscriber.");
  unsubscribe(subscriber_id);
}

std::shared_ptr<Subscription> EventBus::find(uint64_t subscriber_id) const {
  std::shared_lock<std::shared_mutex> lock(subscribers_mutex_);
  auto it = subscribers_.find(subscriber_id);
  return it == subscribers_.end() ? nullptr : it->second;
}

size_t EventBus::subscriber_count() const {
  std::shared_lock<std::shared_mutex> lock(subscribers_mutex_);
  return subscribers_.size();
}

void EventBus::close_all() {
  std::vector<std::shared_ptr<Subscription>> closing;
  {
    std::unique_lock<std::shared_mutex> lock(subscribers_mutex_);
    for (auto &[id, subscription] : subscribers_)
      closing.push_back(std::move(subscription));
    subscribers_.clear();
    update_subscriber_gauge_locked();
  }
  for (auto &subscription : closing)
    subscription->close();
}

void EventBus::update_subscriber_gauge_locked() {
  subscribers_gauge_.Set(static_cast<double>(subscribers_.size()));
}
