#ifndef BUS_EVENT_HPP
#define BUS_EVENT_HPP

#include "core/log_entry.hpp"
#include "core/stats_snapshot.hpp"
#include "core/tunnel_detection.hpp"
#include "detection/block_rule.hpp"

#include <cstdint>
#include <memory>
#include <variant>

// One processed exchange; `detection` is null when nothing fired
struct LogEvent {
  LogEntryPtr entry;
  BlockDecision decision;
  TunnelDetectionPtr detection;
};

struct TunnelAlertEvent {
  TunnelDetectionPtr detection;
};

struct StatsUpdateEvent {
  StatsSnapshot snapshot;
};

struct BlockAddedEvent {
  BlockRule rule;
};

// First event of every subscription
struct ConnectedEvent {
  uint64_t subscriber_id = 0;
};

// Reply to a ping, only ever queued for the subscriber that pinged
struct PongEvent {
  uint64_t timestamp_ms = 0;
};

using BusEvent = std::variant<LogEvent, TunnelAlertEvent, StatsUpdateEvent,
                              BlockAddedEvent, ConnectedEvent, PongEvent>;

// Events are immutable once published and shared between subscriber queues
using BusEventPtr = std::shared_ptr<const BusEvent>;

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Wire name of the event kind
inline const char *event_type_name(const BusEvent &event) {
  return std::visit(
      overloaded{[](const LogEvent &) { return "log"; },
                 [](const TunnelAlertEvent &) { return "tunnel_alert"; },
                 [](const StatsUpdateEvent &) { return "stats_update"; },
                 [](const BlockAddedEvent &) { return "block_added"; },
                 [](const ConnectedEvent &) { return "connected"; },
                 [](const PongEvent &) { return "pong"; }},
      event);
}

#endif // BUS_EVENT_HPP
