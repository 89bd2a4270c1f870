#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/event_bus.hpp"
#include "core/metrics_registry.hpp"
#include "httplib.h"
#include "io/web/network_api.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

// HTTP front of the monitor: /api/v1/network/*, the live NDJSON stream,
// /metrics and /health.
class WebServer {
public:
  WebServer(const Config::MonitoringConfig &config, NetworkApi &api,
            EventBus &bus, MetricsRegistry &metrics_registry);
  ~WebServer();

  void start();
  void stop();

  // Port actually bound; differs from the configured one when it was 0
  int bound_port() const { return bound_port_.load(); }
  size_t active_streams() const { return active_streams_.load(); }

private:
  void register_routes();
  void register_stream_route();
  void run();

  // Runs `handler`, mapping MonitorError and JSON errors onto the error body
  void respond(httplib::Response &res,
               const std::function<ApiResponse()> &handler);

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::atomic<bool> shutdown_flag_{false};
  std::atomic<int> bound_port_{0};
  std::atomic<size_t> active_streams_{0};
  std::string host_;
  int port_;
  size_t max_stream_clients_;
  NetworkApi &api_;
  EventBus &bus_;
  MetricsRegistry &metrics_registry_;
};

#endif // WEB_SERVER_HPP
