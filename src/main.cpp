#include "analysis/stats_aggregator.hpp"
#include "core/alert_manager.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/event_bus.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "core/monitor_pipeline.hpp"
#include "core/recent_store.hpp"
#include "detection/block_enforcer.hpp"
#include "detection/tunnel_classifier.hpp"
#include "io/log_readers/base_log_reader.hpp"
#include "io/log_readers/file_log_reader.hpp"
#include "io/stream/connection_manager.hpp"
#include "io/stream/http_stream_transport.hpp"
#include "io/web/network_api.hpp"
#include "io/web/web_server.hpp"
#include "timeline/capture_store.hpp"
#include "utils/json_formatter.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
#include <unistd.h>
#endif

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
  else if (signum == SIGHUP)
    g_reload_config_requested = true;
}

// --- Reader thread function ---
// Tails the NDJSON observation file and feeds the pipeline
void log_reader_thread(ILogReader &reader, MonitorPipeline &pipeline,
                       uint64_t poll_interval_ms,
                       const std::atomic<bool> &shutdown_flag) {
  LOG(LogLevel::INFO, LogComponent::IO_READER, "Log reader thread started.");
  while (!shutdown_flag) {
    std::vector<RawObservation> batch = reader.get_next_batch();
    if (batch.empty()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(poll_interval_ms));
      continue;
    }

    for (auto &raw : batch) {
      try {
        // Processing is asynchronous; the result lands in the recent store
        pipeline.submit(std::move(raw));
      } catch (const ValidationError &e) {
        LOG(LogLevel::WARN, LogComponent::IO_READER,
            "Rejected observation: " << e.what());
      } catch (const TransientTransportError &e) {
        LOG(LogLevel::WARN, LogComponent::IO_READER,
            "Pipeline unavailable, stopping reader: " << e.what());
        return;
      }
    }
  }

  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Log reader thread shutting down.");
}

void print_usage(const char *program) {
  std::cout << "Usage: " << program << " [config.ini]\n"
            << "       " << program << " --watch [config.ini]\n\n"
            << "Without --watch the monitor is started. With --watch the "
               "program connects to the [Stream] server_url and prints every "
               "event it receives.\n";
}

// --- Stream client mode ---
int run_watch(const Config::AppConfig &config) {
  const auto &stream_config = config.stream_client;
  LOG(LogLevel::INFO, LogComponent::IO_STREAM,
      "Watching " << stream_config.server_url << stream_config.stream_path);

  ConnectionManager connection(
      stream_config, std::make_unique<HttpStreamTransport>(
                         stream_config.server_url, stream_config.stream_path));

  connection.set_state_listener([](ConnectionState state) {
    LOG(LogLevel::INFO, LogComponent::IO_STREAM,
        "Connection state: " << connection_state_to_string(state));
  });
  connection.subscribe([](const StreamMessage &message) {
    std::cout << message.type << " " << JsonFormatter::dump(message.data) << std::endl;
  });

  connection.start();
  while (!g_shutdown_requested && !connection.gave_up())
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  connection.stop();

  if (connection.gave_up()) {
    LOG(LogLevel::ERROR, LogComponent::IO_STREAM,
        "Gave up after " << connection.reconnect_attempts()
                         << " reconnect attempts.");
    return 1;
  }
  return 0;
}

// --- Monitor mode ---
int run_monitor(Config::ConfigManager &config_manager,
                const std::string &config_file) {
  auto current_config = config_manager.get_config();
  const auto &config = *current_config;

  EventBus bus(config.event_bus);
  BlockEnforcer enforcer(config.blocking);
  TunnelClassifier classifier(config.classifier);
  RecentStore store(config.recent_window.max_entries);
  CaptureStore captures(config.timeline.max_captures);

  MonitorPipeline pipeline(config, enforcer, classifier, store, bus);
  StatsAggregator stats(config.stats, bus);

  AlertManager alert_manager(config.alerting, bus);
  alert_manager.configure_dispatchers();

  NetworkServices services{pipeline, enforcer, store,         bus,
                           stats,    captures, &alert_manager};
  NetworkApi api(services, config.recent_window);

  // Consumers subscribe before the producers start
  stats.start();
  alert_manager.start();
  pipeline.start();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Pipeline started with " << pipeline.partition_count() << " workers.");

  std::unique_ptr<WebServer> web_server;
  if (config.monitoring.web_server_enabled) {
    web_server = std::make_unique<WebServer>(config.monitoring, api, bus,
                                             MetricsRegistry::instance());
    web_server->start();
    LOG(LogLevel::INFO, LogComponent::CORE,
        "Web server started on " << config.monitoring.web_server_host << ":"
                                 << config.monitoring.web_server_port);
  }

  std::unique_ptr<ILogReader> log_reader;
  std::thread reader_thread;
  if (config.ingest_source_enabled) {
    try {
      log_reader = std::make_unique<FileLogReader>(config.ingest_source_path);
      reader_thread =
          std::thread(log_reader_thread, std::ref(*log_reader),
                      std::ref(pipeline), config.reader_poll_interval_ms,
                      std::cref(g_shutdown_requested));
    } catch (const std::runtime_error &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_READER,
          "Observation file unavailable, continuing with HTTP ingest only: "
              << e.what());
    }
  }

  while (!g_shutdown_requested) {
    if (g_reload_config_requested.exchange(false)) {
      // Only the log levels are applied live; everything else needs a restart
      LOG(LogLevel::INFO, LogComponent::CORE,
          "SIGHUP detected. Reloading configuration from " << config_file
                                                           << "...");
      if (config_manager.load_configuration(config_file)) {
        LogManager::instance().configure(config_manager.get_config()->logging);
        LOG(LogLevel::INFO, LogComponent::CONFIG,
            "Logger has been reconfigured.");
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown requested.");

  if (reader_thread.joinable())
    reader_thread.join();
  if (web_server)
    web_server->stop();
  pipeline.stop();
  alert_manager.stop();
  stats.stop();
  bus.close_all();

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Shutdown complete. Recent window holds " << store.size()
                                                << " entries.");
  return 0;
}

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  bool watch_mode = false;
  std::string config_file_to_load = "config.ini";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--watch") {
      watch_mode = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else {
      config_file_to_load = arg;
    }
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (!config_manager.load_configuration(config_file_to_load)) {
    // The built-in defaults stay active; give them the default log levels
    Config::LoggingConfig defaults;
    Config::apply_default_log_levels(defaults);
    LogManager::instance().configure(defaults);
  } else {
    LogManager::instance().configure(config_manager.get_config()->logging);
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Tunnel Monitor starting up"
          << (watch_mode ? " in watch mode..." : "..."));
#if defined(__unix__) || (defined(__APPLE__) && defined(__MACH__))
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());
#endif

  try {
    if (watch_mode)
      return run_watch(*config_manager.get_config());
    return run_monitor(config_manager, config_file_to_load);
  } catch (const MonitorError &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Startup failed [" << error_code_to_string(e.code())
                           << "]: " << e.what());
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Startup failed: " << e.what());
  }
  return 1;
}
