#include "web_server.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"

#include <chrono>
#include <prometheus/text_serializer.h>
#include <string>

namespace {

constexpr const char *API_BASE = "/api/v1/network";
constexpr const char *JSON_TYPE = "application/json";

std::string route(const char *suffix) { return std::string(API_BASE) + suffix; }

} // namespace

WebServer::WebServer(const Config::MonitoringConfig &config, NetworkApi &api,
                     EventBus &bus, MetricsRegistry &metrics_registry)
    : host_(config.web_server_host), port_(config.web_server_port),
      max_stream_clients_(config.max_stream_clients), api_(api), bus_(bus),
      metrics_registry_(metrics_registry) {
  server_ = std::make_unique<httplib::Server>();
  const size_t threads = config.web_server_threads;
  server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  register_routes();
  register_stream_route();
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server initialized for " << host_ << ":" << port_);
}

WebServer::~WebServer() { stop(); }

void WebServer::respond(httplib::Response &res,
                        const std::function<ApiResponse()> &handler) {
  ApiResponse response;
  try {
    response = handler();
  } catch (const MonitorError &e) {
    if (e.code() == ErrorCode::INTERNAL)
      LOG(LogLevel::ERROR, LogComponent::IO_WEB,
          "Internal error while handling request: " << e.what());
    response = NetworkApi::to_error_response(e.code(), e.what());
  } catch (const nlohmann::json::exception &e) {
    response = NetworkApi::to_error_response(ErrorCode::INVALID_INPUT,
                                             e.what());
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Unhandled exception while handling request: " << e.what());
    response = NetworkApi::to_error_response(ErrorCode::INTERNAL, e.what());
  }
  res.status = response.status;
  if (response.text) {
    if (!response.attachment_name.empty())
      res.set_header("Content-Disposition", "attachment; filename=\"" +
                                                response.attachment_name +
                                                "\"");
    res.set_content(*response.text, response.content_type);
    return;
  }
  res.set_content(JsonFormatter::dump(response.body, 2), JSON_TYPE);
}

void WebServer::register_routes() {
  server_->Get("/metrics", [this](const httplib::Request &req,
                                  httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "Received request for /metrics from " << req.remote_addr);
    prometheus::TextSerializer serializer;
    auto collected_metrics = metrics_registry_.get_registry()->Collect();
    res.set_content(serializer.Serialize(collected_metrics),
                    "text/plain; version=0.0.4");
  });

  server_->Get("/health", [this](const httplib::Request &,
                                 httplib::Response &res) {
    respond(res, [this] { return api_.health(); });
  });

  server_->Post(route("/ingest"), [this](const httplib::Request &req,
                                         httplib::Response &res) {
    respond(res, [&] { return api_.ingest(req.body, req.remote_addr); });
  });

  server_->Get(route("/logs"), [this](const httplib::Request &req,
                                      httplib::Response &res) {
    respond(res, [&] { return api_.list_logs(req.params); });
  });
  // Registered before /logs/{id} so "search" is not taken as an id
  server_->Get(route("/logs/search"), [this](const httplib::Request &req,
                                             httplib::Response &res) {
    respond(res, [&] { return api_.search_logs(req.params); });
  });
  server_->Get(route(R"(/logs/([^/]+))"), [this](const httplib::Request &req,
                                                 httplib::Response &res) {
    respond(res, [&] { return api_.get_log(req.matches[1].str()); });
  });

  server_->Post(route("/export"), [this](const httplib::Request &req,
                                         httplib::Response &res) {
    respond(res, [&] { return api_.export_logs(req.body); });
  });

  server_->Get(route("/tunnels"), [this](const httplib::Request &req,
                                         httplib::Response &res) {
    respond(res, [&] { return api_.list_tunnels(req.params); });
  });
  server_->Get(route("/alerts"), [this](const httplib::Request &req,
                                        httplib::Response &res) {
    respond(res, [&] { return api_.list_alerts(req.params); });
  });
  server_->Get(route("/stats"), [this](const httplib::Request &,
                                       httplib::Response &res) {
    respond(res, [&] { return api_.get_stats(); });
  });

  // Block rules
  server_->Get(route("/blocks"), [this](const httplib::Request &,
                                        httplib::Response &res) {
    respond(res, [&] { return api_.list_blocks(); });
  });
  server_->Get(route(R"(/blocks/([a-z]+))"), [this](const httplib::Request &req,
                                                    httplib::Response &res) {
    respond(res, [&] { return api_.list_blocks(req.matches[1].str()); });
  });
  server_->Post(route(R"(/blocks/([a-z]+))"), [this](const httplib::Request &req,
                                                     httplib::Response &res) {
    respond(res, [&] {
      return api_.add_block(req.matches[1].str(), req.body,
                            req.get_header_value("Authorization"));
    });
  });
  server_->Delete(route("/blocks/ip"), [this](const httplib::Request &req,
                                              httplib::Response &res) {
    respond(res, [&] { return api_.remove_ip_block(req.params); });
  });
  server_->Delete(route(R"(/blocks/ip/([^/]+))"),
                  [this](const httplib::Request &req, httplib::Response &res) {
                    respond(res, [&] {
                      return api_.remove_ip_block(req.matches[1].str());
                    });
                  });
  server_->Delete(route("/blocks/endpoint"), [this](const httplib::Request &req,
                                                    httplib::Response &res) {
    respond(res, [&] { return api_.remove_endpoint_block(req.params); });
  });
  server_->Delete(route("/blocks/pattern"), [this](const httplib::Request &req,
                                                   httplib::Response &res) {
    respond(res, [&] { return api_.remove_pattern_block(req.params); });
  });
  server_->Delete(route(R"(/blocks/id/([^/]+))"),
                  [this](const httplib::Request &req, httplib::Response &res) {
                    respond(res, [&] {
                      return api_.remove_block_by_id(req.matches[1].str());
                    });
                  });

  // Captures
  server_->Post(route("/captures"), [this](const httplib::Request &req,
                                           httplib::Response &res) {
    respond(res, [&] { return api_.submit_capture(req.body); });
  });
  server_->Get(route(R"(/captures/([^/]+)/waterfall)"),
               [this](const httplib::Request &req, httplib::Response &res) {
                 respond(res, [&] {
                   return api_.get_waterfall(req.matches[1].str(), req.params);
                 });
               });

  server_->Post(route(R"(/stream/([^/]+)/messages)"),
                [this](const httplib::Request &req, httplib::Response &res) {
                  respond(res, [&] {
                    return api_.stream_message(req.matches[1].str(), req.body);
                  });
                });
}

void WebServer::register_stream_route() {
  server_->Get(route("/stream"), [this](const httplib::Request &req,
                                        httplib::Response &res) {
    std::shared_ptr<Subscription> subscription;
    try {
      // The slot is held until the content provider is released
      if (active_streams_.fetch_add(1) >= max_stream_clients_)
        throw TransientTransportError("stream client limit of " +
                                      std::to_string(max_stream_clients_) +
                                      " reached");
      subscription = bus_.subscribe();
    } catch (const TransientTransportError &e) {
      active_streams_--;
      auto error = NetworkApi::to_error_response(e.code(), e.what());
      res.status = error.status;
      res.set_content(JsonFormatter::dump(error.body, 2), JSON_TYPE);
      return;
    }

    LOG(LogLevel::INFO, LogComponent::IO_STREAM,
        "Stream subscriber " << subscription->id() << " attached from "
                             << req.remote_addr);
    res.set_header("X-Subscriber-Id", std::to_string(subscription->id()));

    res.set_chunked_content_provider(
        "application/x-ndjson",
        [this, subscription](size_t, httplib::DataSink &sink) {
          if (shutdown_flag_ || subscription->is_closed()) {
            sink.done();
            return true;
          }
          auto event = subscription->receive(bus_.default_receive_timeout());
          if (!event)
            return sink.is_writable();

          std::string line;
          try {
            line = JsonFormatter::dump(JsonFormatter::event_to_envelope(**event)) +
                   "\n";
          } catch (const std::exception &e) {
            LOG(LogLevel::ERROR, LogComponent::IO_STREAM,
                "Skipping unserialisable event for subscriber "
                    << subscription->id() << ": " << e.what());
            return sink.is_writable();
          }
          if (!sink.is_writable() || !sink.write(line.data(), line.size())) {
            bus_.report_send_failure(subscription->id(),
                                     "client stopped reading");
            return false;
          }
          return true;
        },
        [this, subscription](bool success) {
          LOG(LogLevel::INFO, LogComponent::IO_STREAM,
              "Stream subscriber " << subscription->id() << " finished ("
                                   << (success ? "clean" : "aborted") << ")");
          bus_.unsubscribe(subscription->id());
          active_streams_--;
        });
  });
}

void WebServer::start() {
  if (server_thread_.joinable())
    return;
  shutdown_flag_ = false;
  server_thread_ = std::thread(&WebServer::run, this);
}

void WebServer::stop() {
  shutdown_flag_ = true;
  if (server_)
    server_->stop();
  if (server_thread_.joinable())
    server_thread_.join();
  LOG(LogLevel::INFO, LogComponent::IO_WEB, "Web server stopped.");
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server starting on a background thread...");
  if (port_ == 0) {
    int port = server_->bind_to_any_port(host_.c_str());
    if (port < 0) {
      LOG(LogLevel::FATAL, LogComponent::IO_WEB,
          "Web server failed to bind on " << host_);
      return;
    }
    bound_port_ = port;
    server_->listen_after_bind();
    return;
  }

  bound_port_ = port_;
  if (!server_->listen(host_.c_str(), port_))
    LOG(LogLevel::FATAL, LogComponent::IO_WEB,
        "Web server failed to listen on " << host_ << ":" << port_);
}
