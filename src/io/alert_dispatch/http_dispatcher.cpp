#include "http_dispatcher.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "utils/json_formatter.hpp"

#include <regex>

HttpDispatcher::HttpDispatcher(const std::string &webhook_url) {
  // Group 1: scheme, group 2: host[:port], group 3: path
  std::regex url_regex(R"(^(https?):\/\/([^\/]+)(\/.*)?$)");
  std::smatch match;

  if (std::regex_match(webhook_url, match, url_regex)) {
    is_https_ = (match[1].str() == "https");
    host_ = match[2].str();
    path_ = match[3].matched ? match[3].str() : "/";
    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "HttpDispatcher initialized with URL: "
            << webhook_url << " | Host: " << host_ << " | Path: " << path_);
  } else {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Invalid webhook URL format provided to HttpDispatcher: "
            << webhook_url);
  }
}

bool HttpDispatcher::dispatch(const TunnelDetection &detection) {
  if (!is_valid()) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Cannot dispatch alert: invalid webhook URL.");
    return false;
  }

  bool success = false;
  std::string json_body =
      JsonFormatter::dump(JsonFormatter::detection_to_json(detection));
  auto send_request = [&](auto &client) {
    client.set_connection_timeout(5);
    client.set_read_timeout(5);
    auto res = client.Post(path_.c_str(), json_body, "application/json");

    if (res && res->status < 400) {
      LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
          "Dispatched " << detection.detection_id << " to " << host_ << path_
                        << " | Status: " << res->status);
      success = true;
    } else {
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          "Failed to dispatch " << detection.detection_id << " to " << host_
                                << path_ << " | Status: "
                                << (res ? std::to_string(res->status)
                                        : httplib::to_string(res.error())));
    }
  };

  if (is_https_) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    httplib::SSLClient cli(host_);
    cli.enable_server_certificate_verification(false);
    send_request(cli);
#else
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "HTTPS webhook configured but built without OpenSSL support.");
#endif
  } else {
    httplib::Client cli(host_);
    send_request(cli);
  }
  return success;
}
