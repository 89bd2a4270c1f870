#ifndef HTTP_DISPATCHER_HPP
#define HTTP_DISPATCHER_HPP

#include "io/alert_dispatch/base_dispatcher.hpp"

#include <string>

// POSTs each detection as JSON to a webhook
class HttpDispatcher : public IAlertDispatcher {
public:
  explicit HttpDispatcher(const std::string &webhook_url);
  bool dispatch(const TunnelDetection &detection) override;
  const char *get_name() const override { return "HttpDispatcher"; }
  std::string get_dispatcher_type() const override { return "http"; }

  bool is_valid() const { return !host_.empty(); }

private:
  std::string host_;
  std::string path_;
  bool is_https_ = false;
};

#endif // HTTP_DISPATCHER_HPP
