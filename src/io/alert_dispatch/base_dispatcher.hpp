#ifndef BASE_DISPATCHER_HPP
#define BASE_DISPATCHER_HPP

#include "core/tunnel_detection.hpp"

#include <string>

class IAlertDispatcher {
public:
  virtual ~IAlertDispatcher() = default;
  virtual bool dispatch(const TunnelDetection &detection) = 0;
  virtual const char *get_name() const = 0;
  virtual std::string get_dispatcher_type() const = 0;
};

#endif // BASE_DISPATCHER_HPP
